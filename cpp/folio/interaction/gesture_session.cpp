#include "folio/interaction/gesture_session.h"

#include <algorithm>

namespace folio::interaction {

namespace {

double thresholdFor(const SnapOptions& options, double unitPx) noexcept {
    if (!options.enabled || !(options.thresholdPx > 0.0) || !(unitPx > 0.0)) return 0.0;
    return options.thresholdPx / unitPx;
}

} // namespace

GestureFrame makeGestureFrame(const SafeArea& safeArea, const SnapOptions& options) noexcept {
    GestureFrame frame;
    frame.unitWidthPx = safeArea.w > 0.0 ? safeArea.w : 1.0;
    frame.unitHeightPx = safeArea.h > 0.0 ? safeArea.h : 1.0;
    frame.thresholds.x = thresholdFor(options, frame.unitWidthPx);
    frame.thresholds.y = thresholdFor(options, frame.unitHeightPx);
    return frame;
}

double normalizedDeltaX(const GestureFrame& frame, const PointerPos& start, const PointerPos& pointer) noexcept {
    return (pointer.x - start.x) / frame.unitWidthPx;
}

double normalizedDeltaY(const GestureFrame& frame, const PointerPos& start, const PointerPos& pointer) noexcept {
    return (pointer.y - start.y) / frame.unitHeightPx;
}

std::vector<BlockOrigin> captureOrigins(const PageSideLayout& layout, const std::vector<std::string>& ids) {
    std::vector<BlockOrigin> origins;
    origins.reserve(ids.size());
    for (const std::string& id : ids) {
        if (containsOrigin(origins, id)) continue;
        const Block* block = findBlock(layout, id);
        if (!block) continue;
        origins.push_back(BlockOrigin{id, block->rect()});
    }
    return origins;
}

std::optional<DragSession> beginDragSession(
    const PageSideLayout& layout, const std::vector<std::string>& ids, const PointerPos& start) {
    DragSession session;
    session.origins = captureOrigins(layout, ids);
    if (session.origins.empty()) return std::nullopt;
    session.start = start;
    return session;
}

std::optional<ResizeSession> beginResizeSession(
    const PageSideLayout& layout, const std::vector<std::string>& ids, const PointerPos& start) {
    ResizeSession session;
    session.origins = captureOrigins(layout, ids);
    if (session.origins.empty()) return std::nullopt;
    session.bounds = unionBounds(session.origins);
    session.start = start;
    return session;
}

std::optional<CropEdgeSession> beginCropEdgeSession(
    const PageSideLayout& layout, const std::string& blockId, CropEdge edge, const PointerPos& start) {
    const Block* block = findBlock(layout, blockId);
    if (!block) return std::nullopt;

    CropEdgeSession session;
    session.blockId = blockId;
    session.edge = edge;
    session.start = start;
    session.startBlock = *block;
    if (const VisualCrop* crop = blockCrop(*block)) {
        session.startCrop = normalizeVisualCrop(*crop);
    }
    return session;
}

std::vector<BlockOrigin> presentOrigins(const PageSideLayout& layout, const std::vector<BlockOrigin>& origins) {
    std::vector<BlockOrigin> out;
    out.reserve(origins.size());
    for (const BlockOrigin& origin : origins) {
        if (findBlock(layout, origin.id)) out.push_back(origin);
    }
    return out;
}

NormRect unionBounds(const std::vector<BlockOrigin>& origins) noexcept {
    if (origins.empty()) return NormRect{};
    double minX = origins.front().rect.x;
    double minY = origins.front().rect.y;
    double maxX = origins.front().rect.right();
    double maxY = origins.front().rect.bottom();
    for (const BlockOrigin& origin : origins) {
        minX = std::min(minX, origin.rect.x);
        minY = std::min(minY, origin.rect.y);
        maxX = std::max(maxX, origin.rect.right());
        maxY = std::max(maxY, origin.rect.bottom());
    }
    return NormRect{minX, minY, maxX - minX, maxY - minY};
}

bool containsOrigin(const std::vector<BlockOrigin>& origins, const std::string& id) noexcept {
    return std::any_of(origins.begin(), origins.end(), [&](const BlockOrigin& o) { return o.id == id; });
}

std::vector<NormRect> collectTargetRects(const PageSideLayout& layout, const std::vector<BlockOrigin>& origins) {
    std::vector<NormRect> targets;
    targets.reserve(layout.blocks.size());
    for (const Block& block : layout.blocks) {
        if (containsOrigin(origins, block.id)) continue;
        targets.push_back(block.rect());
    }
    return targets;
}

} // namespace folio::interaction
