#include "folio/interaction/resize_engine.h"

#include "folio/core/constants.h"
#include "folio/core/math_utils.h"
#include "folio/interaction/snap_solver.h"
#include "folio/model/aspect_ratio.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace folio::interaction {

using constants::MIN_INTERACTIVE_BLOCK_SIZE;

ScaleLimits computeScaleLimitsAbout(
    const NormRect& bounds, const std::vector<BlockOrigin>& origins, double anchorX, double anchorY) noexcept {
    ScaleLimits limits;
    if (!(bounds.w > 0.0) || !(bounds.h > 0.0)) return limits;

    double maxScale = std::numeric_limits<double>::infinity();
    const double before[2] = {bounds.x - anchorX, bounds.y - anchorY};
    const double after[2] = {bounds.right() - anchorX, bounds.bottom() - anchorY};
    const double anchor[2] = {anchorX, anchorY};
    for (int axis = 0; axis < 2; ++axis) {
        if (before[axis] < 0.0) maxScale = std::min(maxScale, anchor[axis] / -before[axis]);
        if (after[axis] > 0.0) maxScale = std::min(maxScale, (1.0 - anchor[axis]) / after[axis]);
    }
    limits.maxScale = std::isfinite(maxScale) ? maxScale : 1.0;

    double minScale = 0.0;
    for (const BlockOrigin& origin : origins) {
        if (origin.rect.w > 0.0) minScale = std::max(minScale, MIN_INTERACTIVE_BLOCK_SIZE / origin.rect.w);
        if (origin.rect.h > 0.0) minScale = std::max(minScale, MIN_INTERACTIVE_BLOCK_SIZE / origin.rect.h);
    }
    limits.minScale = minScale;
    return limits;
}

ScaleLimits computeScaleLimits(const NormRect& bounds, const std::vector<BlockOrigin>& origins) noexcept {
    return computeScaleLimitsAbout(bounds, origins, bounds.x, bounds.y);
}

void scaleOriginsAbout(
    PageSideLayout& layout, const std::vector<BlockOrigin>& origins, double scale, double anchorX, double anchorY) {
    for (const BlockOrigin& origin : origins) {
        Block* block = findBlock(layout, origin.id);
        if (!block) continue;
        const double w = clampValue(origin.rect.w * scale, MIN_INTERACTIVE_BLOCK_SIZE, 1.0);
        const double h = clampValue(origin.rect.h * scale, MIN_INTERACTIVE_BLOCK_SIZE, 1.0);
        const double x = anchorX + (origin.rect.x - anchorX) * scale;
        const double y = anchorY + (origin.rect.y - anchorY) * scale;
        block->w = w;
        block->h = h;
        block->x = clampValue(x, 0.0, 1.0 - w);
        block->y = clampValue(y, 0.0, 1.0 - h);
        block->aspectRatio = normalizeAspectRatio(w / h);
    }
}

double dominantAxisScale(const NormRect& bounds, double dx, double dy) noexcept {
    const double scaleX = bounds.w > 0.0 ? (bounds.w + dx) / bounds.w : 1.0;
    const double scaleY = bounds.h > 0.0 ? (bounds.h + dy) / bounds.h : 1.0;
    return std::abs(scaleX - 1.0) >= std::abs(scaleY - 1.0) ? scaleX : scaleY;
}

ResizeResult applyUniformScale(
    const PageSideLayout& layout,
    const std::vector<BlockOrigin>& origins,
    double desiredScale,
    const SnapThresholds& thresholds) {
    ResizeResult result;
    result.layout = layout;

    const std::vector<BlockOrigin> scaling = presentOrigins(layout, origins);
    if (scaling.empty()) return result;

    const NormRect bounds = unionBounds(scaling);
    const ScaleLimits limits = computeScaleLimits(bounds, scaling);
    const ResizeSnap snap = snapUniformResizeScale(
        finiteOr(desiredScale, 1.0),
        limits.minScale,
        limits.maxScale,
        bounds,
        collectTargetRects(layout, scaling),
        thresholds);

    result.scale = snap.scale;
    result.guides = snap.guides;

    scaleOriginsAbout(result.layout, scaling, snap.scale, bounds.x, bounds.y);
    result.applied = true;
    return result;
}

ResizeResult computeResize(
    const PageSideLayout& layout, const ResizeSession& session, const PointerPos& pointer, const GestureFrame& frame) {
    const std::vector<BlockOrigin> scaling = presentOrigins(layout, session.origins);
    // Bounds shrink to the survivors when a selected block vanished.
    const NormRect bounds = scaling.size() == session.origins.size() ? session.bounds : unionBounds(scaling);
    const double desired = dominantAxisScale(
        bounds,
        normalizedDeltaX(frame, session.start, pointer),
        normalizedDeltaY(frame, session.start, pointer));
    return applyUniformScale(layout, session.origins, desired, frame.thresholds);
}

} // namespace folio::interaction
