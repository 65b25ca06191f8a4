#include "folio/interaction/drag_engine.h"

#include "folio/core/math_utils.h"
#include "folio/interaction/snap_solver.h"
#include <algorithm>

namespace folio::interaction {

DeltaBounds computeGroupDeltaBounds(const std::vector<BlockOrigin>& origins) noexcept {
    DeltaBounds bounds;
    if (origins.empty()) return bounds;

    bounds.minDx = -origins.front().rect.x;
    bounds.maxDx = 1.0 - origins.front().rect.right();
    bounds.minDy = -origins.front().rect.y;
    bounds.maxDy = 1.0 - origins.front().rect.bottom();
    for (const BlockOrigin& origin : origins) {
        bounds.minDx = std::max(bounds.minDx, -origin.rect.x);
        bounds.maxDx = std::min(bounds.maxDx, 1.0 - origin.rect.right());
        bounds.minDy = std::max(bounds.minDy, -origin.rect.y);
        bounds.maxDy = std::min(bounds.maxDy, 1.0 - origin.rect.bottom());
    }

    // An origin already off-page must not force the group further out.
    bounds.minDx = std::min(bounds.minDx, 0.0);
    bounds.maxDx = std::max(bounds.maxDx, 0.0);
    bounds.minDy = std::min(bounds.minDy, 0.0);
    bounds.maxDy = std::max(bounds.maxDy, 0.0);
    return bounds;
}

DragResult applyDragDelta(
    const PageSideLayout& layout,
    const std::vector<BlockOrigin>& origins,
    double rawDx,
    double rawDy,
    const SnapThresholds& thresholds) {
    DragResult result;
    result.layout = layout;

    const std::vector<BlockOrigin> moving = presentOrigins(layout, origins);
    if (moving.empty()) return result;

    const DeltaBounds bounds = computeGroupDeltaBounds(moving);
    const double clampedDx = clampValue(finiteOr(rawDx, 0.0), bounds.minDx, bounds.maxDx);
    const double clampedDy = clampValue(finiteOr(rawDy, 0.0), bounds.minDy, bounds.maxDy);

    std::vector<NormRect> movingRects;
    movingRects.reserve(moving.size());
    for (const BlockOrigin& origin : moving) movingRects.push_back(origin.rect);

    const DragSnap snap = snapDragDelta(
        clampedDx, clampedDy, movingRects, collectTargetRects(layout, moving), thresholds);

    // Snapping must not push the group off-page. A guide whose delta had to
    // be clamped again no longer lines up, so it is dropped.
    result.dx = clampValue(snap.dx, bounds.minDx, bounds.maxDx);
    result.dy = clampValue(snap.dy, bounds.minDy, bounds.maxDy);
    if (snap.guides.x && result.dx == snap.dx) result.guides.x = snap.guides.x;
    if (snap.guides.y && result.dy == snap.dy) result.guides.y = snap.guides.y;

    for (const BlockOrigin& origin : moving) {
        Block* block = findBlock(result.layout, origin.id);
        block->x = origin.rect.x + result.dx;
        block->y = origin.rect.y + result.dy;
    }
    result.applied = true;
    return result;
}

DragResult computeDrag(
    const PageSideLayout& layout, const DragSession& session, const PointerPos& pointer, const GestureFrame& frame) {
    return applyDragDelta(
        layout,
        session.origins,
        normalizedDeltaX(frame, session.start, pointer),
        normalizedDeltaY(frame, session.start, pointer),
        frame.thresholds);
}

} // namespace folio::interaction
