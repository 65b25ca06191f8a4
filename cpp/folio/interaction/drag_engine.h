#pragma once

#include "folio/interaction/gesture_session.h"
#include "folio/interaction/snap_types.h"
#include "folio/model/block.h"
#include <vector>

namespace folio::interaction {

struct DragResult {
    bool applied{false};  // false when no selected block exists any more
    PageSideLayout layout;
    double dx{0.0};
    double dy{0.0};
    SnapGuides guides;
};

// Delta range that keeps every origin inside [0, 1]. Always contains 0.
struct DeltaBounds {
    double minDx{0.0};
    double maxDx{0.0};
    double minDy{0.0};
    double maxDy{0.0};
};

DeltaBounds computeGroupDeltaBounds(const std::vector<BlockOrigin>& origins) noexcept;

// Rigid group move of origins by one clamped, snapped delta. Blocks of layout
// not named by origins are snap targets and stay untouched.
DragResult applyDragDelta(
    const PageSideLayout& layout,
    const std::vector<BlockOrigin>& origins,
    double rawDx,
    double rawDy,
    const SnapThresholds& thresholds);

// Drag candidate for the current pointer position.
DragResult computeDrag(
    const PageSideLayout& layout, const DragSession& session, const PointerPos& pointer, const GestureFrame& frame);

} // namespace folio::interaction
