#pragma once

#include "folio/core/types.h"
#include "folio/interaction/snap_types.h"
#include <array>
#include <vector>

namespace folio::interaction {

// Left, center, right of rect shifted by dx.
std::array<double, 3> horizontalAnchors(const NormRect& rect, double dx = 0.0) noexcept;
// Top, center, bottom of rect shifted by dy.
std::array<double, 3> verticalAnchors(const NormRect& rect, double dy = 0.0) noexcept;

std::vector<double> collectHorizontalAnchors(const std::vector<NormRect>& rects, double dx = 0.0);
std::vector<double> collectVerticalAnchors(const std::vector<NormRect>& rects, double dy = 0.0);

// Closest (moving, target) pair with |target - moving| <= threshold. The first
// pair found wins ties. A non-positive threshold never snaps.
SnapMatch findClosestSnap(const std::vector<double>& moving, const std::vector<double>& targets, double threshold);

// Proposed group delta adjusted so the closest moving anchor lands on a
// target anchor, independently per axis.
DragSnap snapDragDelta(
    double proposedDx,
    double proposedDy,
    const std::vector<NormRect>& movingRects,
    const std::vector<NormRect>& targetRects,
    const SnapThresholds& thresholds);

// Uniform scale of bounds (anchored at its top-left) snapped so its right,
// bottom or center lines up with a target anchor. desiredScale is clamped to
// [minScale, maxScale] before any candidate is considered.
ResizeSnap snapUniformResizeScale(
    double desiredScale,
    double minScale,
    double maxScale,
    const NormRect& bounds,
    const std::vector<NormRect>& targetRects,
    const SnapThresholds& thresholds);

} // namespace folio::interaction
