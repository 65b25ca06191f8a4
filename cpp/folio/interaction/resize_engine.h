#pragma once

#include "folio/interaction/gesture_session.h"
#include "folio/interaction/snap_types.h"
#include "folio/model/block.h"
#include <vector>

namespace folio::interaction {

struct ResizeResult {
    bool applied{false};  // false when no selected block exists any more
    PageSideLayout layout;
    double scale{1.0};
    SnapGuides guides;
};

struct ScaleLimits {
    double minScale{1.0};
    double maxScale{1.0};
};

// maxScale keeps the bounds inside the page when scaled about the anchor;
// minScale keeps the smallest origin at the interactive minimum size.
ScaleLimits computeScaleLimitsAbout(
    const NormRect& bounds, const std::vector<BlockOrigin>& origins, double anchorX, double anchorY) noexcept;

// Limits for scaling about the top-left of bounds.
ScaleLimits computeScaleLimits(const NormRect& bounds, const std::vector<BlockOrigin>& origins) noexcept;

// Places every origin at anchor + (origin - anchor) * scale with its size
// scaled, then clamps it on-page and above the interactive minimum.
void scaleOriginsAbout(
    PageSideLayout& layout, const std::vector<BlockOrigin>& origins, double scale, double anchorX, double anchorY);

// X- or Y-implied scale for a pointer delta, whichever departs further from 1.
double dominantAxisScale(const NormRect& bounds, double dx, double dy) noexcept;

// Uniform scale of origins about the top-left of their bounds.
ResizeResult applyUniformScale(
    const PageSideLayout& layout,
    const std::vector<BlockOrigin>& origins,
    double desiredScale,
    const SnapThresholds& thresholds);

// Resize candidate for the current pointer position.
ResizeResult computeResize(
    const PageSideLayout& layout, const ResizeSession& session, const PointerPos& pointer, const GestureFrame& frame);

} // namespace folio::interaction
