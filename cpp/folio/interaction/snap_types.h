#pragma once

#include "folio/interaction/interaction_constants.h"
#include <optional>

namespace folio::interaction {

struct SnapOptions {
    bool enabled{true};
    double thresholdPx{interaction_constants::DEFAULT_SNAP_THRESHOLD_PX};
};

// Snap distance per axis in normalized units (pixel threshold / unit size).
struct SnapThresholds {
    double x{0.0};
    double y{0.0};
};

struct SnapMatch {
    bool snapped{false};
    double offset{0.0};  // target - moving
    double target{0.0};  // absolute coordinate of the guide
};

struct SnapGuides {
    std::optional<double> x;
    std::optional<double> y;
};

struct DragSnap {
    double dx{0.0};
    double dy{0.0};
    SnapGuides guides;
};

struct ResizeSnap {
    double scale{1.0};
    SnapGuides guides;
};

// Which point of a dragged edge is matched against targets.
enum class EdgeAnchor {
    Edge,
    Center,
};

} // namespace folio::interaction
