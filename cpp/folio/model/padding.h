#pragma once

#include "folio/core/types.h"
#include "folio/model/block.h"
#include <optional>

namespace folio {

constexpr double DEFAULT_PAD_X_RATIO = 0.08;
constexpr double DEFAULT_PAD_Y_RATIO = 0.10;

// Padded content region of a canvas, in pixels. Block coordinates are
// normalized against this area.
struct SafeArea {
    double x{0.0};
    double y{0.0};
    double w{0.0};
    double h{0.0};
};

SafeArea computeSafeArea(double canvasWidth, double canvasHeight, const std::optional<PaddingConfig>& paddingOverride);

// Block rectangle mapped into canvas pixels.
PixelRect toPixelRect(const NormRect& rect, const SafeArea& safeArea) noexcept;

} // namespace folio
