#include "folio/model/padding.h"

#include "folio/core/math_utils.h"

namespace folio {

namespace {
constexpr double kPadXMinPx = 24.0;
constexpr double kPadXMaxPx = 140.0;
constexpr double kPadYMinPx = 24.0;
constexpr double kPadYMaxPx = 180.0;
} // namespace

SafeArea computeSafeArea(double canvasWidth, double canvasHeight, const std::optional<PaddingConfig>& paddingOverride) {
    const double ratioX = paddingOverride ? paddingOverride->padXRatio : DEFAULT_PAD_X_RATIO;
    const double ratioY = paddingOverride ? paddingOverride->padYRatio : DEFAULT_PAD_Y_RATIO;

    const double padX = clampValue(canvasWidth * ratioX, kPadXMinPx, kPadXMaxPx);
    const double padY = clampValue(canvasHeight * ratioY, kPadYMinPx, kPadYMaxPx);

    return SafeArea{
        padX,
        padY,
        canvasWidth - 2.0 * padX,
        canvasHeight - 2.0 * padY,
    };
}

PixelRect toPixelRect(const NormRect& rect, const SafeArea& safeArea) noexcept {
    return PixelRect{
        safeArea.x + rect.x * safeArea.w,
        safeArea.y + rect.y * safeArea.h,
        rect.w * safeArea.w,
        rect.h * safeArea.h,
    };
}

} // namespace folio
