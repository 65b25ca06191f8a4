#include "folio/model/visual_crop.h"

#include "folio/core/constants.h"
#include "folio/core/math_utils.h"
#include <algorithm>
#include <cmath>

namespace folio {

using constants::MIN_VISUAL_CROP_REMAINING_RATIO;

const char* cropEdgeName(CropEdge edge) noexcept {
    switch (edge) {
        case CropEdge::Left: return "left";
        case CropEdge::Right: return "right";
        case CropEdge::Top: return "top";
        case CropEdge::Bottom: return "bottom";
    }
    return "left";
}

std::optional<CropEdge> parseCropEdge(const std::string& name) {
    if (name == "left") return CropEdge::Left;
    if (name == "right") return CropEdge::Right;
    if (name == "top") return CropEdge::Top;
    if (name == "bottom") return CropEdge::Bottom;
    return std::nullopt;
}

VisualCrop normalizeVisualCrop(const VisualCrop& crop) noexcept {
    auto clampFraction = [](double v) noexcept {
        return clampValue(finiteOr(v, 0.0), constants::MIN_CROP_VALUE, constants::MAX_CROP_VALUE);
    };

    VisualCrop out{
        clampFraction(crop.left),
        clampFraction(crop.right),
        clampFraction(crop.top),
        clampFraction(crop.bottom),
    };

    // Already-capped pairs may sit an ulp above the cap; leave them alone so
    // normalizing twice is a no-op.
    const double maxPairCrop = 1.0 - MIN_VISUAL_CROP_REMAINING_RATIO;
    const double slack = 1e-12;
    if (out.left + out.right > maxPairCrop + slack) {
        const double scale = maxPairCrop / (out.left + out.right);
        out.left *= scale;
        out.right *= scale;
    }
    if (out.top + out.bottom > maxPairCrop + slack) {
        const double scale = maxPairCrop / (out.top + out.bottom);
        out.top *= scale;
        out.bottom *= scale;
    }
    return out;
}

bool isZeroVisualCrop(const VisualCrop& crop) noexcept {
    return std::abs(crop.left) < constants::CROP_ZERO_EPSILON
        && std::abs(crop.right) < constants::CROP_ZERO_EPSILON
        && std::abs(crop.top) < constants::CROP_ZERO_EPSILON
        && std::abs(crop.bottom) < constants::CROP_ZERO_EPSILON;
}

std::optional<VisualCrop> toOptionalVisualCrop(const VisualCrop& crop) noexcept {
    const VisualCrop normalized = normalizeVisualCrop(crop);
    if (isZeroVisualCrop(normalized)) return std::nullopt;
    return normalized;
}

CropRemainingRatios getVisualCropRemainingRatios(const VisualCrop& crop) noexcept {
    const VisualCrop normalized = normalizeVisualCrop(crop);
    return CropRemainingRatios{
        std::max(MIN_VISUAL_CROP_REMAINING_RATIO, 1.0 - normalized.left - normalized.right),
        std::max(MIN_VISUAL_CROP_REMAINING_RATIO, 1.0 - normalized.top - normalized.bottom),
    };
}

CropRemainingRatios getVisualCropRemainingRatios(const VisualCrop* crop) noexcept {
    if (!crop) return CropRemainingRatios{};
    return getVisualCropRemainingRatios(*crop);
}

double getVisualCropAspectRatioMultiplier(const VisualCrop* crop) noexcept {
    const CropRemainingRatios remaining = getVisualCropRemainingRatios(crop);
    return remaining.widthRatio / remaining.heightRatio;
}

double deriveVisualCropBaseAspectRatio(double currentAspectRatio, const VisualCrop* currentCrop) noexcept {
    const double safeAspect = isFinitePositive(currentAspectRatio) ? currentAspectRatio : 1.0;
    const double multiplier = getVisualCropAspectRatioMultiplier(currentCrop);
    return safeAspect / std::max(multiplier, MIN_VISUAL_CROP_REMAINING_RATIO);
}

double applyVisualCropToAspectRatio(double baseAspectRatio, const VisualCrop* crop) noexcept {
    const double safeBase = isFinitePositive(baseAspectRatio) ? baseAspectRatio : 1.0;
    return safeBase * getVisualCropAspectRatioMultiplier(crop);
}

PixelRect getVisualCropSourceRect(double sourceWidth, double sourceHeight, const VisualCrop* crop) noexcept {
    const double safeWidth = std::max(1.0, finiteOr(sourceWidth, 1.0));
    const double safeHeight = std::max(1.0, finiteOr(sourceHeight, 1.0));
    const VisualCrop normalized = crop ? normalizeVisualCrop(*crop) : VisualCrop{};
    const CropRemainingRatios remaining = getVisualCropRemainingRatios(normalized);
    return PixelRect{
        normalized.left * safeWidth,
        normalized.top * safeHeight,
        remaining.widthRatio * safeWidth,
        remaining.heightRatio * safeHeight,
    };
}

bool operator==(const VisualCrop& a, const VisualCrop& b) noexcept {
    return a.left == b.left && a.right == b.right && a.top == b.top && a.bottom == b.bottom;
}

} // namespace folio
