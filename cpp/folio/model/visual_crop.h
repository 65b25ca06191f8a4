#pragma once

#include "folio/core/types.h"
#include "folio/model/block.h"
#include <cstdint>
#include <optional>

namespace folio {

enum class CropEdge : std::uint8_t {
    Left = 0,
    Right = 1,
    Top = 2,
    Bottom = 3,
};

const char* cropEdgeName(CropEdge edge) noexcept;
std::optional<CropEdge> parseCropEdge(const std::string& name);

inline bool isHorizontalEdge(CropEdge edge) noexcept {
    return edge == CropEdge::Left || edge == CropEdge::Right;
}

struct CropRemainingRatios {
    double widthRatio{1.0};
    double heightRatio{1.0};
};

// Clamps each fraction to [0, 0.95] (non-finite values count as 0) and scales
// left/right and top/bottom down proportionally when a pair exceeds 0.95.
VisualCrop normalizeVisualCrop(const VisualCrop& crop) noexcept;

bool isZeroVisualCrop(const VisualCrop& crop) noexcept;

// Normalized crop, or nullopt when every fraction is ~0.
std::optional<VisualCrop> toOptionalVisualCrop(const VisualCrop& crop) noexcept;

CropRemainingRatios getVisualCropRemainingRatios(const VisualCrop& crop) noexcept;
CropRemainingRatios getVisualCropRemainingRatios(const VisualCrop* crop) noexcept;

// widthRatio / heightRatio of the visible part.
double getVisualCropAspectRatioMultiplier(const VisualCrop* crop) noexcept;

// Uncropped source ratio recovered from a displayed ratio and its crop.
double deriveVisualCropBaseAspectRatio(double currentAspectRatio, const VisualCrop* currentCrop) noexcept;

// Inverse of deriveVisualCropBaseAspectRatio.
double applyVisualCropToAspectRatio(double baseAspectRatio, const VisualCrop* crop) noexcept;

// Crop fractions mapped to source pixel coordinates (source size floored at 1).
PixelRect getVisualCropSourceRect(double sourceWidth, double sourceHeight, const VisualCrop* crop) noexcept;

bool operator==(const VisualCrop& a, const VisualCrop& b) noexcept;
inline bool operator!=(const VisualCrop& a, const VisualCrop& b) noexcept { return !(a == b); }

} // namespace folio
