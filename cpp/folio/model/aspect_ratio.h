#pragma once

#include "folio/model/block.h"
#include <optional>
#include <string>

namespace folio {

/**
 * Page height over page width of the physical book sheet (1.71 x 1.28).
 *
 * Normalized block units are fractions of a non-square page, so a pixel-space
 * ratio must be multiplied by this factor to keep the visual proportions.
 */
constexpr double PAGE_HEIGHT_WIDTH_RATIO = 1.71 / 1.28;

// Finite positive value clamped to [0.05, 20]; otherwise the fallback
// (itself defaulted to 1 when not finite positive), clamped.
double normalizeAspectRatio(double value, double fallback = 1.0) noexcept;

// Stored ratio of the block, falling back to its current w / h.
double getBlockAspectRatio(const Block& block) noexcept;

// Ratio from the root <svg> viewBox, else from numeric width/height
// attributes. Percent sizes and malformed numbers yield nullopt.
std::optional<double> parseSvgAspectRatio(const std::string& svgMarkup);

// Intrinsic image ratio (naturalWidth / naturalHeight) in block units.
double imagePixelRatioToBlockRatio(double pixelRatio) noexcept;

} // namespace folio
