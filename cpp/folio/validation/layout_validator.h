#pragma once

#include "folio/model/block.h"
#include <string>
#include <vector>

namespace folio {

struct ValidationResult {
    bool valid{true};                 // no structural repair was needed
    std::vector<std::string> errors;  // structural repairs, human readable
    PageSideLayout layout;
};

// x, y clamped first so that w, h can be bounded by the remaining page.
NormRect clampNormalizedRect(const NormRect& rect) noexcept;

TextStyle validateTextStyle(const TextStyle& style);
LinkStyle validateLinkStyle(const LinkStyle& style);
ShapePayload validateShapePayload(const ShapePayload& shape);

// Rectangle, aspect ratio, decorations and payload of one block repaired.
Block validateBlock(const Block& block);

// Repairs any layout into one that satisfies the block invariants. Total and
// idempotent: validateLayout(validateLayout(l).layout).layout equals
// validateLayout(l).layout.
ValidationResult validateLayout(const PageSideLayout& layout);

} // namespace folio
