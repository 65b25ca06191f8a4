#pragma once

#include "folio/model/block.h"
#include <string>

namespace folio {

// Default markup for a freshly added svg block (filled triangle).
extern const char* const kDefaultSvgMarkup;

// True while the layout is below the per-side block cap.
bool canAddBlock(const PageSideLayout& layout) noexcept;

// Builds a block with the deterministic defaults for its kind, stacked on top
// of every existing block (zIndex = max + 1). Does not check the cap.
Block makeDefaultBlock(BlockKind kind, const std::string& id, const PageSideLayout& layout);

// Circular image block centred on the page, used for profile portraits.
Block makeProfileImageBlock(const std::string& id, const std::string& assetPath, const PageSideLayout& layout);

} // namespace folio
