#pragma once

#include <optional>
#include <string>

namespace folio {

// Default page background (warm paper).
extern const char* const kPaperTone;

// Empty or plain-white backgrounds map to the paper tone; other values are
// returned trimmed.
std::string normalizePaperBackground(const std::optional<std::string>& backgroundColor);

} // namespace folio
