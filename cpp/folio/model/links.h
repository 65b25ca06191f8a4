#pragma once

#include <string>

namespace folio {

extern const char* const kDefaultLinkLabel;

// Trimmed label, "Open Link" when empty, cut at 120 characters.
std::string sanitizeLinkLabel(const std::string& input);

// Accepts http, https, mailto and tel URLs. Bare host names get an https://
// prefix; http(s) URLs come back with a lower-cased scheme and host and at
// least a "/" path. Anything else sanitizes to "".
std::string sanitizeLinkUrl(const std::string& input);

} // namespace folio
