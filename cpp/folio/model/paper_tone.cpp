#include "folio/model/paper_tone.h"

#include "folio/core/string_utils.h"

namespace folio {

const char* const kPaperTone = "#ece0c5";

std::string normalizePaperBackground(const std::optional<std::string>& backgroundColor) {
    if (!backgroundColor) return kPaperTone;

    const std::string raw = trimWhitespace(*backgroundColor);
    if (raw.empty()) return kPaperTone;

    const std::string lowered = toLowerAscii(raw);
    if (lowered == "#fff" || lowered == "#ffffff") return kPaperTone;
    return raw;
}

} // namespace folio
