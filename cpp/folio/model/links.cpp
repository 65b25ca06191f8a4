#include "folio/model/links.h"

#include "folio/core/constants.h"
#include "folio/core/string_utils.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace folio {

const char* const kDefaultLinkLabel = "Open Link";

namespace {

bool containsSpace(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// "scheme://host[rest]" with a non-empty host; rebuilt lower-cased.
std::string normalizeHierarchicalUrl(const std::string& scheme, const std::string& afterColon) {
    if (afterColon.size() < 2 || afterColon[0] != '/' || afterColon[1] != '/') return "";
    const std::string authorityAndRest = afterColon.substr(2);
    const std::size_t hostEnd = authorityAndRest.find_first_of("/?#");
    const std::string host = authorityAndRest.substr(0, hostEnd);
    if (host.empty() || containsSpace(host)) return "";

    std::string rest = hostEnd == std::string::npos ? std::string() : authorityAndRest.substr(hostEnd);
    if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
    if (containsSpace(rest)) return "";
    return scheme + "://" + toLowerAscii(host) + rest;
}

} // namespace

std::string sanitizeLinkLabel(const std::string& input) {
    const std::string trimmed = trimWhitespace(input);
    if (trimmed.empty()) return kDefaultLinkLabel;
    if (utf8CodepointCount(trimmed) <= constants::MAX_LINK_LABEL_LENGTH) return trimmed;
    // Re-trimmed so a cut before inner whitespace still sanitizes to a fixed point.
    return trimWhitespace(utf8Prefix(trimmed, constants::MAX_LINK_LABEL_LENGTH));
}

std::string sanitizeLinkUrl(const std::string& input) {
    static const std::regex kSchemePrefix(R"(^[a-zA-Z][a-zA-Z\d+.-]*:)");
    static const std::regex kLikelyHost(
        R"(^(localhost(?::\d+)?|(?:[a-z0-9-]+\.)+[a-z]{2,})(?:[/:?#]|$))", std::regex::icase);

    const std::string raw = trimWhitespace(input);
    if (raw.empty()) return "";

    std::string candidate = raw;
    if (!std::regex_search(raw, kSchemePrefix) && raw.rfind("//", 0) != 0
        && std::regex_search(raw, kLikelyHost)) {
        candidate = "https://" + raw;
    }

    const std::size_t colon = candidate.find(':');
    if (colon == std::string::npos || !std::regex_search(candidate, kSchemePrefix)) return "";

    const std::string scheme = toLowerAscii(candidate.substr(0, colon));
    const std::string afterColon = candidate.substr(colon + 1);

    if (scheme == "http" || scheme == "https") {
        return normalizeHierarchicalUrl(scheme, afterColon);
    }
    if (scheme == "mailto" || scheme == "tel") {
        if (afterColon.empty()) return "";
        return candidate;
    }
    return "";
}

} // namespace folio
