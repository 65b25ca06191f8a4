#include "folio/model/aspect_ratio.h"

#include "folio/core/constants.h"
#include "folio/core/math_utils.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include <vector>

namespace folio {

namespace {

// Leading-number parse: "24px" -> 24, "abc" -> NaN.
double parseLeadingNumber(const std::string& raw) {
    const char* begin = raw.c_str();
    while (*begin != '\0' && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) return std::numeric_limits<double>::quiet_NaN();
    return value;
}

std::optional<std::string> findRootSvgTag(const std::string& markup) {
    static const std::regex kRootTag(R"(<svg\b[^>]*>)", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(markup, match, kRootTag)) return std::nullopt;
    return match.str(0);
}

std::optional<std::string> findAttribute(const std::string& tag, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(tag, match, pattern)) return std::nullopt;
    for (std::size_t i = 1; i < match.size(); ++i) {
        if (match[i].matched) return match[i].str();
    }
    return std::nullopt;
}

std::vector<std::string> splitViewBox(const std::string& raw) {
    std::vector<std::string> parts;
    std::string current;
    for (const char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::optional<double> parseSizeAttribute(const std::optional<std::string>& raw) {
    if (!raw || raw->find('%') != std::string::npos) return std::nullopt;
    const double value = parseLeadingNumber(*raw);
    if (!isFinitePositive(value)) return std::nullopt;
    return value;
}

} // namespace

double normalizeAspectRatio(double value, double fallback) noexcept {
    const double safeFallback = isFinitePositive(fallback) ? fallback : 1.0;
    const double candidate = isFinitePositive(value) ? value : safeFallback;
    return clampValue(candidate, constants::MIN_ASPECT_RATIO, constants::MAX_ASPECT_RATIO);
}

double getBlockAspectRatio(const Block& block) noexcept {
    const double fallback = block.h > 0.0 ? block.w / block.h : 1.0;
    return normalizeAspectRatio(block.aspectRatio, fallback);
}

std::optional<double> parseSvgAspectRatio(const std::string& svgMarkup) {
    static const std::regex kViewBox(
        R"re(\bviewBox\s*=\s*(?:"([^"]+)"|'([^']+)'|([^\s>]+)))re", std::regex::icase);
    static const std::regex kWidth(
        R"re(\bwidth\s*=\s*(?:"([^"]+)"|'([^']+)'|([^\s>]+)))re", std::regex::icase);
    static const std::regex kHeight(
        R"re(\bheight\s*=\s*(?:"([^"]+)"|'([^']+)'|([^\s>]+)))re", std::regex::icase);

    const auto rootTag = findRootSvgTag(svgMarkup);
    if (!rootTag) return std::nullopt;

    if (const auto viewBox = findAttribute(*rootTag, kViewBox)) {
        const auto parts = splitViewBox(*viewBox);
        if (parts.size() == 4) {
            const double width = parseLeadingNumber(parts[2]);
            const double height = parseLeadingNumber(parts[3]);
            if (std::isfinite(width) && std::isfinite(height) && height > 0.0) {
                return normalizeAspectRatio(width / height);
            }
        }
    }

    const auto width = parseSizeAttribute(findAttribute(*rootTag, kWidth));
    const auto height = parseSizeAttribute(findAttribute(*rootTag, kHeight));
    if (width && height) {
        return normalizeAspectRatio(*width / *height);
    }
    return std::nullopt;
}

double imagePixelRatioToBlockRatio(double pixelRatio) noexcept {
    const double safe = isFinitePositive(pixelRatio) ? pixelRatio : 1.0;
    return normalizeAspectRatio(safe * PAGE_HEIGHT_WIDTH_RATIO);
}

} // namespace folio
