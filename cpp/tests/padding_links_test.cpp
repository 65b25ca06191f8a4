#include "tests/folio_test_common.h"
#include "folio/core/string_utils.h"
#include "folio/model/links.h"
#include "folio/model/padding.h"
#include "folio/model/paper_tone.h"
#include <string>

using namespace folio;
using namespace folio_test;

TEST(PaddingTest, DefaultSafeArea) {
    const SafeArea area = computeSafeArea(600.0, 802.0, std::nullopt);
    EXPECT_DOUBLE_EQ(area.x, 48.0);
    EXPECT_NEAR(area.y, 80.2, kEps);
    EXPECT_DOUBLE_EQ(area.w, 504.0);
    EXPECT_NEAR(area.h, 641.6, kEps);
}

TEST(PaddingTest, PixelClampsApply) {
    const SafeArea tight = computeSafeArea(600.0, 802.0, PaddingConfig{0.0, 0.0});
    EXPECT_DOUBLE_EQ(tight.x, 24.0);
    EXPECT_DOUBLE_EQ(tight.y, 24.0);

    const SafeArea wide = computeSafeArea(1000.0, 1000.0, PaddingConfig{0.4, 0.4});
    EXPECT_DOUBLE_EQ(wide.x, 140.0);
    EXPECT_DOUBLE_EQ(wide.y, 180.0);
    EXPECT_DOUBLE_EQ(wide.w, 720.0);
}

TEST(PaddingTest, PixelRectUsesSafeArea) {
    const SafeArea area{10.0, 20.0, 100.0, 200.0};
    const PixelRect rect = toPixelRect(NormRect{0.5, 0.25, 0.2, 0.1}, area);
    EXPECT_DOUBLE_EQ(rect.x, 60.0);
    EXPECT_DOUBLE_EQ(rect.y, 70.0);
    EXPECT_DOUBLE_EQ(rect.width, 20.0);
    EXPECT_DOUBLE_EQ(rect.height, 20.0);
}

TEST(PaperToneTest, WhiteAndEmptyMapToPaper) {
    EXPECT_EQ(normalizePaperBackground(std::nullopt), "#ece0c5");
    EXPECT_EQ(normalizePaperBackground(std::string("  ")), "#ece0c5");
    EXPECT_EQ(normalizePaperBackground(std::string("#FFFFFF")), "#ece0c5");
    EXPECT_EQ(normalizePaperBackground(std::string("#fff")), "#ece0c5");
    EXPECT_EQ(normalizePaperBackground(std::string(" #112233 ")), "#112233");
}

TEST(LinksTest, LabelIsTrimmedDefaultedAndCut) {
    EXPECT_EQ(sanitizeLinkLabel("  Visit  "), "Visit");
    EXPECT_EQ(sanitizeLinkLabel("   "), "Open Link");
    const std::string longLabel(200, 'a');
    EXPECT_EQ(sanitizeLinkLabel(longLabel).size(), 120u);
    EXPECT_EQ(sanitizeLinkLabel(sanitizeLinkLabel(std::string(119, 'b') + "  tail")),
        sanitizeLinkLabel(std::string(119, 'b') + "  tail"));
}

TEST(LinksTest, LabelIsCutAtCodePointsNotBytes) {
    const std::string eAcute = "\xC3\xA9";
    const std::string cjk = "\xE4\xB8\xAD";

    // 120 characters, 121 bytes: kept whole.
    const std::string accented = std::string(119, 'a') + eAcute;
    EXPECT_EQ(sanitizeLinkLabel(accented), accented);
    EXPECT_EQ(sanitizeLinkLabel(std::string(120, 'a') + eAcute), std::string(120, 'a'));

    std::string shortCjk;
    for (int i = 0; i < 41; ++i) shortCjk += cjk;
    EXPECT_EQ(sanitizeLinkLabel(shortCjk), shortCjk);

    std::string longCjk;
    for (int i = 0; i < 130; ++i) longCjk += cjk;
    const std::string cut = sanitizeLinkLabel(longCjk);
    EXPECT_EQ(utf8CodepointCount(cut), 120u);
    EXPECT_EQ(cut.size(), 360u);
    EXPECT_EQ(sanitizeLinkLabel(cut), cut);
}

TEST(StringUtilsTest, Utf8PrefixNeverSplitsSequences) {
    const std::string mixed = "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x93\x96z";
    EXPECT_EQ(utf8CodepointCount(mixed), 5u);
    EXPECT_EQ(utf8Prefix(mixed, 2), "a\xC3\xA9");
    EXPECT_EQ(utf8Prefix(mixed, 4), "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x93\x96");
    EXPECT_EQ(utf8Prefix(mixed, 10), mixed);
    // A stray continuation byte counts as one character.
    EXPECT_EQ(utf8CodepointCount("\x80x"), 2u);
    EXPECT_EQ(trimWhitespace("  \tab \n"), "ab");
    EXPECT_EQ(toLowerAscii("HTTPS://Ex"), "https://ex");
}

TEST(LinksTest, BareHostGetsHttps) {
    EXPECT_EQ(sanitizeLinkUrl("example.com"), "https://example.com/");
    EXPECT_EQ(sanitizeLinkUrl("  sub.example.org/path?q=1 "), "https://sub.example.org/path?q=1");
    EXPECT_EQ(sanitizeLinkUrl("localhost/app"), "https://localhost/app");
    // "localhost:" parses as a scheme
    EXPECT_EQ(sanitizeLinkUrl("localhost:3000"), "");
}

TEST(LinksTest, HttpUrlsAreNormalized) {
    EXPECT_EQ(sanitizeLinkUrl("HTTP://Example.COM/Path"), "http://example.com/Path");
    EXPECT_EQ(sanitizeLinkUrl("https://example.com?x=1"), "https://example.com/?x=1");
}

TEST(LinksTest, OnlyKnownSchemesSurvive) {
    EXPECT_EQ(sanitizeLinkUrl("mailto:me@example.com"), "mailto:me@example.com");
    EXPECT_EQ(sanitizeLinkUrl("tel:+15550100"), "tel:+15550100");
    EXPECT_EQ(sanitizeLinkUrl("tel:"), "");
    EXPECT_EQ(sanitizeLinkUrl("javascript:alert(1)"), "");
    EXPECT_EQ(sanitizeLinkUrl("ftp://example.com/file"), "");
    EXPECT_EQ(sanitizeLinkUrl("not a url"), "");
    EXPECT_EQ(sanitizeLinkUrl(""), "");
}
