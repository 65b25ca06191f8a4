#include "tests/folio_test_common.h"
#include "folio/model/block_factory.h"
#include "folio/persistence/layout_json.h"
#include "folio/persistence/layout_store.h"
#include <nlohmann/json.hpp>

using namespace folio;
using namespace folio_test;
using nlohmann::json;

TEST(LayoutJsonTest, InvalidTextDecodesToEmptyLayout) {
    const persistence::LayoutDecodeResult result = persistence::decodeLayoutJsonText("{not json");
    EXPECT_TRUE(result.layout.blocks.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("not valid JSON"), std::string::npos);
}

TEST(LayoutJsonTest, NonArrayBlocksIsEmpty) {
    const ValidationResult result = persistence::validateLayoutJson(json{{"blocks", "nope"}});
    EXPECT_TRUE(result.layout.blocks.empty());
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.errors[0].find("blocks must be an array"), std::string::npos);
    EXPECT_EQ(result.layout.backgroundColor.value_or(""), "#ece0c5");
}

TEST(LayoutJsonTest, NonObjectEntriesAreDropped) {
    const json doc = json::parse(R"({"blocks": [42, {"id": "a", "type": "shape", "x": 0.1, "y": 0.1, "w": 0.2, "h": 0.2}]})");
    const persistence::LayoutDecodeResult result = persistence::decodeLayoutJson(doc);
    ASSERT_EQ(result.layout.blocks.size(), 1u);
    EXPECT_EQ(result.layout.blocks[0].kind(), BlockKind::Shape);
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST(LayoutJsonTest, DecodesEveryKind) {
    const json doc = json::parse(R"({
        "backgroundColor": "#101010",
        "paddingOverride": {"padXRatio": 0.05, "padYRatio": 0.06},
        "blocks": [
            {"id": "t", "type": "text", "x": 0.1, "y": 0.1, "w": 0.4, "h": 0.1, "zIndex": 3,
             "content": "Hello", "style": {"fontSize": 32, "fontWeight": 700, "textAlign": "center",
             "color": "#222222", "lineHeight": 1.2, "fontFamily": "serif"},
             "outline": {"color": "#ff0000", "width": 4}, "cornerRadius": 12, "linkUrl": "example.com"},
            {"id": "i", "type": "image", "x": 0.5, "y": 0.5, "w": 0.3, "h": 0.3, "zIndex": 1,
             "assetPath": "pages/p1.png", "objectFit": "contain", "shape": "circle",
             "crop": {"left": 0.1, "right": 0.0, "top": 0.0, "bottom": 0.2}},
            {"id": "s", "type": "svg", "x": 0.0, "y": 0.6, "w": 0.2, "h": 0.2,
             "svgCode": "<svg viewBox=\"0 0 40 20\"></svg>"},
            {"id": "l", "type": "link", "x": 0.0, "y": 0.9, "w": 0.3, "h": 0.08,
             "label": "Docs", "url": "https://example.com/docs",
             "style": {"fontSize": 20, "textColor": "#eeeeee", "borderRadius": 4}},
            {"id": "sh", "type": "shape", "x": 0.6, "y": 0.0, "w": 0.2, "h": 0.1,
             "shapeType": "ellipse", "fill": "#00ff00", "stroke": "#0000ff", "strokeWidth": 3}
        ]
    })");
    const persistence::LayoutDecodeResult result = persistence::decodeLayoutJson(doc);
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.layout.blocks.size(), 5u);
    EXPECT_EQ(result.layout.backgroundColor.value_or(""), "#101010");
    ASSERT_TRUE(result.layout.paddingOverride.has_value());
    EXPECT_DOUBLE_EQ(result.layout.paddingOverride->padYRatio, 0.06);

    const Block& t = blockById(result.layout, "t");
    EXPECT_EQ(t.zIndex, 3);
    EXPECT_EQ(t.text()->content, "Hello");
    EXPECT_EQ(t.text()->style.fontWeight, 700);
    EXPECT_EQ(t.text()->style.textAlign, TextAlign::Center);
    EXPECT_EQ(t.text()->style.fontFamily, "serif");
    ASSERT_TRUE(t.outline.has_value());
    EXPECT_DOUBLE_EQ(t.outline->width, 4.0);
    EXPECT_EQ(t.linkUrl.value_or(""), "example.com");

    const Block& i = blockById(result.layout, "i");
    EXPECT_EQ(i.image()->objectFit, ObjectFit::Contain);
    EXPECT_TRUE(isCircleImage(i));
    ASSERT_TRUE(i.image()->crop.has_value());
    EXPECT_DOUBLE_EQ(i.image()->crop->bottom, 0.2);

    const Block& s = blockById(result.layout, "s");
    ASSERT_TRUE(s.svg()->intrinsicAspectRatio.has_value());
    EXPECT_DOUBLE_EQ(*s.svg()->intrinsicAspectRatio, 2.0);

    const Block& l = blockById(result.layout, "l");
    EXPECT_EQ(l.link()->label, "Docs");
    EXPECT_DOUBLE_EQ(l.link()->style.fontSize, 20.0);
    EXPECT_EQ(l.link()->style.backgroundColor, "#1f2937");

    const Block& sh = blockById(result.layout, "sh");
    EXPECT_EQ(sh.shape()->kind, ShapeKind::Ellipse);
    EXPECT_DOUBLE_EQ(sh.shape()->strokeWidth, 3.0);
}

TEST(LayoutJsonTest, MissingFieldsAreRepairedOnValidate) {
    const ValidationResult result = persistence::validateLayoutJsonText(R"({"blocks": [{"type": "text"}]})");
    ASSERT_EQ(result.layout.blocks.size(), 1u);
    const Block& block = result.layout.blocks[0];
    EXPECT_EQ(block.id, "block-0");
    EXPECT_DOUBLE_EQ(block.w, 0.01);
    expectBlockInvariants(block);
}

TEST(LayoutJsonTest, EncodedValidatedLayoutDecodesToItself) {
    PageSideLayout layout;
    layout.blocks.push_back(makeDefaultBlock(BlockKind::Text, "a", layout));
    layout.blocks.push_back(makeDefaultBlock(BlockKind::Svg, "b", layout));
    layout.blocks.back().svg()->crop = VisualCrop{0.1, 0.2, 0.0, 0.0};
    const PageSideLayout validated = validateLayout(layout).layout;

    const std::string text = persistence::encodeLayoutJsonText(validated);
    const ValidationResult reloaded = persistence::validateLayoutJsonText(text);
    EXPECT_TRUE(reloaded.valid);
    EXPECT_EQ(persistence::encodeLayoutJsonText(reloaded.layout), text);
}

TEST(LayoutJsonTest, MalformedUtf8IsReplacedOnEncode) {
    PageSideLayout layout;
    layout.blocks.push_back(makeDefaultBlock(BlockKind::Text, "t", layout));
    layout.blocks.back().text()->content = "broken \xC3";
    std::string text;
    EXPECT_NO_THROW(text = persistence::encodeLayoutJsonText(layout));
    const ValidationResult reloaded = persistence::validateLayoutJsonText(text);
    ASSERT_EQ(reloaded.layout.blocks.size(), 1u);
    EXPECT_EQ(reloaded.layout.blocks[0].text()->content, "broken \xEF\xBF\xBD");
}

TEST(LayoutStoreTest, PageSideKeyFormat) {
    EXPECT_EQ(persistence::pageSideKey(3, persistence::PageSide::Front), "p3:front");
    EXPECT_EQ(persistence::pageSideKey(0, persistence::PageSide::Back), "p0:back");
    const auto back = persistence::parsePageSide("back");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, persistence::PageSide::Back);
    EXPECT_FALSE(persistence::parsePageSide("side").has_value());
}

TEST(LayoutStoreTest, MemoryStoreLastWriteWins) {
    persistence::MemoryLayoutStore store;
    const persistence::PageSideKey key{"book-1", 2, persistence::PageSide::Back};
    EXPECT_FALSE(store.load(key).has_value());

    PageSideLayout first = makeLayout({makeText("a", 0.1, 0.1, 0.2, 0.2)});
    store.save(key, first);
    PageSideLayout second = makeLayout({makeText("b", 0.1, 0.1, 0.2, 0.2)});
    store.save(key, second);

    const auto doc = store.load(key);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["blocks"][0]["id"], "b");
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.saveCount(), 2u);
}
