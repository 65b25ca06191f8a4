#include "tests/folio_test_common.h"
#include "folio/model/block_factory.h"
#include "folio/model/aspect_ratio.h"

using namespace folio;
using namespace folio_test;

TEST(BlockFactoryTest, DefaultsPerKind) {
    const PageSideLayout empty;

    const Block text = makeDefaultBlock(BlockKind::Text, "t", empty);
    EXPECT_EQ(text.kind(), BlockKind::Text);
    EXPECT_DOUBLE_EQ(text.x, 0.05);
    EXPECT_DOUBLE_EQ(text.y, 0.05);
    EXPECT_DOUBLE_EQ(text.w, 0.4);
    EXPECT_DOUBLE_EQ(text.h, 0.15);
    EXPECT_EQ(text.zIndex, 1);

    const Block image = makeDefaultBlock(BlockKind::Image, "i", empty);
    EXPECT_DOUBLE_EQ(image.w, 0.4);
    EXPECT_DOUBLE_EQ(image.h, 0.3);
    EXPECT_FALSE(image.image()->crop.has_value());

    const Block svg = makeDefaultBlock(BlockKind::Svg, "s", empty);
    EXPECT_DOUBLE_EQ(svg.w, 0.2);
    EXPECT_FALSE(svg.svg()->svgCode.empty());
    ASSERT_TRUE(svg.svg()->intrinsicAspectRatio.has_value());
    EXPECT_DOUBLE_EQ(*svg.svg()->intrinsicAspectRatio, 1.0);

    const Block link = makeDefaultBlock(BlockKind::Link, "l", empty);
    EXPECT_DOUBLE_EQ(link.h, 0.08);
    EXPECT_EQ(link.link()->label, "Open Link");

    const Block shape = makeDefaultBlock(BlockKind::Shape, "sh", empty);
    EXPECT_DOUBLE_EQ(shape.w, 0.3);
    EXPECT_DOUBLE_EQ(shape.h, 0.2);

    for (const Block& block : {text, image, svg, link, shape}) {
        expectBlockInvariants(block);
    }
}

TEST(BlockFactoryTest, StacksOnTop) {
    PageSideLayout layout = makeLayout({makeText("a", 0.1, 0.1, 0.2, 0.2)});
    layout.blocks[0].zIndex = 7;
    EXPECT_EQ(makeDefaultBlock(BlockKind::Shape, "b", layout).zIndex, 8);
}

TEST(BlockFactoryTest, ProfileImageIsCentredCircle) {
    const Block profile = makeProfileImageBlock("p", "profile.png", PageSideLayout{});
    ASSERT_NE(profile.image(), nullptr);
    EXPECT_TRUE(isCircleImage(profile));
    EXPECT_EQ(profile.image()->assetPath, "profile.png");
    EXPECT_DOUBLE_EQ(profile.x, 0.35);
    EXPECT_DOUBLE_EQ(profile.w, 0.3);
}

TEST(BlockFactoryTest, CountGuard) {
    PageSideLayout layout;
    for (int i = 0; i < 19; ++i) {
        layout.blocks.push_back(makeText("b" + std::to_string(i), 0.0, 0.0, 0.1, 0.1));
    }
    EXPECT_TRUE(canAddBlock(layout));
    layout.blocks.push_back(makeText("b19", 0.0, 0.0, 0.1, 0.1));
    EXPECT_FALSE(canAddBlock(layout));
}

TEST(BlockTest, PaintOrderIsStableByZIndex) {
    PageSideLayout layout = makeLayout({
        makeText("a", 0.0, 0.0, 0.1, 0.1),
        makeText("b", 0.0, 0.0, 0.1, 0.1),
        makeText("c", 0.0, 0.0, 0.1, 0.1),
    });
    layout.blocks[0].zIndex = 2;
    layout.blocks[1].zIndex = 1;
    layout.blocks[2].zIndex = 2;
    const auto ordered = blocksInPaintOrder(layout);
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0]->id, "b");
    EXPECT_EQ(ordered[1]->id, "a");
    EXPECT_EQ(ordered[2]->id, "c");
}
