#include "tests/folio_test_common.h"
#include "folio/interaction/drag_engine.h"

using namespace folio;
using namespace folio::interaction;
using namespace folio_test;

TEST(DragEngineTest, SnapsLeadingEdgeToNeighbour) {
    // Image right edge 0.4 travels 0.015 and snaps onto the neighbour's left edge at 0.42.
    const PageSideLayout layout = makeLayout({
        makeImage("img", 0.1, 0.1, 0.3, 0.2),
        makeText("target", 0.42, 0.7, 0.2, 0.2),
    });
    const DragResult result =
        applyDragDelta(layout, captureOrigins(layout, {"img"}), 0.015, 0.0, SnapThresholds{0.02, 0.02});

    ASSERT_TRUE(result.applied);
    EXPECT_NEAR(result.dx, 0.02, kEps);
    EXPECT_NEAR(blockById(result.layout, "img").x, 0.12, kEps);
    EXPECT_DOUBLE_EQ(blockById(result.layout, "img").y, 0.1);
    ASSERT_TRUE(result.guides.x.has_value());
    EXPECT_DOUBLE_EQ(*result.guides.x, 0.42);
    EXPECT_FALSE(result.guides.y.has_value());
    EXPECT_DOUBLE_EQ(blockById(result.layout, "target").x, 0.42);
}

TEST(DragEngineTest, GroupMovesByOneSharedDelta) {
    const PageSideLayout layout = makeLayout({
        makeText("a", 0.1, 0.1, 0.2, 0.1),
        makeText("b", 0.5, 0.6, 0.1, 0.2),
    });
    const DragResult result = applyDragDelta(layout, captureOrigins(layout, {"a", "b"}), 0.05, 0.07, SnapThresholds{});
    ASSERT_TRUE(result.applied);
    EXPECT_NEAR(blockById(result.layout, "a").x, 0.15, kEps);
    EXPECT_NEAR(blockById(result.layout, "a").y, 0.17, kEps);
    EXPECT_NEAR(blockById(result.layout, "b").x, 0.55, kEps);
    EXPECT_NEAR(blockById(result.layout, "b").y, 0.67, kEps);
    EXPECT_DOUBLE_EQ(blockById(result.layout, "b").w, 0.1);
}

TEST(DragEngineTest, GroupIsClampedAtPageEdges) {
    const PageSideLayout layout = makeLayout({
        makeText("a", 0.1, 0.1, 0.2, 0.1),
        makeText("b", 0.7, 0.6, 0.2, 0.2),
    });
    const DragResult result = applyDragDelta(layout, captureOrigins(layout, {"a", "b"}), 0.5, -0.5, SnapThresholds{});
    ASSERT_TRUE(result.applied);
    EXPECT_NEAR(result.dx, 0.1, kEps);
    EXPECT_NEAR(result.dy, -0.1, kEps);
    EXPECT_NEAR(blockById(result.layout, "b").x + blockById(result.layout, "b").w, 1.0, kEps);
    EXPECT_NEAR(blockById(result.layout, "a").y, 0.0, kEps);
    // Relative offset inside the group is preserved.
    EXPECT_NEAR(blockById(result.layout, "b").x - blockById(result.layout, "a").x, 0.6, kEps);
    expectLayoutInvariants(result.layout);
}

TEST(DragEngineTest, GuideDroppedWhenSnapWouldLeavePage) {
    // Left edge at 0.75 would snap to 0.76, but the right edge is already at the page edge.
    const PageSideLayout layout = makeLayout({
        makeText("a", 0.7, 0.1, 0.25, 0.1),
        makeText("target", 0.76, 0.5, 0.1, 0.1),
    });
    const DragResult result = applyDragDelta(layout, captureOrigins(layout, {"a"}), 0.05, 0.0, SnapThresholds{0.012, 0.0});
    ASSERT_TRUE(result.applied);
    EXPECT_NEAR(result.dx, 0.05, kEps);
    EXPECT_NEAR(blockById(result.layout, "a").x, 0.75, kEps);
    EXPECT_FALSE(result.guides.x.has_value());
}

TEST(DragEngineTest, ZeroThresholdsNeverSnap) {
    const PageSideLayout layout = makeLayout({
        makeImage("img", 0.1, 0.1, 0.3, 0.2),
        makeText("target", 0.42, 0.7, 0.2, 0.2),
    });
    const DragResult result = applyDragDelta(layout, captureOrigins(layout, {"img"}), 0.015, 0.0, SnapThresholds{});
    EXPECT_NEAR(blockById(result.layout, "img").x, 0.115, kEps);
    EXPECT_FALSE(result.guides.x.has_value());
}

TEST(DragEngineTest, RecomputedFromOriginsEveryMove) {
    PageSideLayout layout = makeLayout({makeText("a", 0.2, 0.2, 0.2, 0.2)});
    const auto session = beginDragSession(layout, {"a"}, PointerPos{100.0, 100.0});
    ASSERT_TRUE(session.has_value());
    GestureFrame frame;
    frame.unitWidthPx = 500.0;
    frame.unitHeightPx = 500.0;

    const DragResult first = computeDrag(layout, *session, PointerPos{150.0, 100.0}, frame);
    const DragResult again = computeDrag(first.layout, *session, PointerPos{150.0, 100.0}, frame);
    EXPECT_NEAR(blockById(first.layout, "a").x, 0.3, kEps);
    EXPECT_DOUBLE_EQ(blockById(again.layout, "a").x, blockById(first.layout, "a").x);

    const DragResult back = computeDrag(again.layout, *session, PointerPos{100.0, 100.0}, frame);
    EXPECT_DOUBLE_EQ(blockById(back.layout, "a").x, 0.2);
}

TEST(DragEngineTest, VanishedSelectionIsNoOp) {
    const PageSideLayout layout = makeLayout({makeText("a", 0.2, 0.2, 0.2, 0.2)});
    const std::vector<BlockOrigin> origins{BlockOrigin{"gone", NormRect{0.1, 0.1, 0.1, 0.1}}};
    const DragResult result = applyDragDelta(layout, origins, 0.1, 0.1, SnapThresholds{});
    EXPECT_FALSE(result.applied);
    EXPECT_DOUBLE_EQ(blockById(result.layout, "a").x, 0.2);
}

TEST(DragEngineTest, PartiallyVanishedSelectionMovesSurvivors) {
    const PageSideLayout layout = makeLayout({makeText("a", 0.2, 0.2, 0.2, 0.2)});
    const std::vector<BlockOrigin> origins{
        BlockOrigin{"gone", NormRect{0.0, 0.0, 0.1, 0.1}},
        BlockOrigin{"a", NormRect{0.2, 0.2, 0.2, 0.2}},
    };
    const DragResult result = applyDragDelta(layout, origins, -0.1, 0.0, SnapThresholds{});
    ASSERT_TRUE(result.applied);
    EXPECT_NEAR(blockById(result.layout, "a").x, 0.1, kEps);
    EXPECT_EQ(result.layout.blocks.size(), 1u);
}

TEST(DragEngineTest, DeltaBoundsAlwaysContainZero) {
    const std::vector<BlockOrigin> origins{BlockOrigin{"a", NormRect{0.95, 0.0, 0.1, 0.1}}};
    const DeltaBounds bounds = computeGroupDeltaBounds(origins);
    EXPECT_LE(bounds.minDx, 0.0);
    EXPECT_GE(bounds.maxDx, 0.0);
    EXPECT_NEAR(bounds.minDx, -0.95, kEps);
}
