#pragma once

#include "folio/interaction/gesture_session.h"
#include "folio/interaction/snap_types.h"
#include "folio/model/block.h"
#include "folio/model/visual_crop.h"
#include <optional>

namespace folio::interaction {

struct CropEdgeResult {
    bool applied{false};  // false when the block vanished mid-gesture
    PageSideLayout layout;
    SnapGuides guides;
};

// Crop after dragging the session edge to pointer. The pointer travel is
// scaled by the remaining ratio on that axis and the dragged fraction is
// capped so the axis keeps its minimum visible ratio.
VisualCrop buildDraggedCrop(
    const CropEdgeSession& session, const PointerPos& pointer, double unitWidthPx, double unitHeightPx);

// Displayed box of a croppable block for a new crop: aspect ratio becomes
// base * multiplier(crop) (1 for circle images), the dragged axis is solved
// from it with the opposite edge fixed. Other kinds are returned unchanged.
Block buildCroppedBlockForEdge(const Block& block, const VisualCrop& crop, CropEdge edge);

// Crop whose displayed box puts the dragged edge (or the box center) of
// block exactly on target, keeping every other fraction of crop. nullopt
// when no admissible fraction does that.
std::optional<VisualCrop> solveCropForAnchor(
    const Block& block, const VisualCrop& crop, CropEdge edge, EdgeAnchor anchor, double target);

// Plain resize: the dragged edge moves to edgePosition, the opposite edge
// stays put, the box keeps the interactive minimum size and stays on-page.
Block resizeBlockEdge(const Block& block, CropEdge edge, double edgePosition);

// Dragged edge (or center) coordinate of block on the axis of edge.
double edgeAnchorValue(const Block& block, CropEdge edge, EdgeAnchor anchor) noexcept;

// Crop or plain-resize candidate for the current pointer position.
CropEdgeResult computeCropEdge(
    const PageSideLayout& layout, const CropEdgeSession& session, const PointerPos& pointer, const GestureFrame& frame);

} // namespace folio::interaction
