#pragma once

#include "folio/core/types.h"
#include "folio/interaction/snap_types.h"
#include "folio/model/block.h"
#include "folio/model/padding.h"
#include "folio/model/visual_crop.h"
#include <optional>
#include <string>
#include <vector>

namespace folio::interaction {

// Rectangle of one selected block at pointer-down.
struct BlockOrigin {
    std::string id;
    NormRect rect;
};

// Pixel size of one normalized unit and the snap distance for one gesture.
struct GestureFrame {
    double unitWidthPx{1.0};
    double unitHeightPx{1.0};
    SnapThresholds thresholds;
};

GestureFrame makeGestureFrame(const SafeArea& safeArea, const SnapOptions& options) noexcept;

// Pointer travel since pointer-down, in normalized units.
double normalizedDeltaX(const GestureFrame& frame, const PointerPos& start, const PointerPos& pointer) noexcept;
double normalizedDeltaY(const GestureFrame& frame, const PointerPos& start, const PointerPos& pointer) noexcept;

// Sessions below are captured once at pointer-down and never mutated. Every
// pointer-move recomputes its candidate from the session and the pointer.

struct DragSession {
    std::vector<BlockOrigin> origins;
    PointerPos start;
};

struct ResizeSession {
    std::vector<BlockOrigin> origins;
    NormRect bounds;  // union of the origins
    PointerPos start;
};

struct CropEdgeSession {
    std::string blockId;
    CropEdge edge{CropEdge::Right};
    PointerPos start;
    Block startBlock;
    VisualCrop startCrop;  // zero crop when the block had none
};

// Origins of the ids present in layout, in selection order. Unknown ids are
// skipped; nullopt when none is present.
std::optional<DragSession> beginDragSession(
    const PageSideLayout& layout, const std::vector<std::string>& ids, const PointerPos& start);
std::optional<ResizeSession> beginResizeSession(
    const PageSideLayout& layout, const std::vector<std::string>& ids, const PointerPos& start);
std::optional<CropEdgeSession> beginCropEdgeSession(
    const PageSideLayout& layout, const std::string& blockId, CropEdge edge, const PointerPos& start);

std::vector<BlockOrigin> captureOrigins(const PageSideLayout& layout, const std::vector<std::string>& ids);

// Origins whose block still exists in layout.
std::vector<BlockOrigin> presentOrigins(const PageSideLayout& layout, const std::vector<BlockOrigin>& origins);

// Smallest rect containing every origin; zero rect when empty.
NormRect unionBounds(const std::vector<BlockOrigin>& origins) noexcept;

bool containsOrigin(const std::vector<BlockOrigin>& origins, const std::string& id) noexcept;

// Current rects of every block not in origins.
std::vector<NormRect> collectTargetRects(const PageSideLayout& layout, const std::vector<BlockOrigin>& origins);

} // namespace folio::interaction
