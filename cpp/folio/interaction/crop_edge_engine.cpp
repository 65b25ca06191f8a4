#include "folio/interaction/crop_edge_engine.h"

#include "folio/core/constants.h"
#include "folio/core/math_utils.h"
#include "folio/interaction/interaction_constants.h"
#include "folio/interaction/snap_solver.h"
#include "folio/model/aspect_ratio.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace folio::interaction {

using constants::MIN_INTERACTIVE_BLOCK_SIZE;
using constants::MIN_VISUAL_CROP_REMAINING_RATIO;

namespace {

const VisualCrop* cropOrNull(const std::optional<VisualCrop>& crop) noexcept {
    return crop ? &*crop : nullptr;
}

double startEdgePosition(const Block& block, CropEdge edge) noexcept {
    switch (edge) {
        case CropEdge::Left: return block.x;
        case CropEdge::Right: return block.x + block.w;
        case CropEdge::Top: return block.y;
        case CropEdge::Bottom: return block.y + block.h;
    }
    return 0.0;
}

CropEdge oppositeEdge(CropEdge edge) noexcept {
    switch (edge) {
        case CropEdge::Left: return CropEdge::Right;
        case CropEdge::Right: return CropEdge::Left;
        case CropEdge::Top: return CropEdge::Bottom;
        case CropEdge::Bottom: return CropEdge::Top;
    }
    return edge;
}

// Ratio of the block with every crop removed.
double baseAspectRatio(const Block& block) noexcept {
    return deriveVisualCropBaseAspectRatio(getBlockAspectRatio(block), blockCrop(block));
}

// Size of the dragged axis that puts the anchor on target, with the opposite
// edge fixed.
double requiredSpan(const Block& block, CropEdge edge, EdgeAnchor anchor, double target) noexcept {
    const double factor = anchor == EdgeAnchor::Center ? 2.0 : 1.0;
    switch (edge) {
        case CropEdge::Left: return factor * (block.x + block.w - target);
        case CropEdge::Right: return factor * (target - block.x);
        case CropEdge::Top: return factor * (block.y + block.h - target);
        case CropEdge::Bottom: return factor * (target - block.y);
    }
    return 0.0;
}

bool withinFraction(double value, double upper) noexcept {
    return std::isfinite(value) && value >= 0.0 && value <= upper;
}

struct EdgeCandidate {
    double distance{std::numeric_limits<double>::infinity()};
    double target{0.0};
};

} // namespace

VisualCrop buildDraggedCrop(
    const CropEdgeSession& session, const PointerPos& pointer, double unitWidthPx, double unitHeightPx) {
    const VisualCrop& start = session.startCrop;
    VisualCrop next = start;

    const CropRemainingRatios remaining = getVisualCropRemainingRatios(start);
    const double blockWidthPx = std::max(1.0, session.startBlock.w * unitWidthPx);
    const double blockHeightPx = std::max(1.0, session.startBlock.h * unitHeightPx);
    const double dx = pointer.x - session.start.x;
    const double dy = pointer.y - session.start.y;

    switch (session.edge) {
        case CropEdge::Left:
            next.left = clampValue(
                start.left + (dx / blockWidthPx) * remaining.widthRatio,
                0.0, 1.0 - start.right - MIN_VISUAL_CROP_REMAINING_RATIO);
            break;
        case CropEdge::Right:
            next.right = clampValue(
                start.right - (dx / blockWidthPx) * remaining.widthRatio,
                0.0, 1.0 - start.left - MIN_VISUAL_CROP_REMAINING_RATIO);
            break;
        case CropEdge::Top:
            next.top = clampValue(
                start.top + (dy / blockHeightPx) * remaining.heightRatio,
                0.0, 1.0 - start.bottom - MIN_VISUAL_CROP_REMAINING_RATIO);
            break;
        case CropEdge::Bottom:
            next.bottom = clampValue(
                start.bottom - (dy / blockHeightPx) * remaining.heightRatio,
                0.0, 1.0 - start.top - MIN_VISUAL_CROP_REMAINING_RATIO);
            break;
    }
    return normalizeVisualCrop(next);
}

Block buildCroppedBlockForEdge(const Block& block, const VisualCrop& crop, CropEdge edge) {
    if (!isCroppableKind(block.kind())) return block;

    const std::optional<VisualCrop> stored = toOptionalVisualCrop(crop);
    const double targetRatio = isCircleImage(block)
        ? 1.0
        : normalizeAspectRatio(applyVisualCropToAspectRatio(baseAspectRatio(block), cropOrNull(stored)));

    Block out = block;
    if (isHorizontalEdge(edge)) {
        const double right = block.x + block.w;
        double w = block.h * targetRatio;
        if (edge == CropEdge::Left) {
            out.x = clampValue(right - w, 0.0, std::max(0.0, right - MIN_INTERACTIVE_BLOCK_SIZE));
            w = clampValue(right - out.x, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - out.x);
        } else {
            w = clampValue(w, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - block.x);
        }
        out.w = w;
    } else {
        const double bottom = block.y + block.h;
        double h = block.w / targetRatio;
        if (edge == CropEdge::Top) {
            out.y = clampValue(bottom - h, 0.0, std::max(0.0, bottom - MIN_INTERACTIVE_BLOCK_SIZE));
            h = clampValue(bottom - out.y, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - out.y);
        } else {
            h = clampValue(h, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - block.y);
        }
        out.h = h;
    }
    out.aspectRatio = targetRatio;
    setBlockCrop(out, stored);
    return out;
}

std::optional<VisualCrop> solveCropForAnchor(
    const Block& block, const VisualCrop& crop, CropEdge edge, EdgeAnchor anchor, double target) {
    if (!isCroppableKind(block.kind()) || isCircleImage(block)) return std::nullopt;

    const double span = requiredSpan(block, edge, anchor, target);
    if (!(span > 0.0)) return std::nullopt;

    const double base = baseAspectRatio(block);
    const CropRemainingRatios remaining = getVisualCropRemainingRatios(crop);
    VisualCrop solved = crop;

    if (isHorizontalEdge(edge)) {
        // w = h * base * widthRatio / heightRatio
        const double widthRatio = span / block.h / base * remaining.heightRatio;
        if (edge == CropEdge::Left) {
            solved.left = 1.0 - crop.right - widthRatio;
            if (!withinFraction(solved.left, 1.0 - crop.right - MIN_VISUAL_CROP_REMAINING_RATIO)) return std::nullopt;
        } else {
            solved.right = 1.0 - crop.left - widthRatio;
            if (!withinFraction(solved.right, 1.0 - crop.left - MIN_VISUAL_CROP_REMAINING_RATIO)) return std::nullopt;
        }
    } else {
        // h = w * heightRatio / (base * widthRatio)
        const double heightRatio = span / block.w * base * remaining.widthRatio;
        if (edge == CropEdge::Top) {
            solved.top = 1.0 - crop.bottom - heightRatio;
            if (!withinFraction(solved.top, 1.0 - crop.bottom - MIN_VISUAL_CROP_REMAINING_RATIO)) return std::nullopt;
        } else {
            solved.bottom = 1.0 - crop.top - heightRatio;
            if (!withinFraction(solved.bottom, 1.0 - crop.top - MIN_VISUAL_CROP_REMAINING_RATIO)) return std::nullopt;
        }
    }
    return normalizeVisualCrop(solved);
}

Block resizeBlockEdge(const Block& block, CropEdge edge, double edgePosition) {
    Block out = block;
    const double position = finiteOr(edgePosition, startEdgePosition(block, edge));
    switch (edge) {
        case CropEdge::Left: {
            const double right = block.x + block.w;
            out.x = clampValue(position, 0.0, std::max(0.0, right - MIN_INTERACTIVE_BLOCK_SIZE));
            out.w = clampValue(right - out.x, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - out.x);
            break;
        }
        case CropEdge::Right: {
            const double right = clampValue(position, block.x + MIN_INTERACTIVE_BLOCK_SIZE, 1.0);
            out.w = right - block.x;
            break;
        }
        case CropEdge::Top: {
            const double bottom = block.y + block.h;
            out.y = clampValue(position, 0.0, std::max(0.0, bottom - MIN_INTERACTIVE_BLOCK_SIZE));
            out.h = clampValue(bottom - out.y, MIN_INTERACTIVE_BLOCK_SIZE, 1.0 - out.y);
            break;
        }
        case CropEdge::Bottom: {
            const double bottom = clampValue(position, block.y + MIN_INTERACTIVE_BLOCK_SIZE, 1.0);
            out.h = bottom - block.y;
            break;
        }
    }
    out.aspectRatio = normalizeAspectRatio(out.w / out.h);
    return out;
}

double edgeAnchorValue(const Block& block, CropEdge edge, EdgeAnchor anchor) noexcept {
    if (anchor == EdgeAnchor::Center) {
        return isHorizontalEdge(edge) ? block.rect().centerX() : block.rect().centerY();
    }
    return startEdgePosition(block, edge);
}

CropEdgeResult computeCropEdge(
    const PageSideLayout& layout, const CropEdgeSession& session, const PointerPos& pointer, const GestureFrame& frame) {
    CropEdgeResult result;
    result.layout = layout;
    Block* target = findBlock(result.layout, session.blockId);
    if (!target) return result;

    const Block& start = session.startBlock;
    const CropEdge edge = session.edge;
    const bool horizontal = isHorizontalEdge(edge);
    const bool croppable = isCroppableKind(start.kind());

    // Unsnapped proposal.
    VisualCrop crop;
    Block proposal;
    if (croppable) {
        crop = buildDraggedCrop(session, pointer, frame.unitWidthPx, frame.unitHeightPx);
        proposal = buildCroppedBlockForEdge(start, crop, edge);
    } else {
        const double delta = horizontal
            ? normalizedDeltaX(frame, session.start, pointer)
            : normalizedDeltaY(frame, session.start, pointer);
        proposal = resizeBlockEdge(start, edge, startEdgePosition(start, edge) + delta);
    }

    // Targets: every other block on the dragged axis.
    std::vector<NormRect> others;
    for (const Block& block : layout.blocks) {
        if (block.id != session.blockId) others.push_back(block.rect());
    }
    const std::vector<double> targets = horizontal ? collectHorizontalAnchors(others) : collectVerticalAnchors(others);
    const double threshold = horizontal ? frame.thresholds.x : frame.thresholds.y;

    Block chosen = proposal;
    EdgeCandidate best;
    if (threshold > 0.0) {
        for (const EdgeAnchor anchor : {EdgeAnchor::Edge, EdgeAnchor::Center}) {
            const double moving = edgeAnchorValue(proposal, edge, anchor);
            for (const double t : targets) {
                const double distance = std::abs(t - moving);
                if (distance > threshold || distance >= best.distance) continue;

                Block candidate;
                if (croppable) {
                    const std::optional<VisualCrop> solved = solveCropForAnchor(start, crop, edge, anchor, t);
                    if (!solved) continue;
                    candidate = buildCroppedBlockForEdge(start, *solved, edge);
                } else {
                    const double fixed = startEdgePosition(start, oppositeEdge(edge));
                    const double position = anchor == EdgeAnchor::Center ? 2.0 * t - fixed : t;
                    candidate = resizeBlockEdge(start, edge, position);
                }
                // Clamping can keep a solved candidate off its target.
                if (std::abs(edgeAnchorValue(candidate, edge, anchor) - t)
                        > interaction_constants::SNAP_LANDING_EPSILON) {
                    continue;
                }
                best.distance = distance;
                best.target = t;
                chosen = candidate;
            }
        }
    }

    if (std::isfinite(best.distance)) {
        if (horizontal) {
            result.guides.x = best.target;
        } else {
            result.guides.y = best.target;
        }
    }

    // Identity and any fields edited outside the gesture come from the live
    // block; the geometry and crop come from the candidate.
    const std::optional<VisualCrop> chosenCrop = blockCrop(chosen)
        ? std::optional<VisualCrop>(*blockCrop(chosen))
        : std::nullopt;
    target->setRect(chosen.rect());
    target->aspectRatio = chosen.aspectRatio;
    if (croppable) setBlockCrop(*target, chosenCrop);
    result.applied = true;
    return result;
}

} // namespace folio::interaction
