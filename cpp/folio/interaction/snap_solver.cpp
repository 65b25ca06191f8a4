#include "folio/interaction/snap_solver.h"

#include "folio/core/math_utils.h"
#include <cmath>
#include <limits>

namespace folio::interaction {

namespace {
    struct SnapAxisBest {
        bool snapped{false};
        double offset{0.0};
        double target{0.0};
        double dist{std::numeric_limits<double>::infinity()};
    };

    inline void considerAxis(double moving, const std::vector<double>& targets, double tol, SnapAxisBest& best) {
        for (const double target : targets) {
            const double offset = target - moving;
            const double dist = std::abs(offset);
            if (dist <= tol && dist < best.dist) {
                best.dist = dist;
                best.offset = offset;
                best.target = target;
                best.snapped = true;
            }
        }
    }

    inline std::optional<double> closestGuide(const std::vector<double>& moving, const std::vector<double>& targets, double tol) {
        const SnapMatch match = findClosestSnap(moving, targets, tol);
        if (!match.snapped) return std::nullopt;
        return match.target;
    }

    // Candidate scale nearest to desired after clamping; nullopt when none.
    std::optional<double> closestScaleCandidate(double desired, const std::vector<double>& candidates, double minScale, double maxScale) {
        std::optional<double> best;
        double bestDelta = std::numeric_limits<double>::infinity();
        for (const double candidate : candidates) {
            if (!std::isfinite(candidate)) continue;
            const double clamped = clampValue(candidate, minScale, maxScale);
            const double delta = std::abs(clamped - desired);
            if (delta < bestDelta) {
                bestDelta = delta;
                best = clamped;
            }
        }
        return best;
    }
} // namespace

std::array<double, 3> horizontalAnchors(const NormRect& rect, double dx) noexcept {
    const double left = rect.x + dx;
    return {left, left + rect.w * 0.5, left + rect.w};
}

std::array<double, 3> verticalAnchors(const NormRect& rect, double dy) noexcept {
    const double top = rect.y + dy;
    return {top, top + rect.h * 0.5, top + rect.h};
}

std::vector<double> collectHorizontalAnchors(const std::vector<NormRect>& rects, double dx) {
    std::vector<double> out;
    out.reserve(rects.size() * 3);
    for (const NormRect& r : rects) {
        const auto anchors = horizontalAnchors(r, dx);
        out.insert(out.end(), anchors.begin(), anchors.end());
    }
    return out;
}

std::vector<double> collectVerticalAnchors(const std::vector<NormRect>& rects, double dy) {
    std::vector<double> out;
    out.reserve(rects.size() * 3);
    for (const NormRect& r : rects) {
        const auto anchors = verticalAnchors(r, dy);
        out.insert(out.end(), anchors.begin(), anchors.end());
    }
    return out;
}

SnapMatch findClosestSnap(const std::vector<double>& moving, const std::vector<double>& targets, double threshold) {
    SnapMatch match;
    if (moving.empty() || targets.empty() || !(threshold > 0.0)) return match;

    SnapAxisBest best;
    for (const double m : moving) {
        considerAxis(m, targets, threshold, best);
    }
    if (best.snapped) {
        match.snapped = true;
        match.offset = best.offset;
        match.target = best.target;
    }
    return match;
}

DragSnap snapDragDelta(
    double proposedDx,
    double proposedDy,
    const std::vector<NormRect>& movingRects,
    const std::vector<NormRect>& targetRects,
    const SnapThresholds& thresholds) {
    DragSnap out;
    out.dx = proposedDx;
    out.dy = proposedDy;
    if (movingRects.empty() || targetRects.empty()) return out;

    const SnapMatch snapX = findClosestSnap(
        collectHorizontalAnchors(movingRects, proposedDx), collectHorizontalAnchors(targetRects), thresholds.x);
    const SnapMatch snapY = findClosestSnap(
        collectVerticalAnchors(movingRects, proposedDy), collectVerticalAnchors(targetRects), thresholds.y);

    if (snapX.snapped) {
        out.dx += snapX.offset;
        out.guides.x = snapX.target;
    }
    if (snapY.snapped) {
        out.dy += snapY.offset;
        out.guides.y = snapY.target;
    }
    return out;
}

ResizeSnap snapUniformResizeScale(
    double desiredScale,
    double minScale,
    double maxScale,
    const NormRect& bounds,
    const std::vector<NormRect>& targetRects,
    const SnapThresholds& thresholds) {
    ResizeSnap out;
    const double clampedDesired = clampValue(desiredScale, minScale, maxScale);
    out.scale = clampedDesired;
    if (targetRects.empty()) return out;

    const std::vector<double> targetsX = collectHorizontalAnchors(targetRects);
    const std::vector<double> targetsY = collectVerticalAnchors(targetRects);

    const double desiredRight = bounds.x + bounds.w * clampedDesired;
    const double desiredCenterX = bounds.x + bounds.w * clampedDesired * 0.5;
    const double desiredBottom = bounds.y + bounds.h * clampedDesired;
    const double desiredCenterY = bounds.y + bounds.h * clampedDesired * 0.5;

    // Scales that would put the bounds' right/bottom edge or center exactly
    // on a target.
    std::vector<double> xCandidates;
    if (bounds.w > 0.0) {
        for (const double target : targetsX) {
            if (std::abs(desiredRight - target) <= thresholds.x) {
                xCandidates.push_back((target - bounds.x) / bounds.w);
            }
            if (std::abs(desiredCenterX - target) <= thresholds.x) {
                xCandidates.push_back(2.0 * (target - bounds.x) / bounds.w);
            }
        }
    }
    std::vector<double> yCandidates;
    if (bounds.h > 0.0) {
        for (const double target : targetsY) {
            if (std::abs(desiredBottom - target) <= thresholds.y) {
                yCandidates.push_back((target - bounds.y) / bounds.h);
            }
            if (std::abs(desiredCenterY - target) <= thresholds.y) {
                yCandidates.push_back(2.0 * (target - bounds.y) / bounds.h);
            }
        }
    }

    const std::optional<double> bestX = closestScaleCandidate(clampedDesired, xCandidates, minScale, maxScale);
    const std::optional<double> bestY = closestScaleCandidate(clampedDesired, yCandidates, minScale, maxScale);

    double snapped = clampedDesired;
    if (bestX && bestY) {
        snapped = std::abs(*bestX - clampedDesired) <= std::abs(*bestY - clampedDesired) ? *bestX : *bestY;
    } else if (bestX) {
        snapped = *bestX;
    } else if (bestY) {
        snapped = *bestY;
    }
    out.scale = snapped;

    const NormRect scaled{bounds.x, bounds.y, bounds.w * snapped, bounds.h * snapped};
    const auto anchorsX = horizontalAnchors(scaled);
    const auto anchorsY = verticalAnchors(scaled);
    const std::vector<double> movingX(anchorsX.begin(), anchorsX.end());
    const std::vector<double> movingY(anchorsY.begin(), anchorsY.end());
    out.guides.x = closestGuide(movingX, targetsX, thresholds.x);
    out.guides.y = closestGuide(movingY, targetsY, thresholds.y);
    return out;
}

} // namespace folio::interaction
