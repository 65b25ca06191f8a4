#pragma once

/**
 * @file interaction_constants.h
 * @brief Constants for the drag, resize and crop-edge interactions.
 *
 * Pixel values are converted to normalized units against the safe area of
 * the canvas the operator is looking at.
 */

namespace folio::interaction_constants {

// =============================================================================
// Snapping
// =============================================================================

/// Default alignment snap distance (screen pixels)
constexpr double DEFAULT_SNAP_THRESHOLD_PX = 8.0;

/// A solved snap candidate must land this close to its target to be accepted
constexpr double SNAP_LANDING_EPSILON = 1e-6;

// =============================================================================
// Editor canvas
// =============================================================================

/// On-screen editing canvas (height = round(600 * 1.71 / 1.28))
constexpr double CANVAS_DISPLAY_WIDTH_PX = 600.0;
constexpr double CANVAS_DISPLAY_HEIGHT_PX = 802.0;

} // namespace folio::interaction_constants
