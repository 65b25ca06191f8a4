#pragma once

/**
 * @file constants.h
 * @brief Layout limits shared by the model, the validator and the
 * interaction engines.
 *
 * All sizes are normalized to the page safe area ([0, 1] on each axis).
 */

#include <cstddef>

namespace folio::constants {

// =============================================================================
// Page side
// =============================================================================

/// Hard cap on blocks per page side (add-path guard and validator truncation)
constexpr std::size_t MAX_BLOCKS_PER_SIDE = 20;

/// Smallest width/height a stored block may have
constexpr double MIN_STORED_BLOCK_SIZE = 0.01;

/// Smallest width/height the interactive engines will produce
constexpr double MIN_INTERACTIVE_BLOCK_SIZE = 0.05;

/// Padding override bounds (fraction of canvas size)
constexpr double MIN_PADDING_RATIO = 0.0;
constexpr double MAX_PADDING_RATIO = 0.4;

// =============================================================================
// Aspect ratio (width / height in normalized units)
// =============================================================================

constexpr double MIN_ASPECT_RATIO = 0.05;
constexpr double MAX_ASPECT_RATIO = 20.0;

// =============================================================================
// Visual crop
// =============================================================================

constexpr double MIN_CROP_VALUE = 0.0;
constexpr double MAX_CROP_VALUE = 0.95;

/// Visible fraction that must remain on each axis
constexpr double MIN_VISUAL_CROP_REMAINING_RATIO = 0.05;

/// Below this, a crop fraction counts as zero
constexpr double CROP_ZERO_EPSILON = 1e-4;

// =============================================================================
// Block decorations
// =============================================================================

constexpr double MIN_OUTLINE_WIDTH = 1.0;
constexpr double MAX_OUTLINE_WIDTH = 100.0;
constexpr double MIN_CORNER_RADIUS = 0.0;
constexpr double MAX_CORNER_RADIUS = 500.0;

// =============================================================================
// Text style
// =============================================================================

constexpr double MIN_FONT_SIZE = 8.0;
constexpr double MAX_FONT_SIZE = 200.0;
constexpr int MIN_FONT_WEIGHT = 100;
constexpr int MAX_FONT_WEIGHT = 900;
constexpr double MIN_LINE_HEIGHT = 0.8;
constexpr double MAX_LINE_HEIGHT = 3.0;

// =============================================================================
// Link style
// =============================================================================

constexpr double MIN_LINK_FONT_SIZE = 10.0;
constexpr double MAX_LINK_FONT_SIZE = 96.0;
constexpr double MIN_LINK_BORDER_RADIUS = 0.0;
constexpr double MAX_LINK_BORDER_RADIUS = 200.0;
constexpr std::size_t MAX_LINK_LABEL_LENGTH = 120;

// =============================================================================
// Shape style
// =============================================================================

constexpr double MIN_SHAPE_STROKE_WIDTH = 0.0;
constexpr double MAX_SHAPE_STROKE_WIDTH = 100.0;

} // namespace folio::constants
