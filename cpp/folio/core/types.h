#pragma once

#include <cstdint>

// Lightweight geometry types and error codes used across the layout engine.

namespace folio {

enum class FolioError : std::uint32_t {
    Ok = 0,
    InvalidJson = 1,
    InvalidOperation = 2,
    BlockLimitReached = 3,
    UnknownBlock = 4,
    GestureActive = 5,
    NoGesture = 6,
};

const char* folioErrorName(FolioError error) noexcept;

// Axis-aligned rectangle in normalized page coordinates (top-left origin).
struct NormRect {
    double x{0.0};
    double y{0.0};
    double w{0.0};
    double h{0.0};

    double right() const noexcept { return x + w; }
    double bottom() const noexcept { return y + h; }
    double centerX() const noexcept { return x + w * 0.5; }
    double centerY() const noexcept { return y + h * 0.5; }
};

// Pixel-space rectangle handed to the rendering collaborator.
struct PixelRect {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
};

// Pointer position in canvas pixels.
struct PointerPos {
    double x{0.0};
    double y{0.0};
};

} // namespace folio
