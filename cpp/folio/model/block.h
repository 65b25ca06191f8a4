#pragma once

#include "folio/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace folio {

// ============================================================================
// Enumerations
// ============================================================================

// Order matches the alternatives of BlockPayload.
enum class BlockKind : std::uint8_t {
    Text = 0,
    Image = 1,
    Svg = 2,
    Link = 3,
    Shape = 4,
};

enum class TextAlign : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

enum class ObjectFit : std::uint8_t {
    Cover = 0,
    Contain = 1,
};

enum class ImageShape : std::uint8_t {
    Rect = 0,
    Circle = 1,
};

enum class ShapeKind : std::uint8_t {
    Rect = 0,
    Ellipse = 1,
    Line = 2,
};

// ============================================================================
// Crop
// ============================================================================

// Fractions of the source trimmed from each edge, relative to the block box.
struct VisualCrop {
    double left{0.0};
    double right{0.0};
    double top{0.0};
    double bottom{0.0};
};

// ============================================================================
// Payloads
// ============================================================================

struct TextStyle {
    double fontSize{24.0};
    int fontWeight{400};
    TextAlign textAlign{TextAlign::Left};
    std::string color{"#000000"};
    double lineHeight{1.4};
    std::string fontFamily{"sans-serif"};
};

struct TextPayload {
    std::string content;
    TextStyle style;
};

struct ImagePayload {
    std::string assetPath;
    ObjectFit objectFit{ObjectFit::Cover};
    ImageShape shape{ImageShape::Rect};
    std::optional<VisualCrop> crop;
};

struct SvgPayload {
    std::string svgCode;
    ObjectFit objectFit{ObjectFit::Contain};
    std::optional<VisualCrop> crop;
    // Intrinsic width/height hint supplied by the asset collaborator.
    std::optional<double> intrinsicAspectRatio;
};

struct LinkStyle {
    double fontSize{18.0};
    int fontWeight{600};
    TextAlign textAlign{TextAlign::Center};
    std::string textColor{"#ffffff"};
    std::string backgroundColor{"#1f2937"};
    std::string fontFamily{"sans-serif"};
    double borderRadius{8.0};
};

struct LinkPayload {
    std::string label{"Open Link"};
    std::string url;
    LinkStyle style;
};

struct ShapePayload {
    ShapeKind kind{ShapeKind::Rect};
    std::string fill{"#d9d9d9"};
    std::string stroke{"#000000"};
    double strokeWidth{0.0};
};

using BlockPayload = std::variant<TextPayload, ImagePayload, SvgPayload, LinkPayload, ShapePayload>;

// ============================================================================
// Block / page side
// ============================================================================

struct BlockOutline {
    std::string color{"#000000"};
    double width{1.0};
};

struct Block {
    std::string id;
    double x{0.0};
    double y{0.0};
    double w{0.0};
    double h{0.0};
    std::int32_t zIndex{0};
    double aspectRatio{1.0};
    std::optional<BlockOutline> outline;
    std::optional<double> cornerRadius;
    std::optional<std::string> linkUrl;
    BlockPayload payload;

    BlockKind kind() const noexcept { return static_cast<BlockKind>(payload.index()); }

    NormRect rect() const noexcept { return NormRect{x, y, w, h}; }
    void setRect(const NormRect& r) noexcept {
        x = r.x;
        y = r.y;
        w = r.w;
        h = r.h;
    }

    TextPayload* text() noexcept { return std::get_if<TextPayload>(&payload); }
    const TextPayload* text() const noexcept { return std::get_if<TextPayload>(&payload); }
    ImagePayload* image() noexcept { return std::get_if<ImagePayload>(&payload); }
    const ImagePayload* image() const noexcept { return std::get_if<ImagePayload>(&payload); }
    SvgPayload* svg() noexcept { return std::get_if<SvgPayload>(&payload); }
    const SvgPayload* svg() const noexcept { return std::get_if<SvgPayload>(&payload); }
    LinkPayload* link() noexcept { return std::get_if<LinkPayload>(&payload); }
    const LinkPayload* link() const noexcept { return std::get_if<LinkPayload>(&payload); }
    ShapePayload* shape() noexcept { return std::get_if<ShapePayload>(&payload); }
    const ShapePayload* shape() const noexcept { return std::get_if<ShapePayload>(&payload); }
};

struct PaddingConfig {
    double padXRatio{0.08};
    double padYRatio{0.10};
};

struct PageSideLayout {
    std::vector<Block> blocks;
    std::optional<std::string> backgroundColor;
    std::optional<PaddingConfig> paddingOverride;
};

// ============================================================================
// Helpers
// ============================================================================

const char* blockKindName(BlockKind kind) noexcept;
std::optional<BlockKind> parseBlockKind(const std::string& name);

const char* textAlignName(TextAlign align) noexcept;
std::optional<TextAlign> parseTextAlign(const std::string& name);
const char* objectFitName(ObjectFit fit) noexcept;
std::optional<ObjectFit> parseObjectFit(const std::string& name);
const char* imageShapeName(ImageShape shape) noexcept;
std::optional<ImageShape> parseImageShape(const std::string& name);
const char* shapeKindName(ShapeKind kind) noexcept;
std::optional<ShapeKind> parseShapeKind(const std::string& name);

// Image and svg blocks crop on edge drags; the rest plain-resize.
bool isCroppableKind(BlockKind kind) noexcept;

// Crop of an image/svg block, or nullptr for other kinds / no crop.
const VisualCrop* blockCrop(const Block& block) noexcept;
// Stores the crop on image/svg blocks; ignored for other kinds.
void setBlockCrop(Block& block, const std::optional<VisualCrop>& crop);

bool isCircleImage(const Block& block) noexcept;

Block* findBlock(PageSideLayout& layout, const std::string& id) noexcept;
const Block* findBlock(const PageSideLayout& layout, const std::string& id) noexcept;

std::int32_t maxZIndex(const PageSideLayout& layout) noexcept;

// Paint order: ascending zIndex, ties broken by position in the collection.
std::vector<const Block*> blocksInPaintOrder(const PageSideLayout& layout);

} // namespace folio
