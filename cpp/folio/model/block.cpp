#include "folio/model/block.h"

#include <algorithm>

namespace folio {

const char* blockKindName(BlockKind kind) noexcept {
    switch (kind) {
        case BlockKind::Text: return "text";
        case BlockKind::Image: return "image";
        case BlockKind::Svg: return "svg";
        case BlockKind::Link: return "link";
        case BlockKind::Shape: return "shape";
    }
    return "unknown";
}

std::optional<BlockKind> parseBlockKind(const std::string& name) {
    if (name == "text") return BlockKind::Text;
    if (name == "image") return BlockKind::Image;
    if (name == "svg") return BlockKind::Svg;
    if (name == "link") return BlockKind::Link;
    if (name == "shape") return BlockKind::Shape;
    return std::nullopt;
}

const char* textAlignName(TextAlign align) noexcept {
    switch (align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
    }
    return "left";
}

std::optional<TextAlign> parseTextAlign(const std::string& name) {
    if (name == "left") return TextAlign::Left;
    if (name == "center") return TextAlign::Center;
    if (name == "right") return TextAlign::Right;
    return std::nullopt;
}

const char* objectFitName(ObjectFit fit) noexcept {
    switch (fit) {
        case ObjectFit::Cover: return "cover";
        case ObjectFit::Contain: return "contain";
    }
    return "cover";
}

std::optional<ObjectFit> parseObjectFit(const std::string& name) {
    if (name == "cover") return ObjectFit::Cover;
    if (name == "contain") return ObjectFit::Contain;
    return std::nullopt;
}

const char* imageShapeName(ImageShape shape) noexcept {
    switch (shape) {
        case ImageShape::Rect: return "rect";
        case ImageShape::Circle: return "circle";
    }
    return "rect";
}

std::optional<ImageShape> parseImageShape(const std::string& name) {
    if (name == "rect") return ImageShape::Rect;
    if (name == "circle") return ImageShape::Circle;
    return std::nullopt;
}

const char* shapeKindName(ShapeKind kind) noexcept {
    switch (kind) {
        case ShapeKind::Rect: return "rect";
        case ShapeKind::Ellipse: return "ellipse";
        case ShapeKind::Line: return "line";
    }
    return "rect";
}

std::optional<ShapeKind> parseShapeKind(const std::string& name) {
    if (name == "rect") return ShapeKind::Rect;
    if (name == "ellipse") return ShapeKind::Ellipse;
    if (name == "line") return ShapeKind::Line;
    return std::nullopt;
}

bool isCroppableKind(BlockKind kind) noexcept {
    switch (kind) {
        case BlockKind::Image:
        case BlockKind::Svg:
            return true;
        case BlockKind::Text:
        case BlockKind::Link:
        case BlockKind::Shape:
            return false;
    }
    return false;
}

const VisualCrop* blockCrop(const Block& block) noexcept {
    switch (block.kind()) {
        case BlockKind::Image: {
            const auto& crop = block.image()->crop;
            return crop ? &*crop : nullptr;
        }
        case BlockKind::Svg: {
            const auto& crop = block.svg()->crop;
            return crop ? &*crop : nullptr;
        }
        case BlockKind::Text:
        case BlockKind::Link:
        case BlockKind::Shape:
            break;
    }
    return nullptr;
}

void setBlockCrop(Block& block, const std::optional<VisualCrop>& crop) {
    switch (block.kind()) {
        case BlockKind::Image:
            block.image()->crop = crop;
            break;
        case BlockKind::Svg:
            block.svg()->crop = crop;
            break;
        case BlockKind::Text:
        case BlockKind::Link:
        case BlockKind::Shape:
            break;
    }
}

bool isCircleImage(const Block& block) noexcept {
    const ImagePayload* image = block.image();
    return image != nullptr && image->shape == ImageShape::Circle;
}

Block* findBlock(PageSideLayout& layout, const std::string& id) noexcept {
    for (auto& block : layout.blocks) {
        if (block.id == id) return &block;
    }
    return nullptr;
}

const Block* findBlock(const PageSideLayout& layout, const std::string& id) noexcept {
    for (const auto& block : layout.blocks) {
        if (block.id == id) return &block;
    }
    return nullptr;
}

std::int32_t maxZIndex(const PageSideLayout& layout) noexcept {
    std::int32_t maxZ = 0;
    for (const auto& block : layout.blocks) {
        maxZ = std::max(maxZ, block.zIndex);
    }
    return maxZ;
}

std::vector<const Block*> blocksInPaintOrder(const PageSideLayout& layout) {
    std::vector<const Block*> ordered;
    ordered.reserve(layout.blocks.size());
    for (const auto& block : layout.blocks) {
        ordered.push_back(&block);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Block* a, const Block* b) {
        return a->zIndex < b->zIndex;
    });
    return ordered;
}

} // namespace folio
