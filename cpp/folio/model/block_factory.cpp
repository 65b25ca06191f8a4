#include "folio/model/block_factory.h"

#include "folio/core/constants.h"
#include "folio/model/aspect_ratio.h"

namespace folio {

const char* const kDefaultSvgMarkup =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 24 24\" fill=\"#000000\">"
    "<path d=\"M12 2L2 22h20L12 2z\"/></svg>";

namespace {

Block makeBase(const std::string& id, const PageSideLayout& layout, double x, double y, double w, double h) {
    Block block;
    block.id = id;
    block.x = x;
    block.y = y;
    block.w = w;
    block.h = h;
    block.zIndex = maxZIndex(layout) + 1;
    block.aspectRatio = normalizeAspectRatio(w / h);
    return block;
}

} // namespace

bool canAddBlock(const PageSideLayout& layout) noexcept {
    return layout.blocks.size() < constants::MAX_BLOCKS_PER_SIDE;
}

Block makeDefaultBlock(BlockKind kind, const std::string& id, const PageSideLayout& layout) {
    switch (kind) {
        case BlockKind::Text: {
            Block block = makeBase(id, layout, 0.05, 0.05, 0.4, 0.15);
            TextPayload text;
            text.content = "New text";
            block.payload = text;
            return block;
        }
        case BlockKind::Image: {
            Block block = makeBase(id, layout, 0.05, 0.05, 0.4, 0.3);
            block.payload = ImagePayload{};
            return block;
        }
        case BlockKind::Svg: {
            Block block = makeBase(id, layout, 0.05, 0.05, 0.2, 0.2);
            SvgPayload svg;
            svg.svgCode = kDefaultSvgMarkup;
            if (const auto ratio = parseSvgAspectRatio(svg.svgCode)) {
                svg.intrinsicAspectRatio = *ratio;
            }
            block.payload = svg;
            return block;
        }
        case BlockKind::Link: {
            Block block = makeBase(id, layout, 0.05, 0.05, 0.3, 0.08);
            block.payload = LinkPayload{};
            return block;
        }
        case BlockKind::Shape: {
            Block block = makeBase(id, layout, 0.05, 0.05, 0.3, 0.2);
            block.payload = ShapePayload{};
            return block;
        }
    }
    return makeBase(id, layout, 0.05, 0.05, 0.4, 0.15);
}

Block makeProfileImageBlock(const std::string& id, const std::string& assetPath, const PageSideLayout& layout) {
    Block block = makeBase(id, layout, 0.35, 0.35, 0.3, 0.3);
    ImagePayload image;
    image.assetPath = assetPath;
    image.shape = ImageShape::Circle;
    block.payload = image;
    return block;
}

} // namespace folio
