#include "folio/persistence/layout_json.h"

#include "folio/core/constants.h"
#include "folio/core/logging.h"
#include "folio/model/aspect_ratio.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace folio::persistence {

using nlohmann::json;

namespace {

constexpr double kMissingNumber = std::numeric_limits<double>::quiet_NaN();

double numberOr(const json& obj, const char* key, double fallback) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

std::optional<double> optionalNumber(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::string stringOr(const json& obj, const char* key, const std::string& fallback) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

const json* objectField(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

template <typename Enum, typename Parser>
Enum enumOr(const json& obj, const char* key, Enum fallback, Parser parse) {
    const std::optional<std::string> name = optionalString(obj, key);
    if (!name) return fallback;
    return parse(*name).value_or(fallback);
}

int fontWeightOr(const json& obj, const char* key, int fallback) {
    const double value = numberOr(obj, key, static_cast<double>(fallback));
    if (!std::isfinite(value)) return fallback;
    const double bounded = std::max(-1e6, std::min(1e6, value));
    return static_cast<int>(std::lround(bounded));
}

std::optional<VisualCrop> decodeCrop(const json& obj) {
    const json* crop = objectField(obj, "crop");
    if (!crop) return std::nullopt;
    VisualCrop out;
    out.left = numberOr(*crop, "left", 0.0);
    out.right = numberOr(*crop, "right", 0.0);
    out.top = numberOr(*crop, "top", 0.0);
    out.bottom = numberOr(*crop, "bottom", 0.0);
    return out;
}

json encodeCrop(const VisualCrop& crop) {
    return json{{"left", crop.left}, {"right", crop.right}, {"top", crop.top}, {"bottom", crop.bottom}};
}

TextStyle decodeTextStyle(const json* style) {
    TextStyle out;
    if (!style) return out;
    out.fontSize = numberOr(*style, "fontSize", out.fontSize);
    out.fontWeight = fontWeightOr(*style, "fontWeight", out.fontWeight);
    out.textAlign = enumOr(*style, "textAlign", out.textAlign, parseTextAlign);
    out.color = stringOr(*style, "color", out.color);
    out.lineHeight = numberOr(*style, "lineHeight", out.lineHeight);
    out.fontFamily = stringOr(*style, "fontFamily", out.fontFamily);
    return out;
}

LinkStyle decodeLinkStyle(const json* style) {
    LinkStyle out;
    if (!style) return out;
    out.fontSize = numberOr(*style, "fontSize", out.fontSize);
    out.fontWeight = fontWeightOr(*style, "fontWeight", out.fontWeight);
    out.textAlign = enumOr(*style, "textAlign", out.textAlign, parseTextAlign);
    out.textColor = stringOr(*style, "textColor", out.textColor);
    out.backgroundColor = stringOr(*style, "backgroundColor", out.backgroundColor);
    out.fontFamily = stringOr(*style, "fontFamily", out.fontFamily);
    out.borderRadius = numberOr(*style, "borderRadius", out.borderRadius);
    return out;
}

BlockPayload decodePayload(BlockKind kind, const json& obj) {
    switch (kind) {
        case BlockKind::Text: {
            TextPayload text;
            text.content = stringOr(obj, "content", "");
            text.style = decodeTextStyle(objectField(obj, "style"));
            return text;
        }
        case BlockKind::Image: {
            ImagePayload image;
            image.assetPath = stringOr(obj, "assetPath", "");
            image.objectFit = enumOr(obj, "objectFit", image.objectFit, parseObjectFit);
            image.shape = enumOr(obj, "shape", image.shape, parseImageShape);
            image.crop = decodeCrop(obj);
            return image;
        }
        case BlockKind::Svg: {
            SvgPayload svg;
            svg.svgCode = stringOr(obj, "svgCode", "");
            svg.objectFit = enumOr(obj, "objectFit", svg.objectFit, parseObjectFit);
            svg.crop = decodeCrop(obj);
            svg.intrinsicAspectRatio = optionalNumber(obj, "intrinsicAspectRatio");
            // Markup is parsed once, on import.
            if (!svg.intrinsicAspectRatio) svg.intrinsicAspectRatio = parseSvgAspectRatio(svg.svgCode);
            return svg;
        }
        case BlockKind::Link: {
            LinkPayload link;
            link.label = stringOr(obj, "label", link.label);
            link.url = stringOr(obj, "url", "");
            link.style = decodeLinkStyle(objectField(obj, "style"));
            return link;
        }
        case BlockKind::Shape: {
            ShapePayload shape;
            shape.kind = enumOr(obj, "shapeType", shape.kind, parseShapeKind);
            shape.fill = stringOr(obj, "fill", shape.fill);
            shape.stroke = stringOr(obj, "stroke", shape.stroke);
            shape.strokeWidth = numberOr(obj, "strokeWidth", shape.strokeWidth);
            return shape;
        }
    }
    return TextPayload{};
}

Block decodeBlock(BlockKind kind, const json& obj, std::size_t index) {
    Block block;
    block.id = stringOr(obj, "id", "");
    if (block.id.empty()) block.id = "block-" + std::to_string(index);
    block.x = numberOr(obj, "x", 0.0);
    block.y = numberOr(obj, "y", 0.0);
    block.w = numberOr(obj, "w", kMissingNumber);
    block.h = numberOr(obj, "h", kMissingNumber);

    const double z = numberOr(obj, "zIndex", static_cast<double>(index));
    block.zIndex = std::isfinite(z)
        ? static_cast<std::int32_t>(std::max(-1e9, std::min(1e9, std::round(z))))
        : static_cast<std::int32_t>(index);

    // Absent ratio: the validator falls back to the markup hint or the box.
    block.aspectRatio = numberOr(obj, "aspectRatio", kMissingNumber);

    if (const json* outline = objectField(obj, "outline")) {
        BlockOutline out;
        out.color = stringOr(*outline, "color", out.color);
        out.width = numberOr(*outline, "width", out.width);
        block.outline = out;
    }
    block.cornerRadius = optionalNumber(obj, "cornerRadius");
    block.linkUrl = optionalString(obj, "linkUrl");
    block.payload = decodePayload(kind, obj);
    return block;
}

void encodePayload(const Block& block, json& out) {
    switch (block.kind()) {
        case BlockKind::Text: {
            const TextPayload& text = *block.text();
            out["content"] = text.content;
            out["style"] = json{
                {"fontSize", text.style.fontSize},
                {"fontWeight", text.style.fontWeight},
                {"textAlign", textAlignName(text.style.textAlign)},
                {"color", text.style.color},
                {"lineHeight", text.style.lineHeight},
                {"fontFamily", text.style.fontFamily},
            };
            break;
        }
        case BlockKind::Image: {
            const ImagePayload& image = *block.image();
            out["assetPath"] = image.assetPath;
            out["objectFit"] = objectFitName(image.objectFit);
            out["shape"] = imageShapeName(image.shape);
            if (image.crop) out["crop"] = encodeCrop(*image.crop);
            break;
        }
        case BlockKind::Svg: {
            const SvgPayload& svg = *block.svg();
            out["svgCode"] = svg.svgCode;
            out["objectFit"] = objectFitName(svg.objectFit);
            if (svg.crop) out["crop"] = encodeCrop(*svg.crop);
            if (svg.intrinsicAspectRatio) out["intrinsicAspectRatio"] = *svg.intrinsicAspectRatio;
            break;
        }
        case BlockKind::Link: {
            const LinkPayload& link = *block.link();
            out["label"] = link.label;
            out["url"] = link.url;
            out["style"] = json{
                {"fontSize", link.style.fontSize},
                {"fontWeight", link.style.fontWeight},
                {"textAlign", textAlignName(link.style.textAlign)},
                {"textColor", link.style.textColor},
                {"backgroundColor", link.style.backgroundColor},
                {"fontFamily", link.style.fontFamily},
                {"borderRadius", link.style.borderRadius},
            };
            break;
        }
        case BlockKind::Shape: {
            const ShapePayload& shape = *block.shape();
            out["shapeType"] = shapeKindName(shape.kind);
            out["fill"] = shape.fill;
            out["stroke"] = shape.stroke;
            out["strokeWidth"] = shape.strokeWidth;
            break;
        }
    }
}

} // namespace

LayoutDecodeResult decodeLayoutJson(const json& doc) {
    LayoutDecodeResult result;
    if (!doc.is_object()) {
        result.errors.emplace_back("Layout must be an object.");
        FOLIO_LOG_WARN("decodeLayoutJson: document is not an object");
        return result;
    }

    result.layout.backgroundColor = optionalString(doc, "backgroundColor");
    if (const json* padding = objectField(doc, "paddingOverride")) {
        PaddingConfig pad;
        pad.padXRatio = numberOr(*padding, "padXRatio", pad.padXRatio);
        pad.padYRatio = numberOr(*padding, "padYRatio", pad.padYRatio);
        result.layout.paddingOverride = pad;
    }

    const auto blocksIt = doc.find("blocks");
    if (blocksIt == doc.end() || !blocksIt->is_array()) {
        result.errors.emplace_back("blocks must be an array.");
        FOLIO_LOG_WARN("decodeLayoutJson: blocks is not an array");
        return result;
    }

    const json& blocks = *blocksIt;
    std::size_t count = blocks.size();
    if (count > constants::MAX_BLOCKS_PER_SIDE) {
        result.errors.push_back(
            "Maximum " + std::to_string(constants::MAX_BLOCKS_PER_SIDE) + " blocks per side. "
            + std::to_string(count) + " blocks found.");
        FOLIO_LOG_WARN("decodeLayoutJson: truncating %zu blocks", count);
        count = constants::MAX_BLOCKS_PER_SIDE;
    }

    result.layout.blocks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const json& entry = blocks[i];
        if (!entry.is_object()) {
            result.errors.push_back("Block at index " + std::to_string(i) + " is not an object, dropped.");
            FOLIO_LOG_WARN("decodeLayoutJson: block %zu is not an object", i);
            continue;
        }
        const std::string type = stringOr(entry, "type", "");
        const std::optional<BlockKind> kind = parseBlockKind(type);
        if (!kind) {
            result.errors.push_back(
                "Unknown block type \"" + type + "\" at index " + std::to_string(i) + ", dropped.");
            FOLIO_LOG_WARN("decodeLayoutJson: unknown block type '%s' at %zu", type.c_str(), i);
            continue;
        }
        result.layout.blocks.push_back(decodeBlock(*kind, entry, i));
    }
    return result;
}

LayoutDecodeResult decodeLayoutJsonText(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        LayoutDecodeResult result;
        result.errors.emplace_back("Layout is not valid JSON.");
        FOLIO_LOG_WARN("decodeLayoutJsonText: parse failed");
        return result;
    }
    return decodeLayoutJson(doc);
}

json encodeBlockJson(const Block& block) {
    json out = json::object();
    out["id"] = block.id;
    out["type"] = blockKindName(block.kind());
    out["x"] = block.x;
    out["y"] = block.y;
    out["w"] = block.w;
    out["h"] = block.h;
    out["zIndex"] = block.zIndex;
    out["aspectRatio"] = block.aspectRatio;
    if (block.outline) {
        out["outline"] = json{{"color", block.outline->color}, {"width", block.outline->width}};
    }
    if (block.cornerRadius) out["cornerRadius"] = *block.cornerRadius;
    if (block.linkUrl) out["linkUrl"] = *block.linkUrl;
    encodePayload(block, out);
    return out;
}

json encodeLayoutJson(const PageSideLayout& layout) {
    json blocks = json::array();
    for (const Block& block : layout.blocks) {
        blocks.push_back(encodeBlockJson(block));
    }
    json out = json::object();
    out["blocks"] = std::move(blocks);
    if (layout.backgroundColor) out["backgroundColor"] = *layout.backgroundColor;
    if (layout.paddingOverride) {
        out["paddingOverride"] = json{
            {"padXRatio", layout.paddingOverride->padXRatio},
            {"padYRatio", layout.paddingOverride->padYRatio},
        };
    }
    return out;
}

std::string encodeLayoutJsonText(const PageSideLayout& layout, int indent) {
    // Malformed UTF-8 from a host string is replaced rather than thrown.
    return encodeLayoutJson(layout).dump(indent, ' ', false, json::error_handler_t::replace);
}

ValidationResult validateLayoutJson(const json& doc) {
    LayoutDecodeResult decoded = decodeLayoutJson(doc);
    ValidationResult result = validateLayout(decoded.layout);
    decoded.errors.insert(decoded.errors.end(), result.errors.begin(), result.errors.end());
    result.errors = std::move(decoded.errors);
    result.valid = result.errors.empty();
    return result;
}

ValidationResult validateLayoutJsonText(const std::string& text) {
    LayoutDecodeResult decoded = decodeLayoutJsonText(text);
    ValidationResult result = validateLayout(decoded.layout);
    decoded.errors.insert(decoded.errors.end(), result.errors.begin(), result.errors.end());
    result.errors = std::move(decoded.errors);
    result.valid = result.errors.empty();
    return result;
}

} // namespace folio::persistence
