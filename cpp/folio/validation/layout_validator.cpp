#include "folio/validation/layout_validator.h"

#include "folio/core/constants.h"
#include "folio/core/logging.h"
#include "folio/core/math_utils.h"
#include "folio/model/aspect_ratio.h"
#include "folio/model/links.h"
#include "folio/model/paper_tone.h"
#include "folio/model/padding.h"
#include "folio/model/visual_crop.h"
#include <cmath>

namespace folio {

using namespace folio::constants;

namespace {

std::string orDefault(const std::string& value, const char* fallback) {
    return value.empty() ? std::string(fallback) : value;
}

int validateFontWeight(int weight) noexcept {
    const double rounded = std::round(static_cast<double>(weight) / 100.0) * 100.0;
    return static_cast<int>(clampValue(rounded, MIN_FONT_WEIGHT, MAX_FONT_WEIGHT));
}

std::optional<VisualCrop> validateCrop(const std::optional<VisualCrop>& crop) {
    if (!crop) return std::nullopt;
    return toOptionalVisualCrop(*crop);
}

double resolveAspectRatio(const Block& block, const NormRect& rect) {
    const double boxRatio = rect.h > 0.0 ? rect.w / rect.h : 1.0;
    if (isFinitePositive(block.aspectRatio)) {
        return normalizeAspectRatio(block.aspectRatio, boxRatio);
    }
    if (const SvgPayload* svg = block.svg()) {
        if (svg->intrinsicAspectRatio && isFinitePositive(*svg->intrinsicAspectRatio)) {
            const double base = imagePixelRatioToBlockRatio(*svg->intrinsicAspectRatio);
            const VisualCrop* crop = svg->crop ? &*svg->crop : nullptr;
            return normalizeAspectRatio(applyVisualCropToAspectRatio(base, crop), boxRatio);
        }
    }
    return normalizeAspectRatio(boxRatio);
}

void validatePayload(Block& block) {
    switch (block.kind()) {
        case BlockKind::Text: {
            TextPayload* text = block.text();
            text->style = validateTextStyle(text->style);
            break;
        }
        case BlockKind::Image: {
            ImagePayload* image = block.image();
            image->crop = validateCrop(image->crop);
            break;
        }
        case BlockKind::Svg: {
            SvgPayload* svg = block.svg();
            svg->crop = validateCrop(svg->crop);
            if (svg->intrinsicAspectRatio) {
                if (isFinitePositive(*svg->intrinsicAspectRatio)) {
                    svg->intrinsicAspectRatio = normalizeAspectRatio(*svg->intrinsicAspectRatio);
                } else {
                    svg->intrinsicAspectRatio.reset();
                }
            }
            break;
        }
        case BlockKind::Link: {
            LinkPayload* link = block.link();
            link->label = sanitizeLinkLabel(link->label);
            link->url = sanitizeLinkUrl(link->url);
            link->style = validateLinkStyle(link->style);
            break;
        }
        case BlockKind::Shape: {
            ShapePayload* shape = block.shape();
            *shape = validateShapePayload(*shape);
            break;
        }
    }
}

} // namespace

NormRect clampNormalizedRect(const NormRect& rect) noexcept {
    // x, y stop short of the far edge so the minimum size always fits.
    const double x = clampValue(finiteOr(rect.x, 0.0), 0.0, 1.0 - MIN_STORED_BLOCK_SIZE);
    const double y = clampValue(finiteOr(rect.y, 0.0), 0.0, 1.0 - MIN_STORED_BLOCK_SIZE);
    const double w = clampValue(finiteOr(rect.w, MIN_STORED_BLOCK_SIZE), MIN_STORED_BLOCK_SIZE, 1.0 - x);
    const double h = clampValue(finiteOr(rect.h, MIN_STORED_BLOCK_SIZE), MIN_STORED_BLOCK_SIZE, 1.0 - y);
    return NormRect{x, y, w, h};
}

TextStyle validateTextStyle(const TextStyle& style) {
    const TextStyle defaults;
    TextStyle out;
    out.fontSize = clampValue(finiteOr(style.fontSize, defaults.fontSize), MIN_FONT_SIZE, MAX_FONT_SIZE);
    out.fontWeight = validateFontWeight(style.fontWeight);
    out.textAlign = style.textAlign;
    out.color = orDefault(style.color, "#000000");
    out.lineHeight = clampValue(finiteOr(style.lineHeight, defaults.lineHeight), MIN_LINE_HEIGHT, MAX_LINE_HEIGHT);
    out.fontFamily = orDefault(style.fontFamily, "sans-serif");
    return out;
}

LinkStyle validateLinkStyle(const LinkStyle& style) {
    const LinkStyle defaults;
    LinkStyle out;
    out.fontSize = clampValue(finiteOr(style.fontSize, defaults.fontSize), MIN_LINK_FONT_SIZE, MAX_LINK_FONT_SIZE);
    out.fontWeight = validateFontWeight(style.fontWeight);
    out.textAlign = style.textAlign;
    out.textColor = style.textColor.empty() ? defaults.textColor : style.textColor;
    out.backgroundColor = style.backgroundColor.empty() ? defaults.backgroundColor : style.backgroundColor;
    out.fontFamily = orDefault(style.fontFamily, "sans-serif");
    out.borderRadius = clampValue(
        finiteOr(style.borderRadius, defaults.borderRadius), MIN_LINK_BORDER_RADIUS, MAX_LINK_BORDER_RADIUS);
    return out;
}

ShapePayload validateShapePayload(const ShapePayload& shape) {
    const ShapePayload defaults;
    ShapePayload out;
    out.kind = shape.kind;
    out.fill = shape.fill.empty() ? defaults.fill : shape.fill;
    out.stroke = shape.stroke.empty() ? defaults.stroke : shape.stroke;
    out.strokeWidth = clampValue(
        finiteOr(shape.strokeWidth, defaults.strokeWidth), MIN_SHAPE_STROKE_WIDTH, MAX_SHAPE_STROKE_WIDTH);
    return out;
}

Block validateBlock(const Block& block) {
    Block out = block;
    const NormRect rect = clampNormalizedRect(block.rect());
    out.setRect(rect);
    out.aspectRatio = resolveAspectRatio(block, rect);

    if (out.outline) {
        out.outline->color = orDefault(out.outline->color, "#000000");
        out.outline->width = clampValue(
            finiteOr(out.outline->width, MIN_OUTLINE_WIDTH), MIN_OUTLINE_WIDTH, MAX_OUTLINE_WIDTH);
    }
    if (out.cornerRadius) {
        out.cornerRadius = clampValue(finiteOr(*out.cornerRadius, 0.0), MIN_CORNER_RADIUS, MAX_CORNER_RADIUS);
    }
    if (out.linkUrl) {
        std::string sanitized = sanitizeLinkUrl(*out.linkUrl);
        if (sanitized.empty()) {
            out.linkUrl.reset();
        } else {
            out.linkUrl = std::move(sanitized);
        }
    }

    validatePayload(out);
    return out;
}

ValidationResult validateLayout(const PageSideLayout& layout) {
    ValidationResult result;
    std::size_t count = layout.blocks.size();

    if (count > MAX_BLOCKS_PER_SIDE) {
        result.errors.push_back(
            "Maximum " + std::to_string(MAX_BLOCKS_PER_SIDE) + " blocks per side. "
            + std::to_string(count) + " blocks found.");
        FOLIO_LOG_WARN("validateLayout: truncating %zu blocks to %zu", count, MAX_BLOCKS_PER_SIDE);
        count = MAX_BLOCKS_PER_SIDE;
    }

    result.layout.blocks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        result.layout.blocks.push_back(validateBlock(layout.blocks[i]));
    }

    if (layout.paddingOverride) {
        const PaddingConfig& pad = *layout.paddingOverride;
        result.layout.paddingOverride = PaddingConfig{
            clampValue(finiteOr(pad.padXRatio, DEFAULT_PAD_X_RATIO), MIN_PADDING_RATIO, MAX_PADDING_RATIO),
            clampValue(finiteOr(pad.padYRatio, DEFAULT_PAD_Y_RATIO), MIN_PADDING_RATIO, MAX_PADDING_RATIO),
        };
    }

    result.layout.backgroundColor = normalizePaperBackground(layout.backgroundColor);
    result.valid = result.errors.empty();
    return result;
}

} // namespace folio
