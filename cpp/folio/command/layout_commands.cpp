#include "folio/command/layout_commands.h"

#include "folio/core/constants.h"
#include "folio/core/logging.h"
#include "folio/core/math_utils.h"
#include "folio/interaction/drag_engine.h"
#include "folio/interaction/gesture_session.h"
#include "folio/interaction/resize_engine.h"
#include "folio/model/aspect_ratio.h"
#include "folio/model/block_factory.h"
#include "folio/model/visual_crop.h"
#include "folio/validation/layout_validator.h"
#include <algorithm>

namespace folio {

namespace {

CommandResult ok(PageSideLayout layout) {
    return CommandResult{FolioError::Ok, std::move(layout)};
}

CommandResult fail(FolioError error, const PageSideLayout& layout) {
    FOLIO_LOG_DEBUG("applyLayoutCommand: rejected (%s)", folioErrorName(error));
    return CommandResult{error, layout};
}

CommandResult applyTranslate(const PageSideLayout& layout, const TranslateCommand& cmd) {
    const auto origins = interaction::captureOrigins(layout, cmd.ids);
    if (origins.empty()) return fail(FolioError::UnknownBlock, layout);
    interaction::DragResult moved = interaction::applyDragDelta(layout, origins, cmd.dx, cmd.dy, {});
    return ok(std::move(moved.layout));
}

CommandResult applyScale(const PageSideLayout& layout, const ScaleCommand& cmd) {
    const auto origins = interaction::captureOrigins(layout, cmd.ids);
    if (origins.empty()) return fail(FolioError::UnknownBlock, layout);

    const NormRect bounds = interaction::unionBounds(origins);
    const interaction::ScaleLimits limits =
        interaction::computeScaleLimitsAbout(bounds, origins, cmd.anchorX, cmd.anchorY);
    const double scale = clampValue(finiteOr(cmd.factor, 1.0), limits.minScale, limits.maxScale);

    PageSideLayout next = layout;
    interaction::scaleOriginsAbout(next, origins, scale, cmd.anchorX, cmd.anchorY);
    return ok(std::move(next));
}

CommandResult applySetCrop(const PageSideLayout& layout, const SetCropCommand& cmd) {
    const Block* current = findBlock(layout, cmd.id);
    if (!current) return fail(FolioError::UnknownBlock, layout);
    if (!isCroppableKind(current->kind())) return fail(FolioError::InvalidOperation, layout);

    const std::optional<VisualCrop> crop = cmd.crop ? toOptionalVisualCrop(*cmd.crop) : std::nullopt;
    const VisualCrop* nextCrop = crop ? &*crop : nullptr;

    PageSideLayout next = layout;
    Block* block = findBlock(next, cmd.id);
    const double ratio = isCircleImage(*block)
        ? 1.0
        : normalizeAspectRatio(applyVisualCropToAspectRatio(
            deriveVisualCropBaseAspectRatio(getBlockAspectRatio(*block), blockCrop(*block)), nextCrop));

    block->aspectRatio = ratio;
    block->h = clampValue(
        block->w / ratio, constants::MIN_STORED_BLOCK_SIZE, std::max(constants::MIN_STORED_BLOCK_SIZE, 1.0 - block->y));
    block->y = std::min(block->y, 1.0 - block->h);
    setBlockCrop(*block, crop);
    return ok(std::move(next));
}

CommandResult applyAddBlock(const PageSideLayout& layout, const AddBlockCommand& cmd) {
    if (!canAddBlock(layout)) return fail(FolioError::BlockLimitReached, layout);
    if (cmd.block.id.empty() || findBlock(layout, cmd.block.id)) return fail(FolioError::InvalidOperation, layout);
    PageSideLayout next = layout;
    next.blocks.push_back(cmd.block);
    return ok(std::move(next));
}

CommandResult applyDeleteBlock(const PageSideLayout& layout, const DeleteBlockCommand& cmd) {
    PageSideLayout next = layout;
    const auto it = std::find_if(next.blocks.begin(), next.blocks.end(),
        [&](const Block& b) { return b.id == cmd.id; });
    if (it == next.blocks.end()) return fail(FolioError::UnknownBlock, layout);
    next.blocks.erase(it);
    return ok(std::move(next));
}

} // namespace

CommandResult applyLayoutCommand(const PageSideLayout& layout, const LayoutCommand& command) {
    if (const auto* cmd = std::get_if<TranslateCommand>(&command)) return applyTranslate(layout, *cmd);
    if (const auto* cmd = std::get_if<ScaleCommand>(&command)) return applyScale(layout, *cmd);
    if (const auto* cmd = std::get_if<SetCropCommand>(&command)) return applySetCrop(layout, *cmd);
    if (const auto* cmd = std::get_if<AddBlockCommand>(&command)) return applyAddBlock(layout, *cmd);
    if (const auto* cmd = std::get_if<DeleteBlockCommand>(&command)) return applyDeleteBlock(layout, *cmd);
    if (std::holds_alternative<CommitCommand>(command)) return ok(validateLayout(layout).layout);
    return ok(layout);  // CancelCommand
}

} // namespace folio
