#include "folio/editor/page_editor.h"

#include "folio/command/layout_commands.h"
#include "folio/core/logging.h"
#include "folio/interaction/crop_edge_engine.h"
#include "folio/interaction/drag_engine.h"
#include "folio/interaction/resize_engine.h"
#include "folio/model/block_factory.h"
#include "folio/persistence/layout_json.h"
#include "folio/validation/layout_validator.h"
#include <algorithm>

namespace folio {

PageEditor::PageEditor(persistence::LayoutStore& store, EditorOptions options)
    : store_(store), options_(options) {
    draft_ = validateLayout(draft_).layout;
}

FolioError PageEditor::setError(FolioError error) noexcept {
    lastError_ = error;
    return error;
}

FolioError PageEditor::checkCanEdit() {
    if (isGestureActive()) return setError(FolioError::GestureActive);
    return setError(FolioError::Ok);
}

void PageEditor::replaceLayout(PageSideLayout layout) {
    draft_ = std::move(layout);
    selection_.clear();
    endGesture();
}

// ==============================================================================
// Context
// ==============================================================================

FolioError PageEditor::openContext(const persistence::PageSideKey& key) {
    if (isGestureActive()) {
        FOLIO_LOG_DEBUG("openContext: cancelling active gesture");
        draft_ = base_;
        endGesture();
    }
    if (context_) {
        const FolioError flushed = flush();
        if (flushed != FolioError::Ok) return flushed;
    }

    FOLIO_LOG_DEBUG("openContext: %s p%d:%s",
        key.bookKey.c_str(), key.pageIndex, persistence::pageSideName(key.side));

    context_ = key;
    dirty_ = false;
    diagnostics_.clear();

    const std::optional<nlohmann::json> doc = store_.load(key);
    if (doc) {
        ValidationResult loaded = persistence::validateLayoutJson(*doc);
        diagnostics_ = std::move(loaded.errors);
        replaceLayout(std::move(loaded.layout));
    } else {
        replaceLayout(validateLayout(PageSideLayout{}).layout);
    }
    return setError(FolioError::Ok);
}

FolioError PageEditor::flush() {
    if (!context_) return setError(FolioError::InvalidOperation);
    if (!dirty_) return setError(FolioError::Ok);

    // An in-flight candidate is never persisted.
    const PageSideLayout& committed = isGestureActive() ? base_ : draft_;
    store_.save(*context_, validateLayout(committed).layout);
    dirty_ = false;
    FOLIO_LOG_DEBUG("flush: saved %zu blocks", committed.blocks.size());
    return setError(FolioError::Ok);
}

FolioError PageEditor::importLayoutJson(const std::string& text) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;

    const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) return setError(FolioError::InvalidJson);

    ValidationResult imported = persistence::validateLayoutJson(doc);
    diagnostics_ = std::move(imported.errors);
    replaceLayout(std::move(imported.layout));
    dirty_ = true;
    return setError(FolioError::Ok);
}

std::string PageEditor::exportLayoutJson() const {
    return persistence::encodeLayoutJsonText(validateLayout(draft_).layout);
}

// ==============================================================================
// Blocks & selection
// ==============================================================================

std::string PageEditor::allocateBlockId() {
    std::string id;
    do {
        id = "block-" + std::to_string(nextBlockId_++);
    } while (findBlock(draft_, id));
    return id;
}

std::string PageEditor::insertBlock(Block block) {
    const std::string id = block.id;
    CommandResult result = applyLayoutCommand(draft_, AddBlockCommand{std::move(block)});
    if (result.error != FolioError::Ok) {
        setError(result.error);
        return std::string();
    }
    draft_ = std::move(result.layout);
    selection_.assign(1, id);
    dirty_ = true;
    setError(FolioError::Ok);
    return id;
}

std::string PageEditor::addBlock(BlockKind kind) {
    if (checkCanEdit() != FolioError::Ok) return std::string();
    if (!canAddBlock(draft_)) {
        setError(FolioError::BlockLimitReached);
        return std::string();
    }
    return insertBlock(makeDefaultBlock(kind, allocateBlockId(), draft_));
}

std::string PageEditor::addProfileImage(const std::string& assetPath) {
    if (checkCanEdit() != FolioError::Ok) return std::string();
    if (!canAddBlock(draft_)) {
        setError(FolioError::BlockLimitReached);
        return std::string();
    }
    return insertBlock(makeProfileImageBlock(allocateBlockId(), assetPath, draft_));
}

FolioError PageEditor::deleteBlock(const std::string& id) {
    CommandResult result = applyLayoutCommand(draft_, DeleteBlockCommand{id});
    if (result.error != FolioError::Ok) return setError(result.error);
    draft_ = std::move(result.layout);

    // A gesture on the block turns into a no-op rather than an error.
    if (isGestureActive()) {
        CommandResult base = applyLayoutCommand(base_, DeleteBlockCommand{id});
        if (base.error == FolioError::Ok) base_ = std::move(base.layout);
    }
    selection_.erase(std::remove(selection_.begin(), selection_.end(), id), selection_.end());
    dirty_ = true;
    return setError(FolioError::Ok);
}

FolioError PageEditor::setPaddingOverride(const std::optional<PaddingConfig>& padding) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;
    draft_.paddingOverride = padding;
    draft_ = validateLayout(draft_).layout;
    dirty_ = true;
    return setError(FolioError::Ok);
}

FolioError PageEditor::setBackgroundColor(const std::optional<std::string>& color) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;
    draft_.backgroundColor = color;
    draft_ = validateLayout(draft_).layout;
    dirty_ = true;
    return setError(FolioError::Ok);
}

FolioError PageEditor::setSelection(const std::vector<std::string>& ids) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;
    bool dropped = false;
    selection_.clear();
    for (const std::string& id : ids) {
        if (!findBlock(draft_, id)) {
            dropped = true;
            continue;
        }
        if (std::find(selection_.begin(), selection_.end(), id) == selection_.end()) selection_.push_back(id);
    }
    return setError(dropped ? FolioError::UnknownBlock : FolioError::Ok);
}

// ==============================================================================
// Gestures
// ==============================================================================

GestureKind PageEditor::activeGesture() const noexcept {
    switch (gesture_.index()) {
        case 1: return GestureKind::Drag;
        case 2: return GestureKind::Resize;
        case 3: return GestureKind::CropEdge;
        default: return GestureKind::None;
    }
}

SafeArea PageEditor::safeArea() const {
    return computeSafeArea(options_.canvasWidthPx, options_.canvasHeightPx, draft_.paddingOverride);
}

FolioError PageEditor::beginDrag(const PointerPos& pointer) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;
    if (selection_.empty()) return setError(FolioError::InvalidOperation);

    std::optional<interaction::DragSession> session = interaction::beginDragSession(draft_, selection_, pointer);
    if (!session) return setError(FolioError::UnknownBlock);

    base_ = draft_;
    frame_ = interaction::makeGestureFrame(safeArea(), options_.snap);
    gesture_ = std::move(*session);
    hasCandidate_ = false;
    FOLIO_LOG_DEBUG("beginDrag: %zu blocks", selection_.size());
    return setError(FolioError::Ok);
}

FolioError PageEditor::beginResize(const PointerPos& pointer) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;
    if (selection_.empty()) return setError(FolioError::InvalidOperation);

    std::optional<interaction::ResizeSession> session = interaction::beginResizeSession(draft_, selection_, pointer);
    if (!session) return setError(FolioError::UnknownBlock);

    base_ = draft_;
    frame_ = interaction::makeGestureFrame(safeArea(), options_.snap);
    gesture_ = std::move(*session);
    hasCandidate_ = false;
    FOLIO_LOG_DEBUG("beginResize: %zu blocks", selection_.size());
    return setError(FolioError::Ok);
}

FolioError PageEditor::beginCropEdge(const std::string& id, CropEdge edge, const PointerPos& pointer) {
    if (checkCanEdit() != FolioError::Ok) return lastError_;

    std::optional<interaction::CropEdgeSession> session =
        interaction::beginCropEdgeSession(draft_, id, edge, pointer);
    if (!session) return setError(FolioError::UnknownBlock);

    base_ = draft_;
    frame_ = interaction::makeGestureFrame(safeArea(), options_.snap);
    gesture_ = std::move(*session);
    selection_.assign(1, id);
    hasCandidate_ = false;
    FOLIO_LOG_DEBUG("beginCropEdge: %s %s", id.c_str(), cropEdgeName(edge));
    return setError(FolioError::Ok);
}

FolioError PageEditor::updateGesture(const PointerPos& pointer) {
    bool applied = false;
    PageSideLayout candidate;
    interaction::SnapGuides guides;

    if (const auto* drag = std::get_if<interaction::DragSession>(&gesture_)) {
        interaction::DragResult result = interaction::computeDrag(base_, *drag, pointer, frame_);
        applied = result.applied;
        candidate = std::move(result.layout);
        guides = result.guides;
    } else if (const auto* resize = std::get_if<interaction::ResizeSession>(&gesture_)) {
        interaction::ResizeResult result = interaction::computeResize(base_, *resize, pointer, frame_);
        applied = result.applied;
        candidate = std::move(result.layout);
        guides = result.guides;
    } else if (const auto* crop = std::get_if<interaction::CropEdgeSession>(&gesture_)) {
        interaction::CropEdgeResult result = interaction::computeCropEdge(base_, *crop, pointer, frame_);
        applied = result.applied;
        candidate = std::move(result.layout);
        guides = result.guides;
    } else {
        return setError(FolioError::NoGesture);
    }

    if (applied) {
        draft_ = std::move(candidate);
        guides_ = guides;
    } else {
        draft_ = base_;
        guides_ = interaction::SnapGuides{};
    }
    hasCandidate_ = applied;
    return setError(FolioError::Ok);
}

FolioError PageEditor::commitGesture() {
    if (!isGestureActive()) return setError(FolioError::NoGesture);

    if (hasCandidate_) {
        draft_ = validateLayout(draft_).layout;
        dirty_ = true;
    } else {
        draft_ = base_;
    }
    FOLIO_LOG_DEBUG("commitGesture: %s", hasCandidate_ ? "applied" : "no-op");
    endGesture();
    return setError(FolioError::Ok);
}

FolioError PageEditor::cancelGesture() {
    if (!isGestureActive()) return setError(FolioError::NoGesture);
    draft_ = base_;
    FOLIO_LOG_DEBUG("cancelGesture");
    endGesture();
    return setError(FolioError::Ok);
}

void PageEditor::endGesture() {
    gesture_ = std::monostate{};
    guides_ = interaction::SnapGuides{};
    hasCandidate_ = false;
    base_ = PageSideLayout{};
}

} // namespace folio
