#pragma once

#include "folio/core/types.h"
#include "folio/interaction/gesture_session.h"
#include "folio/interaction/interaction_constants.h"
#include "folio/interaction/snap_types.h"
#include "folio/model/block.h"
#include "folio/model/padding.h"
#include "folio/model/visual_crop.h"
#include "folio/persistence/layout_store.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace folio {

struct EditorOptions {
    interaction::SnapOptions snap;
    double canvasWidthPx{interaction_constants::CANVAS_DISPLAY_WIDTH_PX};
    double canvasHeightPx{interaction_constants::CANVAS_DISPLAY_HEIGHT_PX};
};

enum class GestureKind : std::uint8_t {
    None = 0,
    Drag = 1,
    Resize = 2,
    CropEdge = 3,
};

/**
 * Editing session for one page-side at a time.
 *
 * Owns the draft layout, the selection and at most one gesture. A gesture
 * snapshots the layout at pointer-down; every update recomputes the candidate
 * from that snapshot, so repeated or reordered pointer-moves are harmless.
 * Committing runs the validator; flush() hands the validated layout to the
 * store.
 */
class PageEditor {
public:
    explicit PageEditor(persistence::LayoutStore& store, EditorOptions options = {});

    // ==============================================================================
    // Context
    // ==============================================================================

    // Flushes the current context, then loads and validates key.
    FolioError openContext(const persistence::PageSideKey& key);
    const std::optional<persistence::PageSideKey>& context() const noexcept { return context_; }

    // Saves the committed layout if it changed since the last save.
    FolioError flush();
    bool isDirty() const noexcept { return dirty_; }

    const PageSideLayout& layout() const noexcept { return draft_; }

    // Replaces the draft with a validated document; InvalidJson leaves it alone.
    FolioError importLayoutJson(const std::string& text);
    std::string exportLayoutJson() const;

    // Repairs reported by the last load or import.
    const std::vector<std::string>& diagnostics() const noexcept { return diagnostics_; }

    // ==============================================================================
    // Blocks & selection
    // ==============================================================================

    // Id of the new block, or "" with lastError() set.
    std::string addBlock(BlockKind kind);
    std::string addProfileImage(const std::string& assetPath);
    FolioError deleteBlock(const std::string& id);

    FolioError setPaddingOverride(const std::optional<PaddingConfig>& padding);
    FolioError setBackgroundColor(const std::optional<std::string>& color);

    // Unknown ids are dropped (UnknownBlock); the rest stay selected.
    FolioError setSelection(const std::vector<std::string>& ids);
    const std::vector<std::string>& selection() const noexcept { return selection_; }

    // ==============================================================================
    // Gestures
    // ==============================================================================

    FolioError beginDrag(const PointerPos& pointer);
    FolioError beginResize(const PointerPos& pointer);
    FolioError beginCropEdge(const std::string& id, CropEdge edge, const PointerPos& pointer);
    FolioError updateGesture(const PointerPos& pointer);
    FolioError commitGesture();
    FolioError cancelGesture();

    bool isGestureActive() const noexcept { return activeGesture() != GestureKind::None; }
    GestureKind activeGesture() const noexcept;
    const interaction::SnapGuides& guides() const noexcept { return guides_; }

    // ==============================================================================
    // Options
    // ==============================================================================

    void setOptions(const EditorOptions& options) { options_ = options; }
    const EditorOptions& options() const noexcept { return options_; }
    SafeArea safeArea() const;

    FolioError lastError() const noexcept { return lastError_; }

private:
    using GestureState = std::variant<
        std::monostate,
        interaction::DragSession,
        interaction::ResizeSession,
        interaction::CropEdgeSession>;

    persistence::LayoutStore& store_;
    EditorOptions options_;
    std::optional<persistence::PageSideKey> context_;

    PageSideLayout draft_;
    PageSideLayout base_;  // layout at pointer-down while a gesture is active
    bool dirty_{false};
    std::vector<std::string> selection_;
    std::vector<std::string> diagnostics_;

    GestureState gesture_;
    interaction::GestureFrame frame_;
    interaction::SnapGuides guides_;
    bool hasCandidate_{false};

    std::uint32_t nextBlockId_{1};
    FolioError lastError_{FolioError::Ok};

    FolioError setError(FolioError error) noexcept;
    FolioError checkCanEdit();
    std::string allocateBlockId();
    std::string insertBlock(Block block);
    void endGesture();
    void replaceLayout(PageSideLayout layout);
};

} // namespace folio
