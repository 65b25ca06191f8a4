#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "folio/editor/page_editor.h"
#include "folio/persistence/layout_json.h"
#include "folio/persistence/layout_store.h"

#ifdef EMSCRIPTEN
namespace {

// Editor plus the in-memory store it persists to. The host reads saved
// documents back with storedLayout() and syncs them to its backend.
class WasmPageEditor {
public:
    WasmPageEditor() : editor_(store_) {}

    std::uint32_t openContext(const std::string& bookKey, int pageIndex, const std::string& side) {
        const std::optional<folio::persistence::PageSide> parsed = folio::persistence::parsePageSide(side);
        if (!parsed) return static_cast<std::uint32_t>(folio::FolioError::InvalidOperation);
        return code(editor_.openContext(folio::persistence::PageSideKey{bookKey, pageIndex, *parsed}));
    }

    std::uint32_t seedLayout(const std::string& bookKey, int pageIndex, const std::string& side, const std::string& json) {
        const std::optional<folio::persistence::PageSide> parsed = folio::persistence::parsePageSide(side);
        if (!parsed) return static_cast<std::uint32_t>(folio::FolioError::InvalidOperation);
        nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
        if (doc.is_discarded()) return static_cast<std::uint32_t>(folio::FolioError::InvalidJson);
        store_.put(folio::persistence::PageSideKey{bookKey, pageIndex, *parsed}, std::move(doc));
        return code(folio::FolioError::Ok);
    }

    std::string storedLayout(const std::string& bookKey, int pageIndex, const std::string& side) {
        const std::optional<folio::persistence::PageSide> parsed = folio::persistence::parsePageSide(side);
        if (!parsed) return std::string();
        const std::optional<nlohmann::json> doc =
            store_.load(folio::persistence::PageSideKey{bookKey, pageIndex, *parsed});
        return doc ? doc->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) : std::string();
    }

    std::uint32_t flush() { return code(editor_.flush()); }
    bool isDirty() const { return editor_.isDirty(); }

    std::uint32_t importLayout(const std::string& json) { return code(editor_.importLayoutJson(json)); }
    std::string exportLayout() const { return editor_.exportLayoutJson(); }

    std::string addBlock(const std::string& kind) {
        const std::optional<folio::BlockKind> parsed = folio::parseBlockKind(kind);
        if (!parsed) return std::string();
        return editor_.addBlock(*parsed);
    }
    std::string addProfileImage(const std::string& assetPath) { return editor_.addProfileImage(assetPath); }
    std::uint32_t deleteBlock(const std::string& id) { return code(editor_.deleteBlock(id)); }

    std::uint32_t setSelection(const std::string& idsJson) {
        const nlohmann::json doc = nlohmann::json::parse(idsJson, nullptr, false);
        if (doc.is_discarded() || !doc.is_array()) return static_cast<std::uint32_t>(folio::FolioError::InvalidJson);
        std::vector<std::string> ids;
        for (const nlohmann::json& id : doc) {
            if (id.is_string()) ids.push_back(id.get<std::string>());
        }
        return code(editor_.setSelection(ids));
    }

    std::uint32_t beginDrag(double x, double y) { return code(editor_.beginDrag(folio::PointerPos{x, y})); }
    std::uint32_t beginResize(double x, double y) { return code(editor_.beginResize(folio::PointerPos{x, y})); }
    std::uint32_t beginCropEdge(const std::string& id, const std::string& edge, double x, double y) {
        const std::optional<folio::CropEdge> parsed = folio::parseCropEdge(edge);
        if (!parsed) return static_cast<std::uint32_t>(folio::FolioError::InvalidOperation);
        return code(editor_.beginCropEdge(id, *parsed, folio::PointerPos{x, y}));
    }
    std::uint32_t updateGesture(double x, double y) { return code(editor_.updateGesture(folio::PointerPos{x, y})); }
    std::uint32_t commitGesture() { return code(editor_.commitGesture()); }
    std::uint32_t cancelGesture() { return code(editor_.cancelGesture()); }
    bool isGestureActive() const { return editor_.isGestureActive(); }

    emscripten::val guideX() const { return guideValue(editor_.guides().x); }
    emscripten::val guideY() const { return guideValue(editor_.guides().y); }

    void setSnap(bool enabled, double thresholdPx) {
        folio::EditorOptions options = editor_.options();
        options.snap.enabled = enabled;
        options.snap.thresholdPx = thresholdPx;
        editor_.setOptions(options);
    }
    void setCanvasSize(double widthPx, double heightPx) {
        folio::EditorOptions options = editor_.options();
        options.canvasWidthPx = widthPx;
        options.canvasHeightPx = heightPx;
        editor_.setOptions(options);
    }

    std::uint32_t lastError() const { return code(editor_.lastError()); }

private:
    folio::persistence::MemoryLayoutStore store_;
    folio::PageEditor editor_;

    static std::uint32_t code(folio::FolioError error) { return static_cast<std::uint32_t>(error); }

    static emscripten::val guideValue(const std::optional<double>& guide) {
        return guide ? emscripten::val(*guide) : emscripten::val::null();
    }
};

std::string validateLayoutJsonString(const std::string& json) {
    return folio::persistence::encodeLayoutJsonText(folio::persistence::validateLayoutJsonText(json).layout);
}

} // namespace

EMSCRIPTEN_BINDINGS(folio_module) {
    emscripten::enum_<folio::FolioError>("FolioError")
        .value("Ok", folio::FolioError::Ok)
        .value("InvalidJson", folio::FolioError::InvalidJson)
        .value("InvalidOperation", folio::FolioError::InvalidOperation)
        .value("BlockLimitReached", folio::FolioError::BlockLimitReached)
        .value("UnknownBlock", folio::FolioError::UnknownBlock)
        .value("GestureActive", folio::FolioError::GestureActive)
        .value("NoGesture", folio::FolioError::NoGesture);

    emscripten::function("validateLayoutJson", &validateLayoutJsonString);

    emscripten::class_<WasmPageEditor>("PageEditor")
        .constructor<>()
        .function("openContext", &WasmPageEditor::openContext)
        .function("seedLayout", &WasmPageEditor::seedLayout)
        .function("storedLayout", &WasmPageEditor::storedLayout)
        .function("flush", &WasmPageEditor::flush)
        .function("isDirty", &WasmPageEditor::isDirty)
        .function("importLayout", &WasmPageEditor::importLayout)
        .function("exportLayout", &WasmPageEditor::exportLayout)
        .function("addBlock", &WasmPageEditor::addBlock)
        .function("addProfileImage", &WasmPageEditor::addProfileImage)
        .function("deleteBlock", &WasmPageEditor::deleteBlock)
        .function("setSelection", &WasmPageEditor::setSelection)
        .function("beginDrag", &WasmPageEditor::beginDrag)
        .function("beginResize", &WasmPageEditor::beginResize)
        .function("beginCropEdge", &WasmPageEditor::beginCropEdge)
        .function("updateGesture", &WasmPageEditor::updateGesture)
        .function("commitGesture", &WasmPageEditor::commitGesture)
        .function("cancelGesture", &WasmPageEditor::cancelGesture)
        .function("isGestureActive", &WasmPageEditor::isGestureActive)
        .function("guideX", &WasmPageEditor::guideX)
        .function("guideY", &WasmPageEditor::guideY)
        .function("setSnap", &WasmPageEditor::setSnap)
        .function("setCanvasSize", &WasmPageEditor::setCanvasSize)
        .function("lastError", &WasmPageEditor::lastError);
}
#endif
