#pragma once

#include "folio/core/types.h"
#include "folio/model/block.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace folio {

// Rigid group move, clamped so every block stays on the page.
struct TranslateCommand {
    std::vector<std::string> ids;
    double dx{0.0};
    double dy{0.0};
};

// Uniform scale about (anchorX, anchorY), clamped to the page and to the
// interactive minimum size.
struct ScaleCommand {
    std::vector<std::string> ids;
    double factor{1.0};
    double anchorX{0.0};
    double anchorY{0.0};
};

// Replaces the crop of an image/svg block; nullopt clears it. Aspect ratio
// and height follow the new visible area.
struct SetCropCommand {
    std::string id;
    std::optional<VisualCrop> crop;
};

struct AddBlockCommand {
    Block block;
};

struct DeleteBlockCommand {
    std::string id;
};

// Runs the validator.
struct CommitCommand {};

// Identity: the host restores its own pre-gesture snapshot.
struct CancelCommand {};

using LayoutCommand = std::variant<
    TranslateCommand,
    ScaleCommand,
    SetCropCommand,
    AddBlockCommand,
    DeleteBlockCommand,
    CommitCommand,
    CancelCommand>;

struct CommandResult {
    FolioError error{FolioError::Ok};
    PageSideLayout layout;  // the previous layout when error != Ok
};

CommandResult applyLayoutCommand(const PageSideLayout& layout, const LayoutCommand& command);

} // namespace folio
