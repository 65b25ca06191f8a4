#pragma once

#include "folio/model/block.h"
#include "folio/validation/layout_validator.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace folio::persistence {

struct LayoutDecodeResult {
    PageSideLayout layout;  // raw, not yet validated
    std::vector<std::string> errors;
};

// Structural decoding of a stored layout document. Non-object documents,
// non-array "blocks", non-object entries, unknown block types and blocks past
// the per-side cap are dropped with a diagnostic. Missing numeric fields get
// values the validator repairs.
LayoutDecodeResult decodeLayoutJson(const nlohmann::json& doc);
LayoutDecodeResult decodeLayoutJsonText(const std::string& text);

nlohmann::json encodeBlockJson(const Block& block);
nlohmann::json encodeLayoutJson(const PageSideLayout& layout);
std::string encodeLayoutJsonText(const PageSideLayout& layout, int indent = -1);

// Decode then validateLayout; decode diagnostics come first.
ValidationResult validateLayoutJson(const nlohmann::json& doc);
ValidationResult validateLayoutJsonText(const std::string& text);

} // namespace folio::persistence
