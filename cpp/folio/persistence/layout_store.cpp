#include "folio/persistence/layout_store.h"

#include "folio/persistence/layout_json.h"
#include <tuple>

namespace folio::persistence {

const char* pageSideName(PageSide side) noexcept {
    switch (side) {
        case PageSide::Front: return "front";
        case PageSide::Back: return "back";
    }
    return "front";
}

std::optional<PageSide> parsePageSide(const std::string& name) {
    if (name == "front") return PageSide::Front;
    if (name == "back") return PageSide::Back;
    return std::nullopt;
}

bool operator==(const PageSideKey& a, const PageSideKey& b) noexcept {
    return a.bookKey == b.bookKey && a.pageIndex == b.pageIndex && a.side == b.side;
}

bool operator<(const PageSideKey& a, const PageSideKey& b) noexcept {
    return std::tie(a.bookKey, a.pageIndex, a.side) < std::tie(b.bookKey, b.pageIndex, b.side);
}

std::string pageSideKey(std::int32_t pageIndex, PageSide side) {
    return "p" + std::to_string(pageIndex) + ":" + pageSideName(side);
}

std::optional<nlohmann::json> MemoryLayoutStore::load(const PageSideKey& key) {
    const auto it = docs_.find(key);
    if (it == docs_.end()) return std::nullopt;
    return it->second;
}

void MemoryLayoutStore::save(const PageSideKey& key, const PageSideLayout& layout) {
    docs_[key] = encodeLayoutJson(layout);
    ++saveCount_;
}

void MemoryLayoutStore::put(const PageSideKey& key, nlohmann::json doc) {
    docs_[key] = std::move(doc);
}

} // namespace folio::persistence
