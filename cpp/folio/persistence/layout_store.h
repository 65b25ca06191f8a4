#pragma once

#include "folio/model/block.h"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace folio::persistence {

enum class PageSide : std::uint8_t {
    Front = 0,
    Back = 1,
};

const char* pageSideName(PageSide side) noexcept;
std::optional<PageSide> parsePageSide(const std::string& name);

struct PageSideKey {
    std::string bookKey;
    std::int32_t pageIndex{0};
    PageSide side{PageSide::Front};
};

bool operator==(const PageSideKey& a, const PageSideKey& b) noexcept;
inline bool operator!=(const PageSideKey& a, const PageSideKey& b) noexcept { return !(a == b); }
bool operator<(const PageSideKey& a, const PageSideKey& b) noexcept;

// "p{pageIndex}:{front|back}"
std::string pageSideKey(std::int32_t pageIndex, PageSide side);

/**
 * Persistence collaborator for page-side layouts.
 *
 * The editor only ever hands save() a validated layout. Implementations own
 * debouncing and upsert policy; the last write for a key wins.
 */
class LayoutStore {
public:
    virtual ~LayoutStore() = default;

    // Stored document for key, nullopt when nothing was saved yet.
    virtual std::optional<nlohmann::json> load(const PageSideKey& key) = 0;
    virtual void save(const PageSideKey& key, const PageSideLayout& layout) = 0;
};

class MemoryLayoutStore final : public LayoutStore {
public:
    std::optional<nlohmann::json> load(const PageSideKey& key) override;
    void save(const PageSideKey& key, const PageSideLayout& layout) override;

    // Raw document, for seeding a store with hand-written or legacy data.
    void put(const PageSideKey& key, nlohmann::json doc);

    std::size_t size() const noexcept { return docs_.size(); }
    std::uint32_t saveCount() const noexcept { return saveCount_; }

private:
    std::map<PageSideKey, nlohmann::json> docs_;
    std::uint32_t saveCount_{0};
};

} // namespace folio::persistence
