#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>

namespace daybook::storage {

/**
 * SyncStateStore - the singleton {id: "state", cursor} record.
 *
 * A missing row and a NULL cursor both mean "never synced".
 */
class SyncStateStore {
public:
    static constexpr const char* STATE_ID = "state";

    explicit SyncStateStore(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<std::string>, Error> cursor();
    [[nodiscard]] Result<void, Error> set_cursor(const std::optional<std::string>& cursor);

private:
    Database& db_;
};

} // namespace daybook::storage
