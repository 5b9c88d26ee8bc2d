#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace daybook::storage {

/**
 * RemoteNoteIndex - dates known to exist on the remote store.
 *
 * Lets an offline device tell "exists but not cached" apart from
 * "does not exist".
 */
class RemoteNoteIndex {
public:
    explicit RemoteNoteIndex(Database& db) : db_(db) {}

    [[nodiscard]] Result<bool, Error> contains(const std::string& date);
    [[nodiscard]] Result<std::vector<std::string>, Error> dates_for_year(int year);

    /**
     * Replace the cached dates for `year` with `dates`.
     */
    [[nodiscard]] Result<void, Error> set_dates_for_year(int year,
                                                         const std::vector<std::string>& dates,
                                                         const std::string& fetched_at);

    [[nodiscard]] Result<void, Error> add(const std::string& date, const std::string& fetched_at);
    [[nodiscard]] Result<void, Error> remove(const std::string& date);

private:
    Database& db_;

    Result<void, Error> insert(const std::string& date, int year, const std::string& fetched_at);
};

} // namespace daybook::storage
