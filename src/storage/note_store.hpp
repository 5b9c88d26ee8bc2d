#pragma once

#include "storage/database.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace daybook::storage {

/**
 * NoteStore - encrypted note envelopes and their sync bookkeeping.
 */
class NoteStore {
public:
    explicit NoteStore(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<NoteRecord>, Error> get_record(const std::string& date);
    [[nodiscard]] Result<void, Error> put_record(const NoteRecord& record);
    [[nodiscard]] Result<void, Error> delete_record(const std::string& date);

    [[nodiscard]] Result<std::optional<NoteMeta>, Error> get_meta(const std::string& date);
    [[nodiscard]] Result<void, Error> put_meta(const NoteMeta& meta);
    [[nodiscard]] Result<void, Error> delete_meta(const std::string& date);

    /**
     * Write record and meta atomically.
     */
    [[nodiscard]] Result<void, Error> put(const NoteRecord& record, const NoteMeta& meta);

    /**
     * Remove record and meta atomically.
     */
    [[nodiscard]] Result<void, Error> remove(const std::string& date);

    /**
     * Dates with a stored envelope, ascending by key.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> all_dates();

    [[nodiscard]] Result<std::vector<std::string>, Error> dates_for_year(int year);

    /**
     * Meta rows carrying a pending operation.
     */
    [[nodiscard]] Result<std::vector<NoteMeta>, Error> pending_metas();

    [[nodiscard]] Result<int, Error> count_pending();

private:
    Database& db_;

    static NoteRecord row_to_record(Statement& stmt);
    static NoteMeta row_to_meta(Statement& stmt);
};

} // namespace daybook::storage
