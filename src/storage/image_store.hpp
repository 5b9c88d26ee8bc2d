#pragma once

#include "storage/database.hpp"
#include "core/image.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace daybook::storage {

/**
 * ImageStore - encrypted image blobs and their metadata.
 *
 * A meta row without a blob is valid: it represents a pending remote
 * delete or an image not yet downloaded.
 */
class ImageStore {
public:
    explicit ImageStore(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<ImageRecord>, Error> get_record(const std::string& id);
    [[nodiscard]] Result<std::optional<ImageMeta>, Error> get_meta(const std::string& id);

    /**
     * Store blob and meta atomically.
     */
    [[nodiscard]] Result<void, Error> put(const ImageRecord& record, const ImageMeta& meta);
    [[nodiscard]] Result<void, Error> put_meta(const ImageMeta& meta);

    [[nodiscard]] Result<void, Error> delete_record(const std::string& id);

    /**
     * Remove blob and meta atomically.
     */
    [[nodiscard]] Result<void, Error> remove(const std::string& id);

    [[nodiscard]] Result<std::vector<ImageMeta>, Error> metas_for_note(const std::string& note_date);
    [[nodiscard]] Result<std::vector<ImageMeta>, Error> pending_metas();
    [[nodiscard]] Result<int, Error> count_pending();

private:
    Database& db_;

    static ImageMeta row_to_meta(Statement& stmt);
    Result<std::vector<ImageMeta>, Error> select_metas(const std::string& where,
                                                       const std::optional<std::string>& arg);
};

} // namespace daybook::storage
