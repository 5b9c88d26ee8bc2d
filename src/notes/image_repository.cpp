#include "notes/image_repository.hpp"
#include "crypto/keys.hpp"

namespace daybook::notes {

ImageRepository::ImageRepository(std::shared_ptr<storage::LocalStore> store,
                                 std::shared_ptr<crypto::E2eeService> e2ee,
                                 ClockFn clock)
    : store_(std::move(store)), e2ee_(std::move(e2ee)), clock_(std::move(clock)) {}

Result<ImageMeta, RepositoryError> ImageRepository::store(const NewImage& image) {
    using R = Result<ImageMeta, RepositoryError>;
    const auto id = Uuid::generate().to_string();
    auto encrypted = e2ee_->encrypt_image(image.bytes, id);
    if (encrypted.is_err()) {
        return R::err(encrypted.unwrap_err());
    }
    const auto& sealed = encrypted.unwrap();
    if (!sealed) {
        return R::err(RepositoryError{RepositoryErrorKind::EncryptFailed,
                                      "No active encryption key"});
    }

    ImageMeta meta{
        .id = id,
        .note_date = image.note_date,
        .type = image.type,
        .filename = image.filename,
        .mime_type = image.mime_type,
        .width = image.width,
        .height = image.height,
        .size = sealed->size,
        .created_at = clock_().to_iso_string(),
        .sha256 = sealed->sha256,
        .key_id = sealed->key_id,
        .remote_path = std::nullopt,
        .server_updated_at = std::nullopt,
        .pending_op = ImagePendingOp::Upload
    };

    auto written = store_->images.put(sealed->record, meta);
    if (written.is_err()) {
        return R::err(RepositoryError::from(written.unwrap_err()));
    }
    return R::ok(std::move(meta));
}

Result<std::optional<std::vector<uint8_t>>, RepositoryError> ImageRepository::load(
    const std::string& id) {
    using R = Result<std::optional<std::vector<uint8_t>>, RepositoryError>;
    auto record = store_->images.get_record(id);
    if (record.is_err()) {
        return R::err(RepositoryError::from(record.unwrap_err()));
    }
    auto meta = store_->images.get_meta(id);
    if (meta.is_err()) {
        return R::err(RepositoryError::from(meta.unwrap_err()));
    }
    if (!record.unwrap() || !meta.unwrap()) {
        return R::ok(std::nullopt);
    }

    auto bytes = e2ee_->decrypt_image(*record.unwrap());
    if (bytes.is_err() || !bytes.unwrap()) {
        return bytes;
    }
    if (crypto::sha256_hex(*bytes.unwrap()) != meta.unwrap()->sha256) {
        return R::err(RepositoryError{RepositoryErrorKind::DecryptFailed,
                                      "Image digest mismatch"});
    }
    return bytes;
}

Result<void, RepositoryError> ImageRepository::remove(const std::string& id) {
    using R = Result<void, RepositoryError>;
    auto meta = store_->images.get_meta(id);
    if (meta.is_err()) {
        return R::err(RepositoryError::from(meta.unwrap_err()));
    }
    auto found = meta.unwrap();
    if (!found) {
        return R::ok();
    }

    // Never uploaded: nothing to propagate.
    if (!found->remote_path) {
        auto removed = store_->images.remove(id);
        if (removed.is_err()) {
            return R::err(RepositoryError::from(removed.unwrap_err()));
        }
        return R::ok();
    }

    found->pending_op = ImagePendingOp::Delete;
    auto result = store_->db.transaction([&]() -> Result<void, Error> {
        return store_->images.delete_record(id).and_then(
            [&] { return store_->images.put_meta(*found); });
    });
    if (result.is_err()) {
        return R::err(RepositoryError::from(result.unwrap_err()));
    }
    return R::ok();
}

Result<std::vector<ImageMeta>, RepositoryError> ImageRepository::images_for_note(
    const std::string& note_date) {
    using R = Result<std::vector<ImageMeta>, RepositoryError>;
    auto metas = store_->images.metas_for_note(note_date);
    if (metas.is_err()) {
        return R::err(RepositoryError::from(metas.unwrap_err()));
    }
    std::vector<ImageMeta> live;
    for (auto& meta : metas.unwrap()) {
        if (meta.pending_op != ImagePendingOp::Delete) {
            live.push_back(std::move(meta));
        }
    }
    return R::ok(std::move(live));
}

} // namespace daybook::notes
