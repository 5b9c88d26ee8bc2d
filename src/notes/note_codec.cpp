#include "notes/note_codec.hpp"

#include <QDebug>

namespace daybook::notes {

Result<std::optional<Note>, RepositoryError> open_note(
    const crypto::E2eeService& e2ee,
    const NoteRecord& record) {
    using R = Result<std::optional<Note>, RepositoryError>;
    auto decrypted = e2ee.decrypt_note(record);
    if (decrypted.is_err()) {
        return R::err(decrypted.unwrap_err());
    }
    auto payload = std::move(decrypted).unwrap();
    if (!payload) {
        qWarning() << "NOTES: content unavailable for" << QString::fromStdString(record.date)
                   << "(key" << QString::fromStdString(record.key_id) << "not in keyring)";
        return R::ok(std::nullopt);
    }
    return R::ok(Note{
        .date = record.date,
        .content = std::move(payload->content),
        .habits = std::move(payload->habits),
        .updated_at = record.updated_at
    });
}

Result<NoteRecord, RepositoryError> seal_note(
    const crypto::E2eeService& e2ee,
    const std::string& date,
    const std::string& content,
    const std::optional<HabitValues>& habits,
    const std::string& updated_at) {
    using R = Result<NoteRecord, RepositoryError>;
    auto encrypted = e2ee.encrypt_note(NotePayload{content, habits});
    if (encrypted.is_err()) {
        return R::err(encrypted.unwrap_err());
    }
    const auto& envelope = encrypted.unwrap();
    if (!envelope) {
        return R::err(RepositoryError{RepositoryErrorKind::EncryptFailed,
                                      "No active encryption key"});
    }
    return R::ok(NoteRecord{
        .version = 1,
        .date = date,
        .key_id = envelope->key_id,
        .ciphertext = envelope->ciphertext,
        .nonce = envelope->nonce,
        .updated_at = updated_at
    });
}

} // namespace daybook::notes
