#pragma once

#include "core/errors.hpp"
#include "core/image.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include "crypto/keyring.hpp"
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace daybook::crypto {

/**
 * Encrypted note payload, base64 encoded.
 */
struct EncryptedNote {
    std::string ciphertext;
    std::string nonce;
    std::string key_id;
};

struct EncryptedImage {
    ImageRecord record;
    std::string sha256;  // hex digest of the plaintext bytes
    int64_t size{0};
    std::string key_id;
};

/**
 * E2eeService - the envelope boundary for notes and images.
 *
 * A key id the keyring does not hold yields ok(nullopt): the content is
 * unavailable, not corrupt. Authentication failures and malformed
 * envelopes are errors. Note content is sanitized before encryption and
 * again after decryption.
 */
class E2eeService {
public:
    explicit E2eeService(std::shared_ptr<const Keyring> keyring);

    /**
     * Encrypt under `key_id`, or the keyring's active key when omitted.
     */
    [[nodiscard]] Result<std::optional<EncryptedNote>, RepositoryError> encrypt_note(
        const NotePayload& payload,
        const std::optional<std::string>& key_id = std::nullopt) const;

    [[nodiscard]] Result<std::optional<NotePayload>, RepositoryError> decrypt_note(
        const std::string& ciphertext,
        const std::string& nonce,
        const std::string& key_id) const;

    [[nodiscard]] Result<std::optional<NotePayload>, RepositoryError> decrypt_note(
        const NoteRecord& record) const {
        return decrypt_note(record.ciphertext, record.nonce, record.key_id);
    }

    [[nodiscard]] Result<std::optional<EncryptedImage>, RepositoryError> encrypt_image(
        std::span<const uint8_t> bytes,
        const std::string& image_id,
        const std::optional<std::string>& key_id = std::nullopt);

    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, RepositoryError> decrypt_image(
        const ImageRecord& record);

    [[nodiscard]] std::optional<std::string> active_key_id() const {
        return keyring_->active_key_id();
    }

    [[nodiscard]] bool has_key(const std::string& key_id) const {
        return keyring_->has_key(key_id);
    }

private:
    std::optional<std::string> resolve_key_id(const std::optional<std::string>& key_id) const;
    const SymmetricKey* image_key(const std::string& key_id);

    std::shared_ptr<const Keyring> keyring_;
    std::map<std::string, SymmetricKey> image_keys_;
};

/**
 * JSON form of the note plaintext: {"content": ..., "habits": {...}}.
 * "habits" is present only when non-empty.
 */
[[nodiscard]] std::string serialize_note_payload(const NotePayload& payload);
[[nodiscard]] Result<NotePayload, Error> parse_note_payload(const std::string& json);

} // namespace daybook::crypto
