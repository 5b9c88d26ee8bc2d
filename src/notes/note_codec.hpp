#pragma once

#include "core/errors.hpp"
#include "core/note.hpp"
#include "core/result.hpp"
#include "crypto/e2ee_service.hpp"
#include <optional>
#include <string>

namespace daybook::notes {

/**
 * Decrypt an envelope into a Note. A key the keyring does not hold gives
 * ok(nullopt).
 */
[[nodiscard]] Result<std::optional<Note>, RepositoryError> open_note(
    const crypto::E2eeService& e2ee,
    const NoteRecord& record);

/**
 * Encrypt content and habits into an envelope for `date` under the active
 * key. Fails with EncryptFailed when no key is available.
 */
[[nodiscard]] Result<NoteRecord, RepositoryError> seal_note(
    const crypto::E2eeService& e2ee,
    const std::string& date,
    const std::string& content,
    const std::optional<HabitValues>& habits,
    const std::string& updated_at);

} // namespace daybook::notes
