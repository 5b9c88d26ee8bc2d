#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace daybook {

enum class HabitType {
    Text,
    Number,
    Checkbox
};

using HabitValue = std::variant<std::string, double, bool>;

/**
 * A single tracked habit attached to a day's note.
 */
struct HabitEntry {
    std::string name;
    HabitType type{HabitType::Text};
    int order{0};
    HabitValue value{std::string{}};

    bool operator==(const HabitEntry&) const = default;
};

/**
 * Habit id -> entry. Ordered by id; display order comes from HabitEntry::order.
 */
using HabitValues = std::map<std::string, HabitEntry>;

/**
 * Note - decrypted domain object for one calendar day.
 */
struct Note {
    std::string date;        // DD-MM-YYYY
    std::string content;     // sanitized rich text
    std::optional<HabitValues> habits;
    std::string updated_at;  // ISO 8601

    bool operator==(const Note&) const = default;
};

/**
 * The plaintext that goes inside an envelope.
 */
struct NotePayload {
    std::string content;
    std::optional<HabitValues> habits;

    bool operator==(const NotePayload&) const = default;
};

/**
 * NoteRecord - encrypted at-rest envelope. Ciphertext and nonce are base64.
 */
struct NoteRecord {
    int version{1};
    std::string date;
    std::string key_id;
    std::string ciphertext;
    std::string nonce;
    std::string updated_at;

    bool operator==(const NoteRecord&) const = default;
};

enum class PendingOp {
    Upsert,
    Delete
};

[[nodiscard]] constexpr const char* to_string(PendingOp op) noexcept {
    return op == PendingOp::Upsert ? "upsert" : "delete";
}

[[nodiscard]] inline std::optional<PendingOp> pending_op_from_string(const std::string& s) {
    if (s == "upsert") return PendingOp::Upsert;
    if (s == "delete") return PendingOp::Delete;
    return std::nullopt;
}

/**
 * Sync bookkeeping for a note. `revision` is the last server revision this
 * device has seen (0 = never pushed); `local_version` increments on every
 * local write so a push can tell whether the note changed underneath it.
 */
struct NoteMeta {
    std::string date;
    int64_t revision{0};
    std::optional<std::string> remote_id;
    std::optional<std::string> server_updated_at;
    std::optional<std::string> last_synced_at;
    std::optional<PendingOp> pending_op;
    int64_t local_version{0};

    bool operator==(const NoteMeta&) const = default;
};

/**
 * Record plus meta, as handed between the envelope engine and the
 * hydrating repository.
 */
struct NoteEnvelope {
    NoteRecord record;
    std::optional<NoteMeta> meta;
};

/**
 * RemoteNote - server-held envelope.
 */
struct RemoteNote {
    std::string id;
    std::string date;
    std::string key_id;
    std::string ciphertext;
    std::string nonce;
    std::string updated_at;
    int64_t revision{0};
    std::string server_updated_at;
    bool deleted{false};

    bool operator==(const RemoteNote&) const = default;
};

/**
 * Push payload. `revision` is the server revision the client expects to
 * replace; `id` is absent for a note that was never pushed.
 */
struct RemoteNotePayload {
    std::optional<std::string> id;
    std::string date;
    std::string key_id;
    std::string ciphertext;
    std::string nonce;
    std::string updated_at;
    int64_t revision{0};
    std::optional<std::string> server_updated_at;
};

struct RemoteNoteRef {
    std::optional<std::string> id;
    std::string date;
};

struct PendingOpsSummary {
    int notes{0};
    int images{0};
    int total{0};

    bool operator==(const PendingOpsSummary&) const = default;
};

[[nodiscard]] inline NoteRecord to_note_record(const RemoteNote& remote) {
    return NoteRecord{
        .version = 1,
        .date = remote.date,
        .key_id = remote.key_id,
        .ciphertext = remote.ciphertext,
        .nonce = remote.nonce,
        .updated_at = remote.updated_at
    };
}

} // namespace daybook
