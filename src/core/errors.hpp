#pragma once

#include <string>

namespace daybook {

/**
 * Storage-level failure. `code` carries the SQLite result code when there
 * is one.
 */
struct Error {
    std::string message;
    int code{0};

    bool operator==(const Error&) const = default;
};

/**
 * Failure kinds for local note persistence.
 */
enum class RepositoryErrorKind {
    IO,
    DecryptFailed,
    EncryptFailed,
    Unknown
};

struct RepositoryError {
    RepositoryErrorKind kind{RepositoryErrorKind::Unknown};
    std::string message;

    [[nodiscard]] static RepositoryError io(std::string msg) {
        return {RepositoryErrorKind::IO, std::move(msg)};
    }
    [[nodiscard]] static RepositoryError from(const Error& e) {
        return {RepositoryErrorKind::IO, e.message};
    }

    bool operator==(const RepositoryError&) const = default;
};

/**
 * Failure kinds for a sync run or a single remote call.
 */
enum class SyncErrorKind {
    Offline,
    Conflict,
    RemoteRejected,
    Unknown
};

struct SyncError {
    SyncErrorKind kind{SyncErrorKind::Unknown};
    std::string message;

    bool operator==(const SyncError&) const = default;
};

/**
 * Fixed user-facing text for a sync error.
 */
[[nodiscard]] std::string format_sync_error(const SyncError& error);

[[nodiscard]] const char* to_string(RepositoryErrorKind kind) noexcept;
[[nodiscard]] const char* to_string(SyncErrorKind kind) noexcept;

} // namespace daybook
