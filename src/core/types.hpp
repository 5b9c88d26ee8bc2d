#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <random>
#include <functional>

namespace daybook {

/**
 * Uuid - 128-bit random identifier used for remote note ids and image ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Parse a UUID from a string (hyphenated or not).
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Hyphenated lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * Notes and the remote store exchange timestamps as ISO 8601 strings
 * ("2024-03-01T10:15:30.250Z"); fixed-width UTC strings sort the same
 * way the underlying instants do.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    /**
     * Parse "YYYY-MM-DDTHH:MM:SS[.mmm]Z". Returns nullopt on malformed input.
     */
    [[nodiscard]] static std::optional<Timestamp> from_iso_string(std::string_view iso);

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Source of "now" for components that stamp records. Tests substitute a
 * fixed or stepping clock.
 */
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline ClockFn system_clock() {
    return [] { return Timestamp::now(); };
}

} // namespace daybook
