#include "core/types.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace daybook {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

// Howard Hinnant's civil-date algorithms, proleptic Gregorian calendar.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t yy = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yy + (m <= 2));
}

} // namespace

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; i += 8) {
        uint64_t v = dist(gen);
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(v >> (j * 8));
        }
    }
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    std::string clean;
    clean.reserve(32);
    for (char c : str) {
        if (c != '-') clean += c;
    }
    if (clean.size() != 32) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        int hi = nibble(clean[i * 2]);
        int lo = nibble(clean[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::optional<Timestamp> Timestamp::from_iso_string(std::string_view iso) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    std::string buf(iso);
    int consumed = 0;
    if (std::sscanf(buf.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    std::string_view rest = iso.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        int digits = 0;
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
            if (digits < 3) millis = millis * 10 + (rest.front() - '0');
            ++digits;
            rest.remove_prefix(1);
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (rest != "Z") return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return Timestamp(secs * 1000 + millis);
}

std::string Timestamp::to_iso_string() const {
    int64_t ms = millis_ % 1000;
    int64_t total_secs = millis_ / 1000;
    if (ms < 0) {
        ms += 1000;
        total_secs -= 1;
    }
    int64_t days = total_secs / 86400;
    int64_t secs_of_day = total_secs % 86400;
    if (secs_of_day < 0) {
        secs_of_day += 86400;
        days -= 1;
    }

    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  y, m, d,
                  static_cast<int>(secs_of_day / 3600),
                  static_cast<int>((secs_of_day % 3600) / 60),
                  static_cast<int>(secs_of_day % 60),
                  static_cast<int>(ms));
    return buffer;
}

} // namespace daybook
