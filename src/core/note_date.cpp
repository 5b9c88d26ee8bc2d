#include "core/note_date.hpp"

#include <cstdio>

namespace daybook {

namespace {

bool is_leap(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool parse_digits(std::string_view text, int& out) {
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

int days_in_month(int month, int year) noexcept {
    switch (month) {
        case 2: return is_leap(year) ? 29 : 28;
        case 4: case 6: case 9: case 11: return 30;
        default: return 31;
    }
}

std::optional<CalendarDate> parse_note_date(std::string_view text) {
    if (text.size() != 10 || text[2] != '-' || text[5] != '-') {
        return std::nullopt;
    }
    CalendarDate date;
    if (!parse_digits(text.substr(0, 2), date.day) ||
        !parse_digits(text.substr(3, 2), date.month) ||
        !parse_digits(text.substr(6, 4), date.year)) {
        return std::nullopt;
    }
    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > days_in_month(date.month, date.year)) return std::nullopt;
    return date;
}

std::string format_note_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d-%02d-%04d", date.day, date.month, date.year);
    return buffer;
}

bool is_valid_note_date(std::string_view text) {
    return parse_note_date(text).has_value();
}

std::optional<int> note_date_year(std::string_view date) {
    auto parsed = parse_note_date(date);
    if (!parsed) return std::nullopt;
    return parsed->year;
}

bool note_date_in_year(std::string_view date, int year) {
    auto parsed = note_date_year(date);
    return parsed && *parsed == year;
}

} // namespace daybook
