#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace daybook {

/**
 * A calendar day. Notes are keyed by its DD-MM-YYYY form.
 */
struct CalendarDate {
    int day{1};
    int month{1};
    int year{1970};

    auto operator<=>(const CalendarDate&) const = default;
};

/**
 * Parse DD-MM-YYYY, rejecting days that do not exist (31-02-2024).
 */
[[nodiscard]] std::optional<CalendarDate> parse_note_date(std::string_view text);

[[nodiscard]] std::string format_note_date(const CalendarDate& date);

[[nodiscard]] bool is_valid_note_date(std::string_view text);

/**
 * True if the DD-MM-YYYY key falls within `year`.
 */
[[nodiscard]] bool note_date_in_year(std::string_view date, int year);

[[nodiscard]] std::optional<int> note_date_year(std::string_view date);

[[nodiscard]] int days_in_month(int month, int year) noexcept;

} // namespace daybook
