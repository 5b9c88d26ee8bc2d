#pragma once

#include "core/note.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace daybook {

/**
 * Reduce rich-text markup to the allow-listed tags and attributes.
 *
 * Disallowed tags are removed but their text is kept; script-like
 * elements are removed with their content. Comments are dropped and
 * unsafe href schemes are stripped. The output is stable under a
 * second pass.
 */
[[nodiscard]] std::string sanitize_html(std::string_view html);

/**
 * True if the markup has no visible text and no image.
 */
[[nodiscard]] bool is_content_empty(std::string_view html);

/**
 * True if the habit carries something worth storing.
 */
[[nodiscard]] bool has_habit_value(const HabitEntry& entry);

/**
 * A note is empty when its content is empty and no habit has a value.
 */
[[nodiscard]] bool is_note_empty(std::string_view content,
                                 const std::optional<HabitValues>& habits);

} // namespace daybook
