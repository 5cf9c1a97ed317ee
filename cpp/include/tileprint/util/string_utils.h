#ifndef TILEPRINT_UTIL_STRING_UTILS_H
#define TILEPRINT_UTIL_STRING_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tileprint {

using IntList = std::vector<std::int64_t>;

/** "[1, 2, 3]"; an empty list prints as "[]". */
std::string format_int_list(const IntList& values);

/** "[8 x 128]" */
std::string format_dims(const IntList& values);

/**
 * Appends `indent` spaces after every newline so a multi-line child block lines up
 * under the label it was attached to. The first line is left untouched.
 */
std::string indent_continuation(std::string_view text, std::size_t indent);

std::string_view trim(std::string_view s);

bool starts_with_word(std::string_view s, std::string_view word);

} // namespace tileprint

#endif // TILEPRINT_UTIL_STRING_UTILS_H
