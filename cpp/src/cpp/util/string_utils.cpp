#include <tileprint/util/string_utils.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cctype>

namespace tileprint {

std::string format_int_list(const IntList& values) {
    return fmt::format("[{}]", fmt::join(values, ", "));
}

std::string format_dims(const IntList& values) {
    return fmt::format("[{}]", fmt::join(values, " x "));
}

std::string indent_continuation(std::string_view text, std::size_t indent) {
    std::string out;
    out.reserve(text.size());
    const std::string pad(indent, ' ');
    bool line_start{false};
    for (char c : text) {
        // blank lines stay empty
        if (line_start && c != '\n') out += pad;
        out.push_back(c);
        line_start = c == '\n';
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool starts_with_word(std::string_view s, std::string_view word) {
    if (!s.starts_with(word)) return false;
    if (s.size() == word.size()) return true;
    const char next = s[word.size()];
    return !(std::isalnum(static_cast<unsigned char>(next)) || next == '_');
}

} // namespace tileprint
