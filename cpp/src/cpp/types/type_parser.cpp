#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>
#include <tileprint/util/log.h>

#include <array>
#include <cctype>

namespace tileprint {

namespace {

bool ends_with_word(std::string_view s, std::string_view word) {
    if (!s.ends_with(word)) return false;
    if (s.size() == word.size()) return true;
    const char prev = s[s.size() - word.size() - 1];
    return !(std::isalnum(static_cast<unsigned char>(prev)) || prev == '_' || prev == ':');
}

std::string collapse_spaces(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space{false};
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

/** Strips trailing cv-qualifiers and pointer/reference declarators from `s` into `node`. */
void strip_suffix_qualifiers(TypeNode& node, std::string_view& s) {
    std::string declarators;
    while (true) {
        s = trim(s);
        if (s.empty()) break;
        const char c = s.back();
        if (c == '&' || c == '*') {
            declarators.insert(declarators.begin(), c);
            s.remove_suffix(1);
        } else if (ends_with_word(s, "const")) {
            node.is_const = true;
            s.remove_suffix(5);
        } else if (ends_with_word(s, "volatile")) {
            node.is_volatile = true;
            s.remove_suffix(8);
        } else {
            break;
        }
    }
    node.indirection = declarators + node.indirection;
}

class SignatureParser {
public:
    SignatureParser(std::string_view text, bool lenient) : _text(text), _lenient(lenient) {}

    ParseResult parse() {
        if (trim(_text).empty()) throw_error<ParseError>("empty type signature");

        ParseResult result;
        result.node = parse_node();
        skip_ws();
        if (_pos < _text.size()) {
            const char c = _text[_pos];
            if (c == '>') throw_error<ParseError>("unbalanced '>' at offset {} in '{}'", _pos, _text);
            if (!_lenient) throw_error<ParseError>("unexpected '{}' at offset {} in '{}'", c, _pos, _text);
            note(fmt::format("trailing text after offset {} dropped", _pos));
        }
        result.complete = _complete;
        result.diagnostic = std::move(_diagnostic);
        return result;
    }

private:
    TypeNode parse_node() {
        TypeNode node;
        const std::string_view head = scan_text(false);

        if (_pos < _text.size() && _text[_pos] == '<') {
            node.is_template = true;
            ++_pos;
            skip_ws();
            if (_pos < _text.size() && _text[_pos] == '>') {
                ++_pos;
            } else {
                while (true) {
                    node.args.push_back(parse_node());
                    skip_ws();
                    if (_pos >= _text.size()) {
                        // truncation right after a comma leaves an empty trailing argument
                        if (node.args.back() == TypeNode{}) node.args.pop_back();
                        unterminated(head);
                        break;
                    }
                    if (_text[_pos++] == '>') break;
                }
            }
            apply_tail(node, scan_text(true));
        }
        apply_head(node, head);
        return node;
    }

    /**
     * Advances over literal text up to the next structural character at depth zero.
     * Parentheses always nest; angle brackets nest only inside a trailing nested-name.
     */
    std::string_view scan_text(bool nest_angles) {
        const std::size_t start = _pos;
        int paren{0};
        int angle{0};
        for (; _pos < _text.size(); ++_pos) {
            const char c = _text[_pos];
            if (c == '(') {
                ++paren;
            } else if (c == ')') {
                if (paren > 0) --paren;
            } else if (paren == 0) {
                if (c == '<') {
                    if (!nest_angles) break;
                    ++angle;
                } else if (c == '>') {
                    if (angle == 0) break;
                    --angle;
                } else if (c == ',' && angle == 0) {
                    break;
                }
            }
        }
        auto text = _text.substr(start, _pos - start);
        if (paren > 0 || angle > 0) unterminated(text);
        return text;
    }

    void apply_head(TypeNode& node, std::string_view s) {
        static constexpr std::array<std::string_view, 7> leading{
            "const", "volatile", "struct", "class", "typename", "enum", "union"};
        s = trim(s);
        for (bool stripped = true; stripped;) {
            stripped = false;
            for (auto kw : leading) {
                if (s.size() > kw.size() && starts_with_word(s, kw)) {
                    if (kw == "const") node.is_const = true;
                    if (kw == "volatile") node.is_volatile = true;
                    s = trim(s.substr(kw.size()));
                    stripped = true;
                }
            }
        }
        if (!node.is_template) strip_suffix_qualifiers(node, s);
        if (s.starts_with("::")) s.remove_prefix(2);
        node.name = collapse_spaces(s);
    }

    void apply_tail(TypeNode& node, std::string_view s) {
        strip_suffix_qualifiers(node, s);
        if (s.empty()) return;
        if (s.starts_with("::")) {
            node.member = collapse_spaces(trim(s.substr(2)));
            return;
        }
        note(fmt::format("ignored text '{}' after '{}<...>'", s, node.name));
    }

    void unterminated(std::string_view where) {
        if (!_lenient) throw_error<ParseError>("unbalanced brackets: '{}' is not closed in '{}'", trim(where), _text);
        _complete = false;
        note(fmt::format("closed unterminated '{}'", trim(where)));
    }

    void note(std::string msg) {
        Log::debug("type parser: {}", msg);
        if (!_diagnostic.empty()) _diagnostic += "; ";
        _diagnostic += msg;
        _complete = false;
    }

    void skip_ws() {
        while (_pos < _text.size() && std::isspace(static_cast<unsigned char>(_text[_pos]))) ++_pos;
    }

    std::string_view _text;
    bool _lenient;
    std::size_t _pos{0};
    bool _complete{true};
    std::string _diagnostic;
};

} // namespace

TypeNode parse_type(std::string_view signature) {
    return SignatureParser{signature, false}.parse().node;
}

ParseResult parse_type_lenient(std::string_view signature) {
    return SignatureParser{signature, true}.parse();
}

std::string normalize_type(std::string_view signature) {
    return parse_type_lenient(signature).node.to_string();
}

} // namespace tileprint
