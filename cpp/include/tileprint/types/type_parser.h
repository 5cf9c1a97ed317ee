#ifndef TILEPRINT_TYPES_TYPE_PARSER_H
#define TILEPRINT_TYPES_TYPE_PARSER_H

#include <tileprint/types/type_node.h>

#include <string>
#include <string_view>

namespace tileprint {

/**
 * Outcome of a lenient parse.
 *
 * `complete` is false when the signature had to be repaired (missing closing brackets
 * from a debugger-truncated string, or trailing text after the top-level type); the
 * node is still a usable best-effort tree in that case and `diagnostic` says why.
 */
struct ParseResult {
    TypeNode node;
    bool complete{true};
    std::string diagnostic;
};

/**
 * Strict parse of a type signature.
 *
 * Top-level arguments are split on commas at angle-bracket depth zero; anything inside
 * parentheses is literal text. Qualifiers (`const`, `volatile`, elaborated-type keywords,
 * trailing `*`/`&`) are stripped into the node's flags at every level.
 *
 * @throws ParseError for an empty signature or any unbalanced bracket.
 */
TypeNode parse_type(std::string_view signature);

/**
 * Best-effort parse: unclosed brackets are closed implicitly and trailing text is dropped.
 *
 * @throws ParseError only for an empty signature or a stray closing '>' that cannot be
 *         attributed to any open argument list.
 */
ParseResult parse_type_lenient(std::string_view signature);

/** Canonical spelling of a signature, as produced by TypeNode::to_string. */
std::string normalize_type(std::string_view signature);

} // namespace tileprint

#endif // TILEPRINT_TYPES_TYPE_PARSER_H
