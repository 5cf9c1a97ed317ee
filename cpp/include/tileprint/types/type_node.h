/**
 * @file type_node.h
 * @brief Parsed form of a C++ type signature as reported by the debugger.
 *
 * A TypeNode is one level of a (possibly deeply nested) template signature such as
 * `ck_tile::tensor_descriptor<ck_tile::tuple<...>, ck_tile::tuple<...>, ...>`.
 * Non-type template arguments (`8192l`, `true`, `(ck_tile::address_space_enum)1`)
 * are leaves whose name is the literal text.
 */

#ifndef TILEPRINT_TYPES_TYPE_NODE_H
#define TILEPRINT_TYPES_TYPE_NODE_H

#include <tileprint/util/string_utils.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileprint {

struct TypeNode {
    /// Namespace-qualified name with cv/ref/pointer qualifiers removed.
    std::string name;
    /// Ordered template arguments; empty for leaves.
    std::vector<TypeNode> args;
    /// True when the signature carried an argument list, so `tuple<>` differs from `tuple`.
    bool is_template{false};
    bool is_const{false};
    bool is_volatile{false};
    /// Trailing pointer/reference declarators in source order, e.g. "*", "&", "*&".
    std::string indirection;
    /// Nested name following the argument list, e.g. "BottomTensorView" for `tile_window<...>::BottomTensorView`.
    std::string member;

    /** Last `::` component of `name`, e.g. "tensor_descriptor" for "ck_tile::tensor_descriptor". */
    [[nodiscard]] std::string_view base_name() const;

    /** Everything before the last `::`, empty for unqualified names. */
    [[nodiscard]] std::string_view namespace_name() const;

    [[nodiscard]] bool is(std::string_view base) const { return base_name() == base; }

    [[nodiscard]] bool is_leaf() const { return args.empty(); }

    [[nodiscard]] const TypeNode* arg(std::size_t i) const { return i < args.size() ? &args[i] : nullptr; }

    /**
     * Integer value of a non-type argument.
     *
     * Handles literal suffixes (`8192l`, `4ul`), sign, `true`/`false`, C-style enum casts
     * (`(ck_tile::address_space_enum)3`) and integral constant wrappers
     * (`ck_tile::constant<8>`, `ck_tile::number<8>`, `std::integral_constant<int, 8>`).
     */
    [[nodiscard]] std::optional<std::int64_t> as_integer() const;

    /** Values of a `sequence<...>` node; nullopt if this is not a sequence or an element is not an integer. */
    [[nodiscard]] std::optional<IntList> sequence_values() const;

    /** Depth-first search (self included) for the first node with the given base name. */
    [[nodiscard]] const TypeNode* find(std::string_view base) const;

    /** Maximum nesting depth, 1 for a leaf. */
    [[nodiscard]] std::size_t depth() const;

    /** Canonical re-serialisation; parsing it yields an equal tree. */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TypeNode& other) const = default;
};

/** Parses a leaf literal such as "8192l", "-1", "true" or "(enum_t)2". */
std::optional<std::int64_t> parse_integer_literal(std::string_view text);

/**
 * Human readable element type for a tensor-like signature ("float16", "float", "int", ...),
 * found by a depth-first walk of the tree looking for a known scalar leaf.
 */
std::optional<std::string> data_type_name(const TypeNode& type);

} // namespace tileprint

#endif // TILEPRINT_TYPES_TYPE_NODE_H
