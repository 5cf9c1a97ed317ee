/**
 * @file transform.h
 * @brief One coordinate transform of a tensor descriptor or adaptor.
 */

#ifndef TILEPRINT_MODEL_TRANSFORM_H
#define TILEPRINT_MODEL_TRANSFORM_H

#include <tileprint/types/access_result.h>
#include <tileprint/types/type_node.h>
#include <tileprint/util/string_utils.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tileprint {

enum class TransformKind {
    PassThrough,
    Embed,
    Unmerge,
    Merge,
    MergeV2MagicDivision,
    Replicate,
    Pad,
    LeftPad,
    RightPad,
    Xor,
    Slice,
    Freeze,
    Unknown
};

/** Display name used in text output and diagram labels ("merge_v2" for the magic-division merge). */
[[nodiscard]] std::string_view to_string(TransformKind kind);

/** Kind from the transform's own type, matched on the exact base name (`ck_tile::embed<...>` -> Embed). */
[[nodiscard]] TransformKind transform_kind_of(const TypeNode& type);

/**
 * Allowed number of lower and upper dimension ids for a kind. Unknown accepts anything.
 */
struct TransformArity {
    std::size_t min_lower{0};
    std::size_t max_lower{std::numeric_limits<std::size_t>::max()};
    std::size_t min_upper{0};
    std::size_t max_upper{std::numeric_limits<std::size_t>::max()};

    [[nodiscard]] bool accepts(std::size_t lower, std::size_t upper) const {
        return lower >= min_lower && lower <= max_lower && upper >= min_upper && upper <= max_upper;
    }
};

[[nodiscard]] TransformArity arity_of(TransformKind kind);

/** Scalar runtime parameter such as `left_pad_length` or `slice_begin`. */
struct NamedScalar {
    std::string name;
    Field<std::int64_t> value;

    bool operator==(const NamedScalar&) const = default;
};

struct Transform {
    TransformKind kind{TransformKind::Unknown};
    /// Canonical spelling of the transform's type.
    std::string type_name;
    IntList lower_dims;
    IntList upper_dims;
    Field<IntList> up_lengths;
    Field<IntList> low_lengths;
    Field<IntList> coefficients;
    std::vector<NamedScalar> scalars;
    /// `name: summary` pairs dumped for kinds with no dedicated reader.
    std::vector<std::pair<std::string, std::string>> raw_fields;

    /** Stand-in for a transform whose shape contradicts its kind: unknown kind, every list empty. */
    static Transform placeholder(std::string type_name);

    [[nodiscard]] bool has_parameters() const;

    bool operator==(const Transform&) const = default;
};

} // namespace tileprint

#endif // TILEPRINT_MODEL_TRANSFORM_H
