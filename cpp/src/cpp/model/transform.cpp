#include <tileprint/model/transform.h>

#include <unordered_map>

namespace tileprint {

std::string_view to_string(TransformKind kind) {
    switch (kind) {
        case TransformKind::PassThrough: return "pass_through";
        case TransformKind::Embed: return "embed";
        case TransformKind::Unmerge: return "unmerge";
        case TransformKind::Merge: return "merge";
        case TransformKind::MergeV2MagicDivision: return "merge_v2";
        case TransformKind::Replicate: return "replicate";
        case TransformKind::Pad: return "pad";
        case TransformKind::LeftPad: return "left_pad";
        case TransformKind::RightPad: return "right_pad";
        case TransformKind::Xor: return "xor";
        case TransformKind::Slice: return "slice";
        case TransformKind::Freeze: return "freeze";
        case TransformKind::Unknown: return "unknown";
    }
    return "unknown";
}

TransformKind transform_kind_of(const TypeNode& type) {
    static const std::unordered_map<std::string_view, TransformKind> kinds{
        {"pass_through", TransformKind::PassThrough},
        {"embed", TransformKind::Embed},
        {"unmerge", TransformKind::Unmerge},
        {"merge", TransformKind::Merge},
        {"merge_v2_magic_division", TransformKind::MergeV2MagicDivision},
        {"merge_v3_division_mod", TransformKind::MergeV2MagicDivision},
        {"replicate", TransformKind::Replicate},
        {"pad", TransformKind::Pad},
        {"left_pad", TransformKind::LeftPad},
        {"right_pad", TransformKind::RightPad},
        {"xor_t", TransformKind::Xor},
        {"slice", TransformKind::Slice},
        {"freeze", TransformKind::Freeze},
    };
    auto it = kinds.find(type.base_name());
    return it == kinds.end() ? TransformKind::Unknown : it->second;
}

TransformArity arity_of(TransformKind kind) {
    constexpr auto many = std::numeric_limits<std::size_t>::max();
    switch (kind) {
        case TransformKind::PassThrough:
        case TransformKind::Pad:
        case TransformKind::LeftPad:
        case TransformKind::RightPad:
        case TransformKind::Slice:
            return {1, 1, 1, 1};
        case TransformKind::Embed:
        case TransformKind::Unmerge:
            return {1, 1, 1, many};
        case TransformKind::Merge:
        case TransformKind::MergeV2MagicDivision:
            return {1, many, 1, 1};
        case TransformKind::Replicate:
            return {0, 0, 1, many};
        case TransformKind::Xor:
            return {2, 2, 2, 2};
        case TransformKind::Freeze:
            return {1, 1, 0, 0};
        case TransformKind::Unknown:
            break;
    }
    return {};
}

Transform Transform::placeholder(std::string type_name) {
    Transform t;
    t.kind = TransformKind::Unknown;
    t.type_name = std::move(type_name);
    return t;
}

bool Transform::has_parameters() const {
    return !up_lengths.is_absent() || !low_lengths.is_absent() || !coefficients.is_absent() ||
           !scalars.empty() || !raw_fields.empty();
}

} // namespace tileprint
