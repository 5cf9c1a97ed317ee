#include <tileprint/extract/descriptor_extractor.h>
#include <tileprint/extract/tuple_extractor.h>
#include <tileprint/extract/value_access.h>
#include <tileprint/util/log.h>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <vector>

namespace tileprint {

namespace {

enum class Slot { UpLengths, LowLengths, Coefficients, Scalar };

/**
 * Where one runtime parameter of a transform lives: the member holding it and, when the
 * value is also spelled in the transform's type, the template argument that carries it.
 */
struct FieldPlan {
    std::string_view member;
    Slot slot;
    bool required;
    int type_arg{-1};
};

std::vector<FieldPlan> plan_for(TransformKind kind) {
    static constexpr FieldPlan up_lengths{"up_lengths_", Slot::UpLengths, false};
    switch (kind) {
        case TransformKind::Embed:
            return {{"up_lengths_", Slot::UpLengths, true, 0}, {"coefficients_", Slot::Coefficients, true, 1}};
        case TransformKind::Unmerge:
            return {{"up_lengths_", Slot::UpLengths, true, 0}, {"coefficients_", Slot::Coefficients, false}};
        case TransformKind::Merge:
        case TransformKind::MergeV2MagicDivision:
            return {{"low_lengths_", Slot::LowLengths, true, 0}, up_lengths};
        case TransformKind::PassThrough:
        case TransformKind::Xor:
            return {up_lengths};
        case TransformKind::Pad:
            return {up_lengths, {"left_pad_length_", Slot::Scalar, true, 1}, {"right_pad_length_", Slot::Scalar, true, 2}};
        case TransformKind::LeftPad:
            return {up_lengths, {"left_pad_length_", Slot::Scalar, true, 1}};
        case TransformKind::RightPad:
            return {up_lengths, {"right_pad_length_", Slot::Scalar, true, 1}};
        case TransformKind::Slice:
            return {up_lengths, {"slice_begin_", Slot::Scalar, true, 1}, {"slice_end_", Slot::Scalar, true, 2}};
        case TransformKind::Freeze:
            return {{"low_idx_", Slot::Scalar, true, 0}};
        case TransformKind::Replicate:
        case TransformKind::Unknown:
            break;
    }
    return {};
}

std::string display_name(std::string_view member) {
    if (member.ends_with('_')) member.remove_suffix(1);
    return std::string{member};
}

AccessResult<IntList> read_list(const LiveValue& value, const RenderOptions& options) {
    auto type = type_of(value);
    if (!type) return AccessFailure{AccessFailureReason::NotConvertible, "member type unknown"};
    return read_int_list(*type, value, options);
}

AccessResult<std::int64_t> read_scalar(const LiveValue& value, const RenderOptions& options) {
    auto scalar = read_integer(value, options.max_sane_value);
    if (scalar || scalar.failure().reason != AccessFailureReason::NotConvertible) return scalar;
    // freeze keeps its index as multi_index<1>
    auto list = read_list(value, options);
    if (list && list->size() == 1) return list->front();
    return scalar;
}

template<typename T>
Field<T> settle(AccessResult<T> result) {
    if (result) return std::move(result).value();
    if (result.failure().reason == AccessFailureReason::TypeOnly) return {};
    return result.failure();
}

void dump_raw_fields(Transform& t, const LiveValue& runtime) {
    auto names = runtime.field_names();
    if (!names) return;
    for (const auto& name : *names) {
        auto text = runtime.field(name).and_then([](const LiveValuePtr& v) { return v->summary(); });
        t.raw_fields.emplace_back(name, text ? text.value() : fmt::format("<unavailable: {}>", text.failure().to_string()));
    }
}

} // namespace

bool is_descriptor_type(const TypeNode& type) {
    return type.is("tensor_descriptor") || type.is("tensor_adaptor");
}

Transform extract_transform(const TypeNode& type, const IntList& lower_dims, const IntList& upper_dims,
                            const AccessResult<LiveValuePtr>& runtime, const RenderOptions& options) {
    Transform t;
    t.kind = transform_kind_of(type);
    t.type_name = type.to_string();

    if (!arity_of(t.kind).accepts(lower_dims.size(), upper_dims.size())) {
        Log::debug("extraction inconsistency: {} with {} lower and {} upper dimensions",
                   to_string(t.kind), lower_dims.size(), upper_dims.size());
        return Transform::placeholder(std::move(t.type_name));
    }
    t.lower_dims = lower_dims;
    t.upper_dims = upper_dims;

    if (t.kind == TransformKind::Unknown) {
        if (runtime) dump_raw_fields(t, *runtime.value());
        return t;
    }

    for (const auto& plan : plan_for(t.kind)) {
        auto member = runtime.and_then([&](const LiveValuePtr& v) { return v->field(plan.member); });
        if (!member && runtime && plan.required && member.failure().reason == AccessFailureReason::NoSuchField) {
            Log::debug("extraction inconsistency: {} has no {}", to_string(t.kind), plan.member);
            return Transform::placeholder(std::move(t.type_name));
        }

        const TypeNode* compile_time = plan.type_arg >= 0 ? type.arg(static_cast<std::size_t>(plan.type_arg)) : nullptr;

        if (plan.slot == Slot::Scalar) {
            auto value = member.and_then([&](const LiveValuePtr& v) { return read_scalar(*v, options); });
            if (!value && compile_time) {
                if (auto c = compile_time->as_integer(); c && !compile_time->is_leaf()) value = *c;
            }
            Field<std::int64_t> field = settle(std::move(value));
            if (!field.is_absent()) t.scalars.push_back({display_name(plan.member), std::move(field)});
            continue;
        }

        auto list = member.and_then([&](const LiveValuePtr& v) { return read_list(*v, options); });
        if (!list && compile_time) {
            auto from_type = read_int_list(*compile_time, TypeOnlyValue{compile_time->to_string()}, options);
            if (from_type) list = std::move(from_type);
        }
        Field<IntList> field = settle(std::move(list));
        switch (plan.slot) {
            case Slot::UpLengths: t.up_lengths = std::move(field); break;
            case Slot::LowLengths: t.low_lengths = std::move(field); break;
            case Slot::Coefficients: t.coefficients = std::move(field); break;
            case Slot::Scalar: break;
        }
    }
    return t;
}

Descriptor extract_descriptor(const TypeNode& type, const LiveValue& value, const RenderOptions& options) {
    Descriptor d;
    d.entity = type.is("tensor_adaptor") ? DescriptorEntity::Adaptor : DescriptorEntity::Descriptor;

    const TypeNode* transforms_type = type.arg(0);
    const TypeNode* lower_idss = type.arg(1);
    const TypeNode* upper_idss = type.arg(2);

    if (transforms_type) {
        auto stored = value.field("transforms_").and_then([&](const LiveValuePtr& tuple) {
            return extract_tuple(*transforms_type, *tuple);
        });
        for (std::size_t i = 0; i < transforms_type->args.size(); ++i) {
            const TypeNode& transform_type = transforms_type->args[i];
            std::optional<IntList> lower;
            std::optional<IntList> upper;
            if (lower_idss && lower_idss->arg(i)) lower = lower_idss->arg(i)->sequence_values();
            if (upper_idss && upper_idss->arg(i)) upper = upper_idss->arg(i)->sequence_values();
            if (!lower || !upper) {
                Log::debug("extraction inconsistency: dimension ids of transform [{}] missing from type", i);
                d.transforms.push_back(Transform::placeholder(transform_type.to_string()));
                continue;
            }

            AccessResult<LiveValuePtr> runtime = AccessFailure{AccessFailureReason::Unavailable, "transforms_"};
            if (!stored) {
                runtime = stored.failure();
            } else if (i < stored->elements.size()) {
                const auto& element = stored->elements[i];
                if (auto* live = element.live()) runtime = *live;
                else if (auto* failure = element.failure()) runtime = *failure;
            }
            d.transforms.push_back(extract_transform(transform_type, *lower, *upper, runtime, options));
        }
    } else {
        Log::debug("{} type carries no transform list", to_string(d.entity));
    }

    auto ids_from = [](const TypeNode* t, std::string_view what) -> Field<IntList> {
        if (!t) return AccessFailure{AccessFailureReason::NotConvertible, fmt::format("{} missing from type", what)};
        if (auto ids = t->sequence_values()) return *ids;
        return AccessFailure{AccessFailureReason::NotConvertible, fmt::format("{} is not a sequence", what)};
    };
    if (d.entity == DescriptorEntity::Descriptor) {
        d.bottom_dimension_ids = IntList{0};
        d.top_dimension_ids = ids_from(type.arg(3), "top dimension ids");
    } else {
        d.bottom_dimension_ids = ids_from(type.arg(3), "bottom dimension ids");
        d.top_dimension_ids = ids_from(type.arg(4), "top dimension ids");
    }

    // Runtime scalars win; the type supplies a fallback when they cannot be read.
    int sane_reads{0};
    int insane_reads{0};
    auto scalar = [&](AccessResult<std::int64_t> runtime, std::optional<std::int64_t> fallback,
                      bool counts_for_init) -> Field<std::int64_t> {
        if (runtime) {
            if (counts_for_init) ++sane_reads;
            return *runtime;
        }
        const auto reason = runtime.failure().reason;
        if (counts_for_init && reason == AccessFailureReason::Insane) ++insane_reads;
        if (fallback) return *fallback;
        if (reason == AccessFailureReason::TypeOnly || reason == AccessFailureReason::NoSuchField) return {};
        return runtime.failure();
    };
    auto runtime_field = [&](const LiveValue& owner, std::string_view name) {
        return read_integer_field(owner, name, options.max_sane_value);
    };

    std::optional<std::int64_t> type_ntransform;
    if (transforms_type) type_ntransform = static_cast<std::int64_t>(transforms_type->args.size());

    std::optional<std::int64_t> type_ndim_hidden;
    {
        std::int64_t highest{-1};
        auto note = [&](const IntList& ids) {
            for (auto id : ids) highest = std::max(highest, id);
        };
        for (const auto& t : d.transforms) {
            note(t.lower_dims);
            note(t.upper_dims);
        }
        if (auto* ids = d.bottom_dimension_ids.get()) note(*ids);
        if (auto* ids = d.top_dimension_ids.get()) note(*ids);
        if (highest >= 0) type_ndim_hidden = highest + 1;
    }

    std::optional<std::int64_t> type_ndim_top;
    if (auto* ids = d.top_dimension_ids.get()) type_ndim_top = static_cast<std::int64_t>(ids->size());
    std::optional<std::int64_t> type_ndim_bottom;
    if (auto* ids = d.bottom_dimension_ids.get()) type_ndim_bottom = static_cast<std::int64_t>(ids->size());

    if (d.entity == DescriptorEntity::Descriptor) {
        std::optional<std::int64_t> type_space;
        if (const TypeNode* space = type.arg(4)) {
            if (!space->is_leaf()) type_space = space->as_integer();
        }
        d.element_space_size = scalar(runtime_field(value, "element_space_size_"), type_space, true);
    }
    d.ntransform = scalar(runtime_field(value, "ntransform_"), type_ntransform, true);
    d.ndim_hidden = scalar(runtime_field(value, "ndim_hidden_"), type_ndim_hidden, true);
    d.ndim_top = scalar(runtime_field(value, "ndim_top_"), type_ndim_top, false);

    AccessResult<std::int64_t> bottom_count = d.entity == DescriptorEntity::Adaptor
        ? runtime_field(value, "ndim_bottom_")
        : base_subobject(value, "tensor_adaptor").and_then([&](const LiveValuePtr& base) {
              return runtime_field(*base, "ndim_bottom_");
          });
    d.ndim_bottom = scalar(std::move(bottom_count), type_ndim_bottom, false);

    d.uninitialized = insane_reads > 0 && sane_reads == 0;

    for (const auto& problem : d.topology_problems()) Log::debug("{}: {}", to_string(d.entity), problem);
    return d;
}

} // namespace tileprint
