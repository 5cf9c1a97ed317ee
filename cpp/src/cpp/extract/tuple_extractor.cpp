#include <tileprint/extract/tuple_extractor.h>
#include <tileprint/extract/value_access.h>
#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>

#include <fmt/format.h>

#include <algorithm>

namespace tileprint {

std::string_view to_string(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::Tuple: return "tuple";
        case ContainerKind::Array: return "array";
        case ContainerKind::MultiIndex: return "multi_index";
        case ContainerKind::ThreadBuffer: return "thread_buffer";
    }
    return "tuple";
}

namespace {

bool is_compile_time_constant(const TypeNode& t) {
    return !t.is_leaf() && t.as_integer().has_value();
}

AccessResult<LiveValuePtr> tuple_slot(const LiveValue& storage, std::size_t index) {
    auto names = storage.field_names();
    if (!names) return names.failure();
    for (const auto& name : *names) {
        try {
            auto node = parse_type_lenient(name).node;
            if (!node.is("tuple_object")) continue;
            const TypeNode* idx = node.arg(0);
            if (idx && idx->as_integer() == static_cast<std::int64_t>(index)) {
                return storage.field(name).and_then([](const LiveValuePtr& slot) { return slot->field("element"); });
            }
        } catch (const ParseError&) {
            continue;
        }
    }
    return AccessFailure{AccessFailureReason::NoSuchField, fmt::format("tuple_object<{}>", index)};
}

} // namespace

AccessResult<ContainerModel> extract_tuple(const TypeNode& type, const LiveValue& value) {
    ContainerModel model;
    model.kind = ContainerKind::Tuple;
    model.declared_size = type.args.size();

    const bool needs_runtime = std::any_of(type.args.begin(), type.args.end(),
                                           [](const TypeNode& t) { return !is_compile_time_constant(t); });

    std::optional<AccessResult<LiveValuePtr>> storage;
    if (needs_runtime) {
        storage.emplace(base_subobject(value, "tuple_base"));
        if (!storage->ok() && storage->failure().reason != AccessFailureReason::TypeOnly) return storage->failure();
    }

    model.elements.reserve(type.args.size());
    for (std::size_t i = 0; i < type.args.size(); ++i) {
        ContainerElement element{type.args[i], AccessFailure{}};
        if (is_compile_time_constant(element.type)) {
            element.payload = *element.type.as_integer();
        } else if (!storage->ok()) {
            element.payload = storage->failure();
        } else {
            auto slot = tuple_slot(*storage->value(), i);
            if (slot) element.payload = slot.value();
            else element.payload = slot.failure();
        }
        model.elements.push_back(std::move(element));
    }
    return model;
}

std::optional<std::size_t> declared_array_size(const TypeNode& type) {
    const TypeNode* size_arg{nullptr};
    if (type.is("multi_index")) size_arg = type.arg(0);
    else if (type.is("array") || type.is("thread_buffer") || type.is("statically_indexed_array")) size_arg = type.arg(1);
    if (!size_arg) return std::nullopt;
    auto n = size_arg->as_integer();
    if (!n || *n < 0) return std::nullopt;
    return static_cast<std::size_t>(*n);
}

AccessResult<ContainerModel> extract_array(const TypeNode& type, const LiveValue& value, std::size_t limit) {
    auto n = declared_array_size(type);
    if (!n) return AccessFailure{AccessFailureReason::NotConvertible, "could not determine array size"};

    ContainerModel model;
    model.declared_size = *n;
    if (type.is("multi_index")) {
        model.kind = ContainerKind::MultiIndex;
        model.element_type = TypeNode{.name = "ck_tile::index_t"};
    } else {
        model.kind = type.is("thread_buffer") ? ContainerKind::ThreadBuffer : ContainerKind::Array;
        model.element_type = type.args.front();
    }

    auto data = value.field("data");
    if (!data) return data.failure();

    const std::size_t count = std::min(*n, limit);
    model.elements.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        ContainerElement element{*model.element_type, AccessFailure{}};
        auto item = (*data)->element(i);
        if (item) element.payload = item.value();
        else element.payload = item.failure();
        model.elements.push_back(std::move(element));
    }
    return model;
}

AccessResult<std::int64_t> element_integer(const ContainerElement& element, std::int64_t max_sane) {
    if (auto* c = element.constant()) return *c;
    if (auto* live = element.live()) return read_integer(**live, max_sane);
    return *element.failure();
}

AccessResult<IntList> read_int_list(const TypeNode& type, const LiveValue& value, const RenderOptions& options) {
    if (auto seq = type.sequence_values()) return *seq;

    std::optional<AccessResult<ContainerModel>> model;
    if (type.is("tuple")) {
        model.emplace(extract_tuple(type, value));
    } else if (auto n = declared_array_size(type)) {
        model.emplace(extract_array(type, value, *n));
    } else {
        return AccessFailure{AccessFailureReason::NotConvertible, fmt::format("not an integer list: {}", type.base_name())};
    }
    if (!model->ok()) return model->failure();

    IntList values;
    for (const auto& element : model->value().elements) {
        auto v = element_integer(element, options.max_sane_value);
        if (!v) return v.failure();
        values.push_back(*v);
    }
    return values;
}

} // namespace tileprint
