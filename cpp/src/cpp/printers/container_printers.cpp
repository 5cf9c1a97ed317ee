#include <tileprint/printers/container_printers.h>
#include <tileprint/extract/tuple_extractor.h>
#include <tileprint/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

namespace tileprint {

std::string scalar_text(const LiveValue& value) {
    if (auto v = value.to_int()) return fmt::format("{}", *v);
    auto text = value.summary();
    return text ? text.value() : placeholder(text.failure());
}

namespace {

std::string element_text(const ContainerElement& element) {
    if (auto* c = element.constant()) return fmt::format("{}", *c);
    if (auto* live = element.live()) return scalar_text(**live);
    return placeholder(*element.failure());
}

std::string element_list(const ContainerModel& model) {
    std::vector<std::string> items;
    items.reserve(model.elements.size());
    for (const auto& element : model.elements) items.push_back(element_text(element));
    if (model.truncated()) return fmt::format("[{}, ... ({} total)]", fmt::join(items, ", "), model.declared_size);
    return fmt::format("[{}]", fmt::join(items, ", "));
}

std::string element_type_name(const TypeNode& type) {
    if (auto name = data_type_name(type)) return *name;
    return type.to_string();
}

} // namespace

std::string TuplePrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    auto model = extract_tuple(type, value);
    if (!model) return fmt::format("tuple{{{}}}", placeholder(model.failure()));

    const auto& elements = model->elements;
    if (elements.empty()) return "tuple<0 elements> {}";

    std::string out = fmt::format("tuple<{} {}> {{\n", elements.size(), elements.size() == 1 ? "element" : "elements");
    for (std::size_t i = 0; i < elements.size(); ++i) {
        const auto& element = elements[i];
        std::string child;
        if (auto* c = element.constant()) child = fmt::format("{}", *c);
        else if (auto* live = element.live()) child = context.render(element.type, **live);
        else if (element.failure()->reason == AccessFailureReason::TypeOnly)
            child = context.render(element.type, TypeOnlyValue{element.type.to_string()});
        else child = placeholder(*element.failure());
        out += fmt::format("  [{}]: {}\n", i, context.indent(child, 2));
    }
    out += "}";
    return out;
}

std::string ArrayPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    auto size = declared_array_size(type);
    if (!size) return format_error("could not determine array size", "array");

    std::string head = type.is("multi_index")
        ? fmt::format("multi_index<{}>", *size)
        : fmt::format("array<{}, {}>", element_type_name(type.args.front()), *size);

    auto model = extract_array(type, value, context.options().max_elements);
    if (!model) return fmt::format("{} = {}", head, placeholder(model.failure()));
    return fmt::format("{} = {}", head, element_list(*model));
}

std::string ThreadBufferPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    auto size = declared_array_size(type);
    if (!size) return format_error("could not parse thread_buffer type", "thread_buffer");

    std::string out = fmt::format("thread_buffer<{}, {}> {{\n", element_type_name(type.args.front()), *size);
    out += fmt::format("  size: {}\n", *size);

    auto model = extract_array(type, value, context.options().thread_buffer_preview);
    if (!model) {
        out += fmt::format("  data: {}\n", placeholder(model.failure()));
    } else if (!model->elements.empty()) {
        out += fmt::format("  data (first {}): {}\n", model->elements.size(), element_list(*model));
    }
    out += "}";
    return out;
}

} // namespace tileprint
