#include <tileprint/runtime/inspector.h>
#include <tileprint/diagram/diagram_builder.h>
#include <tileprint/diagram/mermaid_writer.h>
#include <tileprint/extract/descriptor_extractor.h>
#include <tileprint/extract/value_access.h>
#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>
#include <tileprint/util/log.h>

#include <fmt/format.h>

namespace tileprint {

namespace {

std::string literal_text(const LiveValue& value, std::string_view type_string) {
    auto summary = value.summary();
    std::string text = summary ? summary.value() : placeholder(summary.failure());
    if (type_string.empty()) return text;
    return fmt::format("{} = {}", type_string, text);
}

/** The value behind a pointer or reference, with its type; the value itself otherwise. */
struct Target {
    TypeNode type;
    LiveValuePtr holder;
    const LiveValue* value;
};

AccessResult<Target> resolve_target(TypeNode type, const LiveValue& value) {
    if (type.indirection.empty()) return Target{std::move(type), nullptr, &value};
    auto pointee = value.deref();
    if (!pointee) return pointee.failure();
    const LiveValue& target = **pointee;
    auto target_type = type_of(target);
    if (!target_type) {
        target_type = type;
        target_type->indirection.clear();
    }
    return Target{std::move(*target_type), *pointee, &target};
}

} // namespace

Inspector::Inspector(const PrinterDispatchTable& table, RenderOptions options, DiagramOptions diagram_options)
    : _table(table), _options(options), _diagram_options(std::move(diagram_options)) {}

std::string Inspector::to_string(const LiveValue& value) const {
    const std::string type_string = value.type_string();
    ParseResult parsed;
    try {
        parsed = parse_type_lenient(type_string);
    } catch (const ParseError& e) {
        Log::debug("unparseable type '{}': {}", type_string, e.what());
        return literal_text(value, type_string);
    }
    if (!parsed.complete) Log::debug("type repaired ({}): {}", parsed.diagnostic, type_string);

    auto target = resolve_target(std::move(parsed.node), value);
    if (!target) return fmt::format("{} = {}", type_string, placeholder(target.failure()));

    RenderContext context{_table, _options};
    auto out = context.render(target->type, *target->value);
    return out.empty() ? target->type.to_string() : out;
}

std::string Inspector::type_print(std::string_view type_string) const {
    auto parsed = parse_type_lenient(type_string);
    if (!parsed.complete) Log::debug("type repaired ({}): {}", parsed.diagnostic, type_string);
    RenderContext context{_table, _options};
    return context.render(parsed.node, TypeOnlyValue{parsed.node.to_string()});
}

std::optional<DiagramGraph> Inspector::diagram(const LiveValue& value) const {
    auto type = type_of(value);
    if (!type) return std::nullopt;
    auto target = resolve_target(std::move(*type), value);
    if (!target) return std::nullopt;

    if (is_descriptor_type(target->type))
        return build_diagram(extract_descriptor(target->type, *target->value, _options));

    if (!target->type.is("tensor_view")) return std::nullopt;

    if (auto desc = target->value->field("desc_")) {
        if (auto desc_type = type_of(**desc); desc_type && is_descriptor_type(*desc_type))
            return build_diagram(extract_descriptor(*desc_type, **desc, _options));
    }
    if (const TypeNode* declared = target->type.arg(1); declared && is_descriptor_type(*declared))
        return build_diagram(extract_descriptor(*declared, TypeOnlyValue{declared->to_string()}, _options));
    return std::nullopt;
}

std::string Inspector::mermaid(const LiveValue& value, std::string_view title) const {
    auto graph = diagram(value);
    if (!graph) return "Error: Not a tensor_descriptor or tensor_adaptor";
    return write_mermaid(*graph, title, _diagram_options);
}

const Printer* Inspector::lookup(const LiveValue& value) const {
    auto type = type_of(value);
    if (!type) return nullptr;
    return _table.match(*type);
}

} // namespace tileprint
