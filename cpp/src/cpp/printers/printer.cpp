#include <tileprint/printers/printer.h>
#include <tileprint/printers/dispatch_table.h>
#include <tileprint/extract/value_access.h>
#include <tileprint/util/errors.h>
#include <tileprint/util/log.h>

#include <fmt/format.h>

namespace tileprint {

std::string placeholder(const AccessFailure& failure) {
    if (failure.detail.empty()) return fmt::format("<{}>", to_string(failure.reason));
    return fmt::format("<{}: {}>", to_string(failure.reason), failure.detail);
}

std::string RenderContext::render(const TypeNode& type, const LiveValue& value) const {
    if (_depth >= _options.max_depth) return type.to_string();
    const Printer& printer = _table.resolve(type);
    try {
        return printer.render(type, value, nested());
    } catch (const std::exception& e) {
        Log::debug("printer '{}' failed on {}: {}", printer.name(), type.base_name(), e.what());
        return format_error(e.what(), printer.name());
    }
}

std::string RenderContext::render(const LiveValue& value) const {
    if (auto type = type_of(value)) return render(*type, value);
    auto text = value.summary();
    return text ? text.value() : placeholder(text.failure());
}

std::string RenderContext::render_member(const LiveValue& owner, std::string_view name,
                                         const TypeNode* declared) const {
    auto member = owner.field(name);
    if (member) {
        if (auto type = type_of(**member)) return render(*type, **member);
        if (declared) return render(*declared, **member);
        return render(**member);
    }
    if (declared) return render(*declared, TypeOnlyValue{declared->to_string()});
    return placeholder(member.failure());
}

std::string RenderContext::indent(std::string_view block, std::size_t levels) const {
    return indent_continuation(block, levels * _options.indent_width);
}

} // namespace tileprint
