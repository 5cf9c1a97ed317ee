#include <tileprint/printers/fallback_printer.h>
#include <tileprint/printers/container_printers.h>

#include <fmt/format.h>

namespace tileprint {

std::string FallbackPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext&) const {
    if (value.is_type_only()) return type.to_string();

    auto names = value.field_names();
    if (!names || names->empty()) return scalar_text(value);

    std::string out = fmt::format("{} {{\n", type.to_string());
    for (const auto& name : *names) {
        auto member = value.field(name);
        out += fmt::format("  {}: {}\n", name, member ? scalar_text(**member) : placeholder(member.failure()));
    }
    out += "}";
    return out;
}

} // namespace tileprint
