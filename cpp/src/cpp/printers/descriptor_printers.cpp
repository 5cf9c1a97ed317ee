#include <tileprint/printers/descriptor_printers.h>
#include <tileprint/extract/coordinate_extractor.h>
#include <tileprint/extract/descriptor_extractor.h>

#include <fmt/format.h>

namespace tileprint {

namespace {

void append_scalar(std::string& out, std::string_view label, const Field<std::int64_t>& field) {
    if (field.has_value()) out += fmt::format("  {}: {}\n", label, field.value());
    else if (field.is_unavailable()) out += fmt::format("  {}: {}\n", label, placeholder(field.failure()));
}

void append_ids(std::string& out, std::string_view label, const Field<IntList>& field) {
    if (field.has_value()) out += fmt::format("  {}: {}\n", label, format_int_list(field.value()));
    else if (field.is_unavailable()) out += fmt::format("  {}: {}\n", label, placeholder(field.failure()));
}

void append_parameter(std::string& out, std::string_view label, const Field<IntList>& field) {
    if (field.has_value()) out += fmt::format("        {}: {}\n", label, format_int_list(field.value()));
    else if (field.is_unavailable()) out += fmt::format("        {}: {}\n", label, placeholder(field.failure()));
}

std::string format_hidden_entry(const Field<std::int64_t>& entry) {
    if (entry.has_value()) return fmt::format("{}", entry.value());
    if (entry.is_unavailable()) return placeholder(entry.failure());
    return placeholder(AccessFailure{AccessFailureReason::Unavailable, {}});
}

std::string format_hidden(const HiddenIndex& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += format_hidden_entry(values[i]);
    }
    return out + "]";
}

void append_transform(std::string& out, std::size_t index, const Transform& t) {
    if (t.kind == TransformKind::Unknown && !t.type_name.empty())
        out += fmt::format("    [{}] {} ({})\n", index, to_string(t.kind), t.type_name);
    else
        out += fmt::format("    [{}] {}\n", index, to_string(t.kind));
    out += fmt::format("        lower: {}\n", format_int_list(t.lower_dims));
    out += fmt::format("        upper: {}\n", format_int_list(t.upper_dims));
    append_parameter(out, "up_lengths", t.up_lengths);
    append_parameter(out, "low_lengths", t.low_lengths);
    append_parameter(out, "coefficients", t.coefficients);
    for (const auto& scalar : t.scalars) {
        if (scalar.value.has_value()) out += fmt::format("        {}: {}\n", scalar.name, scalar.value.value());
        else if (scalar.value.is_unavailable()) out += fmt::format("        {}: {}\n", scalar.name, placeholder(scalar.value.failure()));
    }
    for (const auto& [field, text] : t.raw_fields) out += fmt::format("        {}: {}\n", field, text);
}

} // namespace

std::string render_descriptor(const Descriptor& d) {
    const auto entity = to_string(d.entity);
    if (d.uninitialized) return fmt::format("{}{{[UNINITIALIZED]}}", entity);

    std::string out = fmt::format("{}{{\n", entity);
    append_scalar(out, "element_space_size", d.element_space_size);
    append_scalar(out, "ntransform", d.ntransform);
    append_scalar(out, "ndim_hidden", d.ndim_hidden);
    append_scalar(out, "ndim_top", d.ndim_top);
    append_scalar(out, "ndim_bottom", d.ndim_bottom);
    append_ids(out, "bottom_dimension_ids", d.bottom_dimension_ids);
    append_ids(out, "top_dimension_ids", d.top_dimension_ids);

    if (!d.transforms.empty()) {
        out += "\n  Transforms:\n";
        for (std::size_t i = 0; i < d.transforms.size(); ++i) append_transform(out, i, d.transforms[i]);
    }
    out += "}";
    return out;
}

std::string render_coordinate(const CoordinateModel& c) {
    const bool plain = c.entity == CoordinateEntity::Coordinate;
    std::string out = plain ? "tensor_coordinate{\n" : "tensor_adaptor_coordinate{\n";

    if (c.idx_hidden.has_value()) out += fmt::format("  idx_hidden_ (data): {}\n", format_hidden(c.idx_hidden.value()));
    else if (c.idx_hidden.is_unavailable()) out += fmt::format("  idx_hidden_: {}\n", placeholder(c.idx_hidden.failure()));

    if (plain || !c.bottom_dimension_ids.empty())
        out += fmt::format("  bottom_dimension_ids: {}\n", format_int_list(c.bottom_dimension_ids));
    if (!c.top_dimension_ids.empty())
        out += fmt::format("  top_dimension_ids: {}\n", format_int_list(c.top_dimension_ids));

    if (const HiddenIndex* hidden = c.idx_hidden.get(); hidden && !hidden->empty()) {
        if (plain) {
            if (!c.top_dimension_ids.empty()) out += fmt::format("  index (top): {}\n", format_hidden(c.top_index()));
            out += fmt::format("  offset (bottom[0]): {}\n", format_hidden_entry(hidden->front()));
        } else {
            if (!c.top_dimension_ids.empty()) out += fmt::format("  top_index: {}\n", format_hidden(c.top_index()));
            if (!c.bottom_dimension_ids.empty()) out += fmt::format("  bottom_index: {}\n", format_hidden(c.bottom_index()));
        }
    }
    out += "}";
    return out;
}

std::string DescriptorPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    return render_descriptor(extract_descriptor(type, value, context.options()));
}

std::string CoordinatePrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    return render_coordinate(extract_coordinate(type, value, context.options()));
}

} // namespace tileprint
