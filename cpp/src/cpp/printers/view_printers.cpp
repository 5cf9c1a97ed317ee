#include <tileprint/printers/view_printers.h>
#include <tileprint/extract/tuple_extractor.h>
#include <tileprint/extract/value_access.h>
#include <tileprint/types/type_parser.h>

#include <fmt/format.h>

namespace tileprint {

namespace {

/** First `(…enum_name)N` literal anywhere in the tree. */
std::optional<std::int64_t> enum_argument(const TypeNode& type, std::string_view enum_name) {
    if (type.is_leaf() && type.name.starts_with('(')) {
        auto close = type.name.find(')');
        if (close != std::string::npos && std::string_view{type.name}.substr(0, close).ends_with(enum_name))
            return parse_integer_literal(type.name);
    }
    for (const auto& a : type.args) {
        if (auto v = enum_argument(a, enum_name)) return v;
    }
    return std::nullopt;
}

bool has_const(const TypeNode& type) {
    if (type.is_const) return true;
    for (const auto& a : type.args) {
        if (has_const(a)) return true;
    }
    return false;
}

void append_data_type(std::string& out, const TypeNode& type) {
    if (auto data_type = data_type_name(type)) out += fmt::format("  data_type: {}\n", *data_type);
}

/** Lengths spelled in the type as a tuple of constants, e.g. the window lengths of a tile window. */
std::optional<IntList> static_lengths(const TypeNode* lengths, const RenderOptions& options) {
    if (!lengths) return std::nullopt;
    auto values = read_int_list(*lengths, TypeOnlyValue{lengths->to_string()}, options);
    if (!values || values->empty()) return std::nullopt;
    return values.value();
}

AccessResult<IntList> member_int_list(const LiveValue& owner, std::string_view name, const RenderOptions& options) {
    return owner.field(name).and_then([&](const LiveValuePtr& member) -> AccessResult<IntList> {
        auto type = type_of(*member);
        if (!type) return AccessFailure{AccessFailureReason::NotConvertible, std::string{name}};
        return read_int_list(*type, *member, options);
    });
}

const TypeNode* distribution_type_of(const TypeNode& type, std::size_t position) {
    if (const TypeNode* arg = type.arg(position); arg && arg->is("tile_distribution")) return arg;
    return type.find("tile_distribution");
}

} // namespace

std::string address_space_name(std::int64_t value) {
    switch (value) {
        case 1: return "global";
        case 3: return "lds";
        default: return fmt::format("address_space_enum({})", value);
    }
}

std::string memory_operation_name(std::int64_t value) {
    switch (value) {
        case 0: return "set";
        case 1: return "atomic_add";
        case 2: return "atomic_max";
        default: return fmt::format("op_{}", value);
    }
}

std::string TensorViewPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    std::string out = "tensor_view{\n";
    append_data_type(out, type);
    if (has_const(type)) out += "  const: true\n";

    out += fmt::format("\n  descriptor: {}\n", context.indent(context.render_member(value, "desc_", type.arg(1))));

    if (const TypeNode* buffer = type.arg(0); buffer && buffer->is("buffer_view")) {
        out += "\n  buffer_view: {\n";
        if (auto space = enum_argument(*buffer, "address_space_enum"))
            out += fmt::format("    address_space: {}\n", address_space_name(*space));
        out += "  }\n";
    }
    out += "}";
    return out;
}

std::string TileWindowPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    const auto& options = context.options();
    const bool static_distribution = type.base_name().starts_with("tile_window_with_static_distribution");

    std::string out = fmt::format("{}{{\n", type.base_name());
    append_data_type(out, type);

    auto lengths = member_int_list(value, "window_lengths_", options);
    if (lengths) out += fmt::format("  window_dims: {}\n", format_dims(*lengths));
    else if (auto from_type = static_lengths(type.arg(1), options)) out += fmt::format("  window_dims: {}\n", format_dims(*from_type));

    auto origin = member_int_list(value, "window_origin_", options);
    if (origin) {
        out += fmt::format("  window_origin: {}\n", format_int_list(*origin));
    } else if (origin.failure().reason != AccessFailureReason::TypeOnly &&
               origin.failure().reason != AccessFailureReason::NoSuchField) {
        out += fmt::format("  window_origin: {}\n", placeholder(origin.failure()));
    }

    if (static_distribution)
        out += fmt::format("\n  tile_dstr_: {}\n", context.indent(context.render_member(value, "tile_dstr_", type.arg(2))));

    out += fmt::format("\n  bottom_tensor_view_: {}\n",
                       context.indent(context.render_member(value, "bottom_tensor_view_", type.arg(0))));

    if (value.field("pre_computed_coords_")) out += "\n  pre_computed_coords_: present\n";
    out += "}";
    return out;
}

std::string StaticDistributedTensorPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    std::string out = "static_distributed_tensor{\n";
    append_data_type(out, type);

    auto buffer = value.field("thread_buf_");
    const bool has_runtime_data = buffer && (*buffer)->field("data").and_then([](const LiveValuePtr& data) {
        return data->element(0);
    }).ok();

    if (has_runtime_data) {
        out += fmt::format("\n  thread_buffer: {}\n", context.indent(context.render(**buffer)));
        out += "}";
        return out;
    }

    if (buffer) {
        if (auto buffer_type = type_of(**buffer)) {
            if (auto size = declared_array_size(*buffer_type)) out += fmt::format("  thread_buffer_size: {}\n", *size);
        }
    }
    if (const TypeNode* distribution = distribution_type_of(type, 1)) {
        out += fmt::format("\n  tile_distribution: {}\n",
                           context.indent(context.render(*distribution, TypeOnlyValue{distribution->to_string()})));
    }
    out += "}";
    return out;
}

std::string TileScatterGatherPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    std::string out = "tile_scatter_gather{\n";
    append_data_type(out, type);
    if (auto dims = static_lengths(type.arg(1), context.options())) out += fmt::format("  tile_dims: {}\n", format_dims(*dims));
    if (auto op = enum_argument(type, "memory_operation_enum"))
        out += fmt::format("  memory_operation: {}\n", memory_operation_name(*op));

    if (const TypeNode* distribution = distribution_type_of(type, 2)) {
        out += fmt::format("\n  tile_distribution: {}\n",
                           context.indent(context.render(*distribution, TypeOnlyValue{distribution->to_string()})));
    }

    if (auto view = value.field("bottom_tensor_view_"))
        out += fmt::format("\n  bottom_tensor_view_: {}\n", context.indent(context.render(**view)));
    out += "}";
    return out;
}

} // namespace tileprint
