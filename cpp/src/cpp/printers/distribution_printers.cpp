#include <tileprint/printers/distribution_printers.h>
#include <tileprint/extract/coordinate_extractor.h>

#include <fmt/format.h>

#include <algorithm>

namespace tileprint {

namespace {

std::string format_nested_lists(const std::vector<IntList>& lists) {
    std::string out = "[";
    for (std::size_t i = 0; i < lists.size(); ++i) {
        if (i > 0) out += ", ";
        out += format_int_list(lists[i]);
    }
    out += "]";
    return out;
}

std::string rh_target(const DistributionEncoding& e, std::int64_t major, std::int64_t minor) {
    std::string out = major == 0 ? fmt::format("R[{}]", minor) : fmt::format("H{}[{}]", major - 1, minor);
    if (auto length = e.rh_length(major, minor)) out += fmt::format(" (length={})", *length);
    return out;
}

const TypeNode* encoding_type_of(const TypeNode& distribution) {
    if (const TypeNode* third = distribution.arg(2); third && third->is("tile_distribution_encoding")) return third;
    return distribution.find("tile_distribution_encoding");
}

} // namespace

std::string render_encoding(const DistributionEncoding& e) {
    std::string out = "{\n";
    out += fmt::format("  RsLengths: {}\n", format_int_list(e.rs_lengths));
    out += fmt::format("  HsLengthss: {}\n", format_nested_lists(e.hs_lengthss));

    const bool has_ps = !e.ps_to_rhss_major.empty() && !e.ps_to_rhss_minor.empty();
    const bool has_ys = !e.ys_to_rhs_major.empty() && !e.ys_to_rhs_minor.empty();
    if (has_ps) {
        out += fmt::format("  Ps2RHssMajor: {}\n", format_nested_lists(e.ps_to_rhss_major));
        out += fmt::format("  Ps2RHssMinor: {}\n", format_nested_lists(e.ps_to_rhss_minor));
    }
    if (has_ys) {
        out += fmt::format("  Ys2RHsMajor: {}\n", format_int_list(e.ys_to_rhs_major));
        out += fmt::format("  Ys2RHsMinor: {}\n", format_int_list(e.ys_to_rhs_minor));
    }

    if (has_ps) {
        out += "  Ps mappings (with lengths):\n";
        const auto np = std::min(e.ps_to_rhss_major.size(), e.ps_to_rhss_minor.size());
        for (std::size_t p = 0; p < np; ++p) {
            out += fmt::format("    P[{}]:\n", p);
            const auto& majors = e.ps_to_rhss_major[p];
            const auto& minors = e.ps_to_rhss_minor[p];
            for (std::size_t k = 0; k < std::min(majors.size(), minors.size()); ++k)
                out += fmt::format("      -> {}\n", rh_target(e, majors[k], minors[k]));
        }
    }
    if (has_ys) {
        out += "  Ys mappings (with lengths):\n";
        const auto ny = std::min(e.ys_to_rhs_major.size(), e.ys_to_rhs_minor.size());
        for (std::size_t y = 0; y < ny; ++y)
            out += fmt::format("    Y[{}] -> {}\n", y, rh_target(e, e.ys_to_rhs_major[y], e.ys_to_rhs_minor[y]));
    }
    out += "}";
    return out;
}

std::string TileDistributionPrinter::render(const TypeNode& type, const LiveValue& value, const RenderContext& context) const {
    std::string out = "tile_distribution{\n";
    if (const TypeNode* encoding_type = encoding_type_of(type)) {
        if (auto encoding = extract_encoding(*encoding_type))
            out += fmt::format("  encoding: {}\n", context.indent(render_encoding(*encoding)));
    }
    out += fmt::format("\n  ps_ys_to_xs_: {}\n", context.indent(context.render_member(value, "ps_ys_to_xs_", type.arg(0))));
    out += fmt::format("\n  ys_to_d_: {}\n", context.indent(context.render_member(value, "ys_to_d_", type.arg(1))));
    out += "}";
    return out;
}

std::string DistributionEncodingPrinter::render(const TypeNode& type, const LiveValue&, const RenderContext&) const {
    auto encoding = extract_encoding(type);
    return "tile_distribution_encoding" + (encoding ? render_encoding(*encoding) : std::string{"{}"});
}

} // namespace tileprint
