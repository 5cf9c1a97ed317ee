#include <tileprint/diagram/mermaid_writer.h>
#include <tileprint/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace tileprint {

std::string_view link_color(TransformKind kind) {
    switch (kind) {
        case TransformKind::Embed: return "#fff3e0";
        case TransformKind::Unmerge: return "#fce4ec";
        case TransformKind::Merge:
        case TransformKind::MergeV2MagicDivision: return "#e8f5e9";
        case TransformKind::PassThrough: return "#f3e5f5";
        case TransformKind::Replicate: return "#e3f2fd";
        case TransformKind::Xor: return "#ffebee";
        case TransformKind::Pad:
        case TransformKind::LeftPad:
        case TransformKind::RightPad: return "#fff9c4";
        case TransformKind::Slice: return "#efebe9";
        case TransformKind::Freeze: return "#eceff1";
        case TransformKind::Unknown: break;
    }
    return "#f5f5f5";
}

std::string mermaid_node_id(std::int64_t id) {
    if (id < 0) return fmt::format("Dn{}", -id);
    return fmt::format("D{}", id);
}

namespace {

constexpr std::array<std::string_view, 5> directions{"TD", "TB", "LR", "BT", "RL"};

std::string comment_text(std::string_view title) {
    std::string text{title};
    std::replace(text.begin(), text.end(), '\n', ' ');
    return text;
}

} // namespace

std::string write_mermaid(const DiagramGraph& graph, std::string_view title, const DiagramOptions& options) {
    if (std::find(directions.begin(), directions.end(), options.direction) == directions.end())
        throw_error<std::invalid_argument>("unsupported mermaid direction '{}'", options.direction);

    std::string out = fmt::format("```mermaid\ngraph {}\n", options.direction);
    if (!title.empty()) out += fmt::format("    %% {}\n", comment_text(title));

    for (const auto& node : graph.nodes) out += fmt::format("    {}[\"{}\"]\n", mermaid_node_id(node.id), node.label);

    for (const auto& edge : graph.edges)
        out += fmt::format("    {} -->|\"{}\"| {}\n", mermaid_node_id(edge.from), edge.label, mermaid_node_id(edge.to));

    if (options.styled) {
        for (const auto& node : graph.nodes) {
            if (node.is_bottom) out += fmt::format("    style {} fill:{}\n", mermaid_node_id(node.id), options.bottom_fill);
            else if (node.is_top) out += fmt::format("    style {} fill:{}\n", mermaid_node_id(node.id), options.top_fill);
        }
        for (std::size_t i = 0; i < graph.edges.size(); ++i)
            out += fmt::format("    linkStyle {} stroke:{}\n", i, link_color(graph.edges[i].kind));
    }

    out += "```";
    return out;
}

} // namespace tileprint
