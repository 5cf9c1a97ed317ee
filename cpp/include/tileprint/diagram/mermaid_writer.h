#ifndef TILEPRINT_DIAGRAM_MERMAID_WRITER_H
#define TILEPRINT_DIAGRAM_MERMAID_WRITER_H

#include <tileprint/config/render_options.h>
#include <tileprint/diagram/diagram_graph.h>

#include <string>
#include <string_view>

namespace tileprint {

/** Stroke colour used for edges of a transform kind. */
[[nodiscard]] std::string_view link_color(TransformKind kind);

/** Mermaid node id for a dimension id: `D3`, or `Dn1` for -1. */
[[nodiscard]] std::string mermaid_node_id(std::int64_t id);

/**
 * Writes the graph as a fenced Mermaid flowchart:
 *
 *     ```mermaid
 *     graph TD
 *         %% title
 *         D0["Bottom[0]"]
 *         D0 -->|"[0] embed"| D1
 *         style D0 fill:#e1f5fe
 *         linkStyle 0 stroke:#fff3e0
 *     ```
 *
 * @throws std::invalid_argument for a direction other than TD, TB, LR, BT or RL.
 */
std::string write_mermaid(const DiagramGraph& graph, std::string_view title, const DiagramOptions& options = {});

} // namespace tileprint

#endif // TILEPRINT_DIAGRAM_MERMAID_WRITER_H
