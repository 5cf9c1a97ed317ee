/**
 * @file diagram_graph.h
 * @brief Node/edge view of the dimension flow through a descriptor's transforms.
 */

#ifndef TILEPRINT_DIAGRAM_DIAGRAM_GRAPH_H
#define TILEPRINT_DIAGRAM_DIAGRAM_GRAPH_H

#include <tileprint/model/transform.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tileprint {

/** One hidden dimension id. */
struct DiagramNode {
    std::int64_t id{0};
    bool is_bottom{false};
    bool is_top{false};
    /// "Bottom[0]", "Top[3]", "Dim[2]", or "Bottom[0] / Top[0]" for an id that is both.
    std::string label;

    bool operator==(const DiagramNode&) const = default;
};

/** A lower id feeding an upper id through transform `transform_index`. */
struct DiagramEdge {
    std::int64_t from{0};
    std::int64_t to{0};
    /// "[i] kind"
    std::string label;
    std::size_t transform_index{0};
    TransformKind kind{TransformKind::Unknown};

    bool operator==(const DiagramEdge&) const = default;
};

struct DiagramGraph {
    /// Unique per id, in first-seen order: bottom ids, each transform's lower then upper ids, top ids.
    std::vector<DiagramNode> nodes;
    std::vector<DiagramEdge> edges;

    [[nodiscard]] const DiagramNode* node(std::int64_t id) const {
        for (const auto& n : nodes) {
            if (n.id == id) return &n;
        }
        return nullptr;
    }
};

} // namespace tileprint

#endif // TILEPRINT_DIAGRAM_DIAGRAM_GRAPH_H
