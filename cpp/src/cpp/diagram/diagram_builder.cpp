#include <tileprint/diagram/diagram_builder.h>

#include <fmt/format.h>

#include <unordered_map>

namespace tileprint {

namespace {

class GraphAssembler {
public:
    void add(std::int64_t id, bool bottom = false, bool top = false) {
        auto [it, inserted] = _index.try_emplace(id, _graph.nodes.size());
        if (inserted) _graph.nodes.push_back(DiagramNode{.id = id});
        auto& node = _graph.nodes[it->second];
        node.is_bottom = node.is_bottom || bottom;
        node.is_top = node.is_top || top;
    }

    void connect(std::int64_t from, std::int64_t to, std::size_t index, TransformKind kind) {
        _graph.edges.push_back(DiagramEdge{
            .from = from, .to = to, .label = fmt::format("[{}] {}", index, to_string(kind)),
            .transform_index = index, .kind = kind});
    }

    DiagramGraph finish() && {
        for (auto& node : _graph.nodes) {
            if (node.is_bottom && node.is_top) node.label = fmt::format("Bottom[{0}] / Top[{0}]", node.id);
            else if (node.is_bottom) node.label = fmt::format("Bottom[{}]", node.id);
            else if (node.is_top) node.label = fmt::format("Top[{}]", node.id);
            else node.label = fmt::format("Dim[{}]", node.id);
        }
        return std::move(_graph);
    }

private:
    DiagramGraph _graph;
    std::unordered_map<std::int64_t, std::size_t> _index;
};

const IntList& ids_or_empty(const Field<IntList>& field) {
    static const IntList empty;
    const IntList* ids = field.get();
    return ids ? *ids : empty;
}

} // namespace

DiagramGraph build_diagram(const Descriptor& descriptor) {
    GraphAssembler assembler;

    for (auto id : ids_or_empty(descriptor.bottom_dimension_ids)) assembler.add(id, true, false);

    for (std::size_t i = 0; i < descriptor.transforms.size(); ++i) {
        const auto& t = descriptor.transforms[i];
        for (auto id : t.lower_dims) assembler.add(id);
        for (auto id : t.upper_dims) assembler.add(id);
        if (t.kind == TransformKind::Replicate) continue;
        for (auto lower : t.lower_dims) {
            for (auto upper : t.upper_dims) assembler.connect(lower, upper, i, t.kind);
        }
    }

    for (auto id : ids_or_empty(descriptor.top_dimension_ids)) assembler.add(id, false, true);

    return std::move(assembler).finish();
}

} // namespace tileprint
