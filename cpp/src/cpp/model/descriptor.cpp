#include <tileprint/model/descriptor.h>

#include <fmt/format.h>

#include <unordered_map>
#include <unordered_set>

namespace tileprint {

std::string_view to_string(DescriptorEntity entity) {
    return entity == DescriptorEntity::Adaptor ? "tensor_adaptor" : "tensor_descriptor";
}

std::vector<std::string> Descriptor::topology_problems() const {
    std::vector<std::string> problems;
    std::unordered_set<std::int64_t> known;
    if (auto* ids = bottom_dimension_ids.get()) known.insert(ids->begin(), ids->end());
    if (auto* ids = top_dimension_ids.get()) known.insert(ids->begin(), ids->end());

    std::unordered_map<std::int64_t, std::size_t> producer;
    for (std::size_t i = 0; i < transforms.size(); ++i) {
        const auto& t = transforms[i];
        for (auto id : t.lower_dims) {
            if (!known.contains(id) && !producer.contains(id))
                problems.push_back(fmt::format("[{}] {} reads dimension {} before it is produced", i, to_string(t.kind), id));
        }
        for (auto id : t.upper_dims) {
            auto [it, inserted] = producer.emplace(id, i);
            if (!inserted)
                problems.push_back(fmt::format("dimension {} produced by both [{}] and [{}]", id, it->second, i));
        }
    }
    return problems;
}

} // namespace tileprint
