#ifndef TILEPRINT_MODEL_DESCRIPTOR_H
#define TILEPRINT_MODEL_DESCRIPTOR_H

#include <tileprint/model/transform.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tileprint {

enum class DescriptorEntity { Descriptor, Adaptor };

[[nodiscard]] std::string_view to_string(DescriptorEntity entity);

/**
 * Dimension-flow model of a tensor_descriptor or tensor_adaptor.
 *
 * Transforms are kept in storage order, which is also their topological order: every
 * lower id of transform i is a bottom id or an upper id of some transform before i.
 */
struct Descriptor {
    DescriptorEntity entity{DescriptorEntity::Descriptor};
    std::vector<Transform> transforms;
    Field<IntList> bottom_dimension_ids;
    Field<IntList> top_dimension_ids;
    Field<std::int64_t> element_space_size;
    Field<std::int64_t> ntransform;
    Field<std::int64_t> ndim_hidden;
    Field<std::int64_t> ndim_top;
    Field<std::int64_t> ndim_bottom;
    /// Every runtime scalar read back as garbage; the object has not been constructed yet.
    bool uninitialized{false};

    /**
     * Lower ids that are neither bottom ids, top ids nor produced by an earlier transform,
     * and ids produced by more than one transform. Empty for a well-formed descriptor.
     */
    [[nodiscard]] std::vector<std::string> topology_problems() const;
};

} // namespace tileprint

#endif // TILEPRINT_MODEL_DESCRIPTOR_H
