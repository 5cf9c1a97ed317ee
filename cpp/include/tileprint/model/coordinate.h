#ifndef TILEPRINT_MODEL_COORDINATE_H
#define TILEPRINT_MODEL_COORDINATE_H

#include <tileprint/types/access_result.h>
#include <tileprint/util/string_utils.h>

#include <cstdint>
#include <vector>

namespace tileprint {

enum class CoordinateEntity { AdaptorCoordinate, Coordinate };

/** One slot per hidden dimension; an unreadable slot keeps its position as unavailable. */
using HiddenIndex = std::vector<Field<std::int64_t>>;

/**
 * A tensor_adaptor_coordinate or tensor_coordinate: the hidden index vector plus the
 * ids selecting its bottom and top views. For tensor_coordinate the bottom is always [0].
 */
struct CoordinateModel {
    CoordinateEntity entity{CoordinateEntity::AdaptorCoordinate};
    std::int64_t ndim_hidden{0};
    IntList bottom_dimension_ids;
    IntList top_dimension_ids;
    Field<HiddenIndex> idx_hidden;

    /** idx_hidden slots at the top ids; ids past the end of idx_hidden are skipped. */
    [[nodiscard]] HiddenIndex top_index() const { return select(top_dimension_ids); }
    [[nodiscard]] HiddenIndex bottom_index() const { return select(bottom_dimension_ids); }

private:
    [[nodiscard]] HiddenIndex select(const IntList& ids) const {
        HiddenIndex out;
        if (auto* hidden = idx_hidden.get()) {
            for (auto id : ids) {
                if (id >= 0 && static_cast<std::size_t>(id) < hidden->size()) out.push_back((*hidden)[id]);
            }
        }
        return out;
    }
};

} // namespace tileprint

#endif // TILEPRINT_MODEL_COORDINATE_H
