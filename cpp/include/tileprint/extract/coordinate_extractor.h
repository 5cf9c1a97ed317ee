#ifndef TILEPRINT_EXTRACT_COORDINATE_EXTRACTOR_H
#define TILEPRINT_EXTRACT_COORDINATE_EXTRACTOR_H

#include <tileprint/config/render_options.h>
#include <tileprint/model/coordinate.h>
#include <tileprint/model/encoding.h>
#include <tileprint/types/live_value.h>
#include <tileprint/types/type_node.h>

#include <optional>

namespace tileprint {

/**
 * Model of `tensor_adaptor_coordinate<NDimHidden, BottomIds, TopIds>` or
 * `tensor_coordinate<NDimHidden, TopIds>`. Ids come from the type; `idx_hidden_` is read
 * element by element. With NDimHidden known every slot is read and an unreadable one stays
 * in place as unavailable; otherwise reading stops at the first unreadable entry.
 */
CoordinateModel extract_coordinate(const TypeNode& type, const LiveValue& value, const RenderOptions& options);

/**
 * Encoding carried by a `tile_distribution_encoding<...>` node, read from the type alone.
 * nullopt when the node is not an encoding.
 */
std::optional<DistributionEncoding> extract_encoding(const TypeNode& encoding_type);

} // namespace tileprint

#endif // TILEPRINT_EXTRACT_COORDINATE_EXTRACTOR_H
