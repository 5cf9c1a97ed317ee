/**
 * @file value_access.h
 * @brief Reading ck_tile scalars out of live values.
 */

#ifndef TILEPRINT_EXTRACT_VALUE_ACCESS_H
#define TILEPRINT_EXTRACT_VALUE_ACCESS_H

#include <tileprint/types/live_value.h>
#include <tileprint/types/type_node.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace tileprint {

/**
 * Lenient parse of a value's reported type. nullopt when the host gives no type or the
 * signature is unrecoverable.
 */
std::optional<TypeNode> type_of(const LiveValue& value);

/**
 * Integer stored the ways ck_tile stores them: a `constant<N>` type (no storage read),
 * a plain integral value, or a wrapper struct with a `value` member.
 *
 * Values whose magnitude exceeds `max_sane` fail with AccessFailureReason::Insane.
 */
AccessResult<std::int64_t> read_integer(const LiveValue& value, std::int64_t max_sane);

AccessResult<std::int64_t> read_integer_field(const LiveValue& owner, std::string_view name, std::int64_t max_sane);

/**
 * Base-class subobject whose type has the given base name (e.g. "tensor_adaptor" inside a
 * tensor_descriptor). Base classes appear among the field names, named by their type.
 */
AccessResult<LiveValuePtr> base_subobject(const LiveValue& owner, std::string_view base);

} // namespace tileprint

#endif // TILEPRINT_EXTRACT_VALUE_ACCESS_H
