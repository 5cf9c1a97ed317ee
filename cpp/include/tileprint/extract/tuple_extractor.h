/**
 * @file tuple_extractor.h
 * @brief Element-wise access to ck_tile::tuple, array, multi_index and thread_buffer values.
 *
 * A ck_tile::tuple stores element I in `tuple_base<...>` -> `tuple_object<I, T, ...>` ->
 * `element`. Element types are taken from the tuple's own template arguments, so
 * `constant<N>` members (which have no storage) resolve without touching the process.
 */

#ifndef TILEPRINT_EXTRACT_TUPLE_EXTRACTOR_H
#define TILEPRINT_EXTRACT_TUPLE_EXTRACTOR_H

#include <tileprint/config/render_options.h>
#include <tileprint/model/container.h>
#include <tileprint/util/string_utils.h>

#include <cstddef>
#include <optional>

namespace tileprint {

/**
 * Elements of a tuple in declaration order.
 *
 * Fails as a whole only when runtime elements exist and the tuple's storage cannot be
 * reached; individual unreadable elements become per-element failures. A type-only tuple
 * lists every element with constants resolved and the rest marked type-only.
 */
AccessResult<ContainerModel> extract_tuple(const TypeNode& type, const LiveValue& value);

/**
 * Leading elements of an `array<T, N>`, `multi_index<N>` or `thread_buffer<T, N>`, at most `limit`.
 * Fails when N is not in the type or the `data` member cannot be reached.
 */
AccessResult<ContainerModel> extract_array(const TypeNode& type, const LiveValue& value, std::size_t limit);

/** N of an array-like type; nullopt for anything else. */
std::optional<std::size_t> declared_array_size(const TypeNode& type);

/**
 * A list of integers held in a sequence (type only), tuple or array-like value.
 * Any unreadable element fails the whole list.
 */
AccessResult<IntList> read_int_list(const TypeNode& type, const LiveValue& value, const RenderOptions& options);

/** Integer held by a container element, constant or live. */
AccessResult<std::int64_t> element_integer(const ContainerElement& element, std::int64_t max_sane);

} // namespace tileprint

#endif // TILEPRINT_EXTRACT_TUPLE_EXTRACTOR_H
