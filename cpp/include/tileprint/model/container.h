#ifndef TILEPRINT_MODEL_CONTAINER_H
#define TILEPRINT_MODEL_CONTAINER_H

#include <tileprint/types/live_value.h>
#include <tileprint/types/type_node.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace tileprint {

enum class ContainerKind { Tuple, Array, MultiIndex, ThreadBuffer };

[[nodiscard]] std::string_view to_string(ContainerKind kind);

/**
 * One element of a tuple or array. Compile-time constants (`constant<8>` tuple members)
 * are resolved from the type alone; everything else is either a live child value or the
 * reason it could not be reached.
 */
struct ContainerElement {
    TypeNode type;
    std::variant<std::int64_t, LiveValuePtr, AccessFailure> payload;

    [[nodiscard]] const std::int64_t* constant() const { return std::get_if<std::int64_t>(&payload); }
    [[nodiscard]] const LiveValuePtr* live() const { return std::get_if<LiveValuePtr>(&payload); }
    [[nodiscard]] const AccessFailure* failure() const { return std::get_if<AccessFailure>(&payload); }
};

struct ContainerModel {
    ContainerKind kind{ContainerKind::Tuple};
    /// Element type for homogeneous containers (array, thread_buffer); unset for tuples.
    std::optional<TypeNode> element_type;
    /// Size declared by the type; elements may hold fewer when truncated.
    std::size_t declared_size{0};
    std::vector<ContainerElement> elements;

    [[nodiscard]] bool truncated() const { return elements.size() < declared_size; }
};

} // namespace tileprint

#endif // TILEPRINT_MODEL_CONTAINER_H
