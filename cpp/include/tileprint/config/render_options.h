#ifndef TILEPRINT_CONFIG_RENDER_OPTIONS_H
#define TILEPRINT_CONFIG_RENDER_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace tileprint {

/**
 * Knobs for text rendering and extraction. Passed explicitly through every render call;
 * the host binding keeps one process-wide copy that it updates on request.
 */
struct RenderOptions {
    /// Array and multi_index elements shown before truncating with "... (N total)".
    std::size_t max_elements{20};
    /// thread_buffer elements shown in the data preview.
    std::size_t thread_buffer_preview{10};
    /// Integers whose magnitude exceeds this are treated as uninitialised memory.
    std::int64_t max_sane_value{100'000'000};
    /// Spaces per nesting level.
    std::size_t indent_width{2};
    /// Nested renders beyond this depth print the type name only.
    std::size_t max_depth{32};
    /// Upper bound on hidden dimensions read from a coordinate when the type gives no count.
    std::size_t default_max_dims{20};
};

struct DiagramOptions {
    /// Mermaid graph direction: TD, LR, BT or RL.
    std::string direction{"TD"};
    bool styled{true};
    std::string bottom_fill{"#e1f5fe"};
    std::string top_fill{"#c8e6c9"};
};

} // namespace tileprint

#endif // TILEPRINT_CONFIG_RENDER_OPTIONS_H
