#ifndef TILEPRINT_PRINTERS_VIEW_PRINTERS_H
#define TILEPRINT_PRINTERS_VIEW_PRINTERS_H

#include <tileprint/printers/printer.h>

#include <optional>
#include <string>

namespace tileprint {

/** Name of a `(ck_tile::address_space_enum)N` buffer address space. */
std::string address_space_name(std::int64_t value);

/** Name of a `(ck_tile::memory_operation_enum)N` destination operation. */
std::string memory_operation_name(std::int64_t value);

/** tensor_view: element type, constness, nested descriptor and buffer address space. */
class TensorViewPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tensor_view"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/**
 * tile_window_with_static_distribution, tile_window_with_static_lengths and tile_window.
 * Only the static-distribution variant carries a `tile_dstr_`.
 */
class TileWindowPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tile_window"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/**
 * static_distributed_tensor: the live thread buffer when it can be read, otherwise the
 * buffer size and the distribution taken from the type.
 */
class StaticDistributedTensorPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "static_distributed_tensor"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/** tile_scatter_gather: its distribution lives in the type only. */
class TileScatterGatherPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tile_scatter_gather"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_VIEW_PRINTERS_H
