#include <tileprint/printers/default_printers.h>
#include <tileprint/printers/container_printers.h>
#include <tileprint/printers/descriptor_printers.h>
#include <tileprint/printers/distribution_printers.h>
#include <tileprint/printers/fallback_printer.h>
#include <tileprint/printers/view_printers.h>

#include <memory>

namespace tileprint {

void register_default_printers(PrinterDispatchTable& table) {
    auto tile_window = std::make_shared<TileWindowPrinter>();
    auto descriptor = std::make_shared<DescriptorPrinter>();
    auto coordinate = std::make_shared<CoordinatePrinter>();
    auto array = std::make_shared<ArrayPrinter>();

    table.add("tile_window_with_static_distribution", tile_window);
    table.add("tile_window_with_static_lengths", tile_window);
    table.add("tile_window", tile_window);
    table.add("tile_scatter_gather", std::make_shared<TileScatterGatherPrinter>());
    table.add("static_distributed_tensor", std::make_shared<StaticDistributedTensorPrinter>());
    table.add("tensor_view", std::make_shared<TensorViewPrinter>());
    table.add("tensor_adaptor_coordinate", coordinate);
    table.add("tensor_adaptor", descriptor);
    table.add("tensor_descriptor", descriptor);
    table.add("tile_distribution_encoding", std::make_shared<DistributionEncodingPrinter>());
    table.add("tile_distribution", std::make_shared<TileDistributionPrinter>());
    table.add("tensor_coordinate", coordinate);
    table.add("array", array);
    table.add("tuple", std::make_shared<TuplePrinter>());
    table.add("multi_index", array);
    table.add("thread_buffer", std::make_shared<ThreadBufferPrinter>());
}

PrinterDispatchTable make_default_printer_table() {
    PrinterDispatchTable table{std::make_shared<FallbackPrinter>(), "ck_tile"};
    register_default_printers(table);
    return table;
}

} // namespace tileprint
