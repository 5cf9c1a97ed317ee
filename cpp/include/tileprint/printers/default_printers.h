#ifndef TILEPRINT_PRINTERS_DEFAULT_PRINTERS_H
#define TILEPRINT_PRINTERS_DEFAULT_PRINTERS_H

#include <tileprint/printers/dispatch_table.h>

namespace tileprint {

/**
 * Registers the ck_tile printers in dispatch order, specific variants before the general
 * entries they refine:
 *
 *   tile_window_with_static_distribution, tile_window_with_static_lengths, tile_window,
 *   tile_scatter_gather, static_distributed_tensor, tensor_view,
 *   tensor_adaptor_coordinate, tensor_adaptor, tensor_descriptor,
 *   tile_distribution_encoding, tile_distribution, tensor_coordinate,
 *   array, tuple, multi_index, thread_buffer
 */
void register_default_printers(PrinterDispatchTable& table);

/** A table restricted to the ck_tile namespace with every default printer registered. */
PrinterDispatchTable make_default_printer_table();

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_DEFAULT_PRINTERS_H
