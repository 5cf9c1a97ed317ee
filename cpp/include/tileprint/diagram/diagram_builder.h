#ifndef TILEPRINT_DIAGRAM_DIAGRAM_BUILDER_H
#define TILEPRINT_DIAGRAM_DIAGRAM_BUILDER_H

#include <tileprint/diagram/diagram_graph.h>
#include <tileprint/model/descriptor.h>

namespace tileprint {

/**
 * Dimension-flow graph of a descriptor: one edge per (lower, upper) pair of each
 * transform. Replicate produces its upper ids from nothing, so it adds nodes only.
 * Unreadable bottom or top id lists contribute no nodes.
 */
DiagramGraph build_diagram(const Descriptor& descriptor);

} // namespace tileprint

#endif // TILEPRINT_DIAGRAM_DIAGRAM_BUILDER_H
