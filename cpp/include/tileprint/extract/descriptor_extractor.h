/**
 * @file descriptor_extractor.h
 * @brief Recovers the Descriptor model from a tensor_descriptor or tensor_adaptor value.
 *
 * The type provides the transform kinds and the lower/upper dimension ids
 * (`tensor_descriptor<Transforms, LowerIdss, UpperIdss, TopIds, ElementSpaceSize, ...>`,
 * `tensor_adaptor<Transforms, LowerIdss, UpperIdss, BottomIds, TopIds>`); the live value
 * provides runtime parameters from its `transforms_` tuple, read in storage order.
 */

#ifndef TILEPRINT_EXTRACT_DESCRIPTOR_EXTRACTOR_H
#define TILEPRINT_EXTRACT_DESCRIPTOR_EXTRACTOR_H

#include <tileprint/config/render_options.h>
#include <tileprint/model/descriptor.h>
#include <tileprint/types/live_value.h>

namespace tileprint {

/** True for types the descriptor extractor understands. */
bool is_descriptor_type(const TypeNode& type);

/**
 * Builds the model. Access failures never escape: an unreadable field becomes an
 * unavailable Field, and a transform whose shape contradicts its kind becomes an
 * unknown placeholder while the remaining transforms are still extracted.
 */
Descriptor extract_descriptor(const TypeNode& type, const LiveValue& value, const RenderOptions& options);

/**
 * One transform. `runtime` is the stored transform object, or the reason it could not
 * be reached; compile-time parameters are still recovered from the transform's type.
 */
Transform extract_transform(const TypeNode& type, const IntList& lower_dims, const IntList& upper_dims,
                            const AccessResult<LiveValuePtr>& runtime, const RenderOptions& options);

} // namespace tileprint

#endif // TILEPRINT_EXTRACT_DESCRIPTOR_EXTRACTOR_H
