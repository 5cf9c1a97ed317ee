#ifndef TILEPRINT_PRINTERS_DESCRIPTOR_PRINTERS_H
#define TILEPRINT_PRINTERS_DESCRIPTOR_PRINTERS_H

#include <tileprint/model/coordinate.h>
#include <tileprint/model/descriptor.h>
#include <tileprint/printers/printer.h>

#include <string>

namespace tileprint {

/**
 * Text form of a descriptor or adaptor. Fields appear in a fixed order (element space
 * size, transform count, hidden/top/bottom counts, bottom ids, top ids, transforms) so the
 * output diffs cleanly between runs.
 */
std::string render_descriptor(const Descriptor& descriptor);

std::string render_coordinate(const CoordinateModel& coordinate);

/** tensor_descriptor and tensor_adaptor. */
class DescriptorPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tensor_descriptor"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/** tensor_adaptor_coordinate and tensor_coordinate. */
class CoordinatePrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tensor_coordinate"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_DESCRIPTOR_PRINTERS_H
