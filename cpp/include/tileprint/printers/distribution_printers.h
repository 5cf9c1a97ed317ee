#ifndef TILEPRINT_PRINTERS_DISTRIBUTION_PRINTERS_H
#define TILEPRINT_PRINTERS_DISTRIBUTION_PRINTERS_H

#include <tileprint/model/encoding.h>
#include <tileprint/printers/printer.h>

#include <string>

namespace tileprint {

/**
 * Brace block listing the raw encoding sequences followed by each P and Y dimension
 * resolved to its R or H target with the target's length:
 *
 *     {
 *       RsLengths: [1]
 *       HsLengthss: [[4, 2], [8]]
 *       ...
 *       Ys mappings (with lengths):
 *         Y[0] -> H0[1] (length=2)
 *     }
 */
std::string render_encoding(const DistributionEncoding& encoding);

/** tile_distribution: encoding, then the ps_ys_to_xs_ adaptor and ys_to_d_ descriptor. */
class TileDistributionPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tile_distribution"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

class DistributionEncodingPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tile_distribution_encoding"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_DISTRIBUTION_PRINTERS_H
