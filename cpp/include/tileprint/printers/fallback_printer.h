#ifndef TILEPRINT_PRINTERS_FALLBACK_PRINTER_H
#define TILEPRINT_PRINTERS_FALLBACK_PRINTER_H

#include <tileprint/printers/printer.h>

namespace tileprint {

/**
 * Used when no dispatch entry matches. A type-only value renders as its type string; a
 * live value as `type { member: summary ... }`, or just its summary when it has no members.
 */
class FallbackPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "fallback"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_FALLBACK_PRINTER_H
