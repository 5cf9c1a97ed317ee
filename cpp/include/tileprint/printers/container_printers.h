#ifndef TILEPRINT_PRINTERS_CONTAINER_PRINTERS_H
#define TILEPRINT_PRINTERS_CONTAINER_PRINTERS_H

#include <tileprint/printers/printer.h>

#include <string>

namespace tileprint {

/**
 * `tuple<N elements> { [i]: child ... }`. Each element is rendered through the dispatch
 * table and indented under its index; an empty tuple renders as `tuple<0 elements> {}`.
 */
class TuplePrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "tuple"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/** `array<T, N> = [...]` and `multi_index<N> = [...]`, truncated after max_elements. */
class ArrayPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "array"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

class ThreadBufferPrinter final : public Printer {
public:
    [[nodiscard]] std::string_view name() const override { return "thread_buffer"; }
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value,
                                     const RenderContext& context) const override;
};

/** Element text for scalar slots: integer if it converts, else the host summary. */
std::string scalar_text(const LiveValue& value);

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_CONTAINER_PRINTERS_H
