/**
 * @file inspector.h
 * @brief Request-level entry points: value to text, type string to text, value to diagram.
 */

#ifndef TILEPRINT_RUNTIME_INSPECTOR_H
#define TILEPRINT_RUNTIME_INSPECTOR_H

#include <tileprint/config/render_options.h>
#include <tileprint/diagram/diagram_graph.h>
#include <tileprint/printers/dispatch_table.h>
#include <tileprint/types/live_value.h>

#include <optional>
#include <string>
#include <string_view>

namespace tileprint {

/**
 * Parses a value's type, picks its printer and renders it.
 *
 * Holds no per-request state; the same inspector can serve any number of requests as
 * long as the table it borrows outlives it.
 */
class Inspector {
public:
    explicit Inspector(const PrinterDispatchTable& table = PrinterDispatchTable::instance(),
                       RenderOptions options = {}, DiagramOptions diagram_options = {});

    /**
     * Text rendering of a live value. A pointer or reference is followed first. Never
     * empty and never throws for a bad value: a type that cannot be parsed falls back to
     * `<type> = <summary>`, and a failing printer is reported inline.
     */
    [[nodiscard]] std::string to_string(const LiveValue& value) const;

    /**
     * Renders a type with no storage behind it, showing everything that is a compile-time
     * constant.
     *
     * @throws ParseError when the signature cannot be parsed at all.
     */
    [[nodiscard]] std::string type_print(std::string_view type_string) const;

    /**
     * Dimension-flow graph of a descriptor, an adaptor, or the descriptor inside a
     * tensor_view. Empty for anything else.
     */
    [[nodiscard]] std::optional<DiagramGraph> diagram(const LiveValue& value) const;

    /** Mermaid block for diagram(), or an "Error: ..." line when there is nothing to draw. */
    [[nodiscard]] std::string mermaid(const LiveValue& value, std::string_view title) const;

    /** Printer a host should register for this value, or nullptr when none applies. */
    [[nodiscard]] const Printer* lookup(const LiveValue& value) const;

    [[nodiscard]] const PrinterDispatchTable& table() const { return _table; }
    [[nodiscard]] const RenderOptions& options() const { return _options; }
    [[nodiscard]] const DiagramOptions& diagram_options() const { return _diagram_options; }

    void set_options(RenderOptions options) { _options = options; }
    void set_diagram_options(DiagramOptions options) { _diagram_options = std::move(options); }

private:
    const PrinterDispatchTable& _table;
    RenderOptions _options;
    DiagramOptions _diagram_options;
};

} // namespace tileprint

#endif // TILEPRINT_RUNTIME_INSPECTOR_H
