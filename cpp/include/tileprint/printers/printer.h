/**
 * @file printer.h
 * @brief Renderer interface and the context threaded through nested renders.
 */

#ifndef TILEPRINT_PRINTERS_PRINTER_H
#define TILEPRINT_PRINTERS_PRINTER_H

#include <tileprint/config/render_options.h>
#include <tileprint/types/live_value.h>
#include <tileprint/types/type_node.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace tileprint {

class PrinterDispatchTable;
class RenderContext;

/**
 * Renders one family of ck_tile entities as indented text.
 *
 * Implementations read what they need through the LiveValue accessors and substitute
 * placeholders for anything unreadable. They may throw for unexpected conditions; the
 * caller turns that into an inline `{error: ...}` for this value only.
 */
class Printer {
public:
    virtual ~Printer() = default;

    /** Entity name used in error text and table listings. */
    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual std::string render(const TypeNode& type, const LiveValue& value,
                                             const RenderContext& context) const = 0;
};

using PrinterPtr = std::shared_ptr<const Printer>;

/** "<unavailable>", "<optimized out>", "<no such field: desc_>", ... */
std::string placeholder(const AccessFailure& failure);

class RenderContext {
public:
    RenderContext(const PrinterDispatchTable& table, const RenderOptions& options, std::size_t depth = 0)
        : _table(table), _options(options), _depth(depth) {}

    [[nodiscard]] const PrinterDispatchTable& table() const { return _table; }
    [[nodiscard]] const RenderOptions& options() const { return _options; }
    [[nodiscard]] std::size_t depth() const { return _depth; }

    /**
     * Resolves a printer for `type` and renders `value` one level deeper.
     * Exceptions from the printer are reported inline; beyond max_depth only the type is shown.
     */
    [[nodiscard]] std::string render(const TypeNode& type, const LiveValue& value) const;

    /** As render(), using the value's own reported type. */
    [[nodiscard]] std::string render(const LiveValue& value) const;

    /**
     * Renders member `name` of `owner`. When the member cannot be read and its declared
     * type is known from the owner's signature, the declared type is rendered type-only;
     * otherwise a placeholder is returned.
     */
    [[nodiscard]] std::string render_member(const LiveValue& owner, std::string_view name,
                                            const TypeNode* declared) const;

    /** Indents every line after the first by `levels` nesting levels. */
    [[nodiscard]] std::string indent(std::string_view block, std::size_t levels = 1) const;

private:
    [[nodiscard]] RenderContext nested() const { return RenderContext{_table, _options, _depth + 1}; }

    const PrinterDispatchTable& _table;
    const RenderOptions& _options;
    std::size_t _depth;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_PRINTER_H
