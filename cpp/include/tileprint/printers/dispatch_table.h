/**
 * @file dispatch_table.h
 * @brief Ordered (pattern, printer) table mapping a parsed type to its renderer.
 *
 * A pattern is a bare type name and matches a type whose base name is exactly that name,
 * as if written `pattern<`: `tuple` claims `ck_tile::tuple<...>` but not `tuple_object`
 * or `tuple_base`. Entries are tried in order and the first match wins; specific variants
 * (`tile_window_with_static_distribution`) are still listed before the general entry
 * (`tile_window`).
 */

#ifndef TILEPRINT_PRINTERS_DISPATCH_TABLE_H
#define TILEPRINT_PRINTERS_DISPATCH_TABLE_H

#include <tileprint/printers/printer.h>

#include <string>
#include <vector>

namespace tileprint {

class PrinterDispatchTable {
public:
    struct Entry {
        std::string pattern;
        PrinterPtr printer;
    };

    /**
     * @param fallback Printer used when no entry matches.
     * @param required_namespace When set, only unqualified names or names in this namespace match.
     */
    explicit PrinterDispatchTable(PrinterPtr fallback, std::string required_namespace = {});

    /** Appends an entry; the only way the table changes. */
    void add(std::string pattern, PrinterPtr printer);

    /** First matching printer, or nullptr on a miss. Types with a nested-name suffix never match. */
    [[nodiscard]] const Printer* match(const TypeNode& type) const;

    /** Matching printer, or the fallback on a miss. */
    [[nodiscard]] const Printer& resolve(const TypeNode& type) const;

    /** Empty, duplicate and non-name patterns, one message each. */
    [[nodiscard]] std::vector<std::string> validate() const;

    /** @throws DispatchTableError listing every problem found by validate(). */
    void check() const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return _entries; }
    [[nodiscard]] const Printer& fallback() const { return *_fallback; }

    /** One line per entry in dispatch order: "  [i] pattern -> printer". */
    [[nodiscard]] std::string describe() const;

    /** The process-wide default table, built and checked on first use, read-only afterwards. */
    static const PrinterDispatchTable& instance();

private:
    [[nodiscard]] bool namespace_allowed(const TypeNode& type) const;

    std::vector<Entry> _entries;
    PrinterPtr _fallback;
    std::string _required_namespace;
};

} // namespace tileprint

#endif // TILEPRINT_PRINTERS_DISPATCH_TABLE_H
