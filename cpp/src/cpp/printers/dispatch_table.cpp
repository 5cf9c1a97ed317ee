#include <tileprint/printers/dispatch_table.h>
#include <tileprint/printers/default_printers.h>
#include <tileprint/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace tileprint {

namespace {

bool is_plain_name(std::string_view pattern) {
    return std::all_of(pattern.begin(), pattern.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // namespace

PrinterDispatchTable::PrinterDispatchTable(PrinterPtr fallback, std::string required_namespace)
    : _fallback(std::move(fallback)), _required_namespace(std::move(required_namespace)) {
    if (!_fallback) throw_error<DispatchTableError>("dispatch table needs a fallback printer");
}

void PrinterDispatchTable::add(std::string pattern, PrinterPtr printer) {
    if (!printer) throw_error<DispatchTableError>("no printer given for pattern '{}'", pattern);
    _entries.push_back({std::move(pattern), std::move(printer)});
}

bool PrinterDispatchTable::namespace_allowed(const TypeNode& type) const {
    if (_required_namespace.empty()) return true;
    auto ns = type.namespace_name();
    if (ns.empty()) return true;
    if (!ns.starts_with(_required_namespace)) return false;
    return ns.size() == _required_namespace.size() || ns.substr(_required_namespace.size()).starts_with("::");
}

const Printer* PrinterDispatchTable::match(const TypeNode& type) const {
    if (!type.member.empty() || !namespace_allowed(type)) return nullptr;
    auto base = type.base_name();
    for (const auto& entry : _entries) {
        // the pattern must run to the end of the base name, as if spelled `pattern<`
        if (!entry.pattern.empty() && base == entry.pattern) return entry.printer.get();
    }
    return nullptr;
}

const Printer& PrinterDispatchTable::resolve(const TypeNode& type) const {
    if (auto* printer = match(type)) return *printer;
    return *_fallback;
}

std::vector<std::string> PrinterDispatchTable::validate() const {
    std::vector<std::string> problems;
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < _entries.size(); ++i) {
        const auto& pattern = _entries[i].pattern;
        if (pattern.empty()) {
            problems.push_back(fmt::format("entry [{}] has an empty pattern", i));
            continue;
        }
        if (!seen.insert(pattern).second) {
            problems.push_back(fmt::format("entry [{}] duplicates pattern '{}'", i, pattern));
            continue;
        }
        if (!is_plain_name(pattern))
            problems.push_back(fmt::format("entry [{}] '{}' is not a bare type name and never matches", i, pattern));
    }
    return problems;
}

void PrinterDispatchTable::check() const {
    auto problems = validate();
    if (!problems.empty())
        throw_error<DispatchTableError>("invalid printer dispatch table: {}", fmt::join(problems, "; "));
}

std::string PrinterDispatchTable::describe() const {
    std::string out;
    for (std::size_t i = 0; i < _entries.size(); ++i) {
        out += fmt::format("  [{}] {} -> {}\n", i, _entries[i].pattern, _entries[i].printer->name());
    }
    out += fmt::format("  (otherwise) -> {}\n", _fallback->name());
    return out;
}

const PrinterDispatchTable& PrinterDispatchTable::instance() {
    static const PrinterDispatchTable table = [] {
        auto t = make_default_printer_table();
        t.check();
        return t;
    }();
    return table;
}

} // namespace tileprint
