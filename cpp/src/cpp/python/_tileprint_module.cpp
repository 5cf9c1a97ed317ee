/*
 * The entry point into the python _tileprint module, loaded by the debugger's embedded Python.
 *
 * The module keeps one process-wide Inspector over the default dispatch table. A gdb
 * pretty-printer lookup function is exposed as `lookup`; the gdb script registers it with
 * `gdb.pretty_printers.append(_tileprint.lookup)` and installs its own commands on top of
 * `to_string`, `type_print` and `mermaid`.
 */
#include <tileprint/printers/dispatch_table.h>
#include <tileprint/python/py_live_value.h>
#include <tileprint/runtime/inspector.h>
#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>
#include <tileprint/util/log.h>

#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <stdexcept>

namespace {

using namespace tileprint;
using namespace nb::literals;

Inspector& inspector() {
    static Inspector instance{PrinterDispatchTable::instance()};
    return instance;
}

/** Object handed back to gdb by `lookup`; gdb calls its to_string() when printing. */
class PyPrettyPrinter {
public:
    explicit PyPrettyPrinter(nb::object value) : _value(std::move(value)) {}

    [[nodiscard]] std::string to_string() const { return inspector().to_string(PyLiveValue{_value}); }

private:
    nb::object _value;
};

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw_error<std::invalid_argument>("unknown log level '{}'", name);
}

void configure(const nb::kwargs& kwargs) {
    RenderOptions options = inspector().options();
    DiagramOptions diagram = inspector().diagram_options();
    for (auto [key, value] : kwargs) {
        auto name = nb::cast<std::string>(key);
        if (name == "max_elements") options.max_elements = nb::cast<std::size_t>(value);
        else if (name == "thread_buffer_preview") options.thread_buffer_preview = nb::cast<std::size_t>(value);
        else if (name == "max_sane_value") options.max_sane_value = nb::cast<std::int64_t>(value);
        else if (name == "indent_width") options.indent_width = nb::cast<std::size_t>(value);
        else if (name == "max_depth") options.max_depth = nb::cast<std::size_t>(value);
        else if (name == "default_max_dims") options.default_max_dims = nb::cast<std::size_t>(value);
        else if (name == "direction") diagram.direction = nb::cast<std::string>(value);
        else if (name == "styled") diagram.styled = nb::cast<bool>(value);
        else if (name == "log_level") Log::set_level(parse_log_level(nb::cast<std::string>(value)));
        else throw_error<std::invalid_argument>("unknown option '{}'", name);
    }
    inspector().set_options(options);
    inspector().set_diagram_options(std::move(diagram));
}

void set_log_sink(nb::object sink) {
    if (sink.is_none()) {
        Log::set_sink({});
        return;
    }
    Log::set_sink([sink = std::move(sink)](LogLevel level, const std::string& message) {
        nb::gil_scoped_acquire guard;
        try {
            sink(std::string{tileprint::to_string(level)}, message);
        } catch (nb::python_error& e) {
            e.discard_as_unraisable(nb::str("tileprint log sink"));
        }
    });
}

std::vector<std::string> supported_types() {
    std::vector<std::string> patterns;
    for (const auto& entry : inspector().table().entries()) patterns.push_back(entry.pattern);
    return patterns;
}

} // namespace

NB_MODULE(_tileprint, m) {
    using namespace nb::literals;

    m.doc() = "ck_tile type introspection and rendering for debugger pretty-printers";

    nb::exception<tileprint::ParseError>(m, "ParseError", PyExc_ValueError);
    nb::exception<tileprint::DispatchTableError>(m, "DispatchTableError", PyExc_RuntimeError);

    nb::class_<PyPrettyPrinter>(m, "PrettyPrinter")
        .def(nb::init<nb::object>(), "value"_a)
        .def("to_string", &PyPrettyPrinter::to_string);

    m.def("to_string", [](nb::object value) { return inspector().to_string(PyLiveValue{std::move(value)}); },
          "value"_a, "Render a gdb.Value as indented text");

    m.def("type_print", [](const std::string& type) { return inspector().type_print(type); },
          "type"_a, "Render a type signature with no storage, showing its compile-time structure");

    m.def("mermaid", [](nb::object value, const std::string& title) {
              return inspector().mermaid(PyLiveValue{std::move(value)}, title);
          },
          "value"_a, "title"_a = "", "Mermaid diagram of a descriptor's dimension flow");

    m.def("lookup", [](nb::object value) -> nb::object {
              if (!inspector().lookup(PyLiveValue{value})) return nb::none();
              return nb::cast(PyPrettyPrinter{std::move(value)});
          },
          "value"_a, "gdb pretty-printer lookup function");

    m.def("parse_type", [](const std::string& type) { return normalize_type(type); },
          "type"_a, "Canonical spelling of a type signature");

    m.def("supported_types", &supported_types, "Dispatch patterns in match order");
    m.def("describe_printers", [] { return inspector().table().describe(); });
    m.def("configure", &configure, "Update render, diagram and log options by keyword");
    m.def("set_log_sink", &set_log_sink, "sink"_a.none(),
          "Route log messages to sink(level, message); None restores stderr");

    // A Python sink must not outlive the interpreter.
    nb::module_::import_("atexit").attr("register")(nb::cpp_function([] { Log::set_sink({}); }));
}
