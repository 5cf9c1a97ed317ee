/**
 * @file py_live_value.h
 * @brief LiveValue over a `gdb.Value`, for use inside the debugger's embedded Python.
 *
 * Every accessor runs with the GIL held (it is only reached from calls into the
 * `_tileprint` module). gdb raises `gdb.MemoryError` and friends for unreadable memory;
 * those surface here as nb::python_error and are turned into access failures by the
 * LiveValue wrappers.
 */

#ifndef TILEPRINT_PYTHON_PY_LIVE_VALUE_H
#define TILEPRINT_PYTHON_PY_LIVE_VALUE_H

#include <tileprint/types/live_value.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;

namespace tileprint {

class PyLiveValue final : public LiveValue {
public:
    explicit PyLiveValue(nb::object value) : _value(std::move(value)) {}

    static LiveValuePtr make(nb::object value) { return std::make_shared<PyLiveValue>(std::move(value)); }

    [[nodiscard]] const nb::object& py_value() const { return _value; }

protected:
    [[nodiscard]] std::string do_type_string() const override;
    [[nodiscard]] AccessResult<LiveValuePtr> do_field(std::string_view name) const override;
    [[nodiscard]] AccessResult<std::vector<std::string>> do_field_names() const override;
    [[nodiscard]] AccessResult<LiveValuePtr> do_deref() const override;
    [[nodiscard]] AccessResult<LiveValuePtr> do_element(std::size_t index) const override;
    [[nodiscard]] AccessResult<std::size_t> do_element_count() const override;
    [[nodiscard]] AccessResult<std::int64_t> do_to_int() const override;
    [[nodiscard]] AccessResult<std::string> do_summary() const override;

private:
    [[nodiscard]] nb::object stripped_type() const;
    [[nodiscard]] int type_code() const;
    [[nodiscard]] bool optimized_out() const;

    nb::object _value;
};

} // namespace tileprint

#endif // TILEPRINT_PYTHON_PY_LIVE_VALUE_H
