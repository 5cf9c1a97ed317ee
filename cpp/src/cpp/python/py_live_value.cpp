#include <tileprint/python/py_live_value.h>

#include <nanobind/stl/string.h>

#include <algorithm>

namespace tileprint {

namespace {

// Released so that no Python object is destroyed after the interpreter shuts down.
nb::handle gdb_module() {
    static nb::handle gdb = nb::module_::import_("gdb").release();
    return gdb;
}

int gdb_constant(const char* name) { return nb::cast<int>(gdb_module().attr(name)); }

AccessFailure optimized_out_failure() { return AccessFailure{AccessFailureReason::OptimizedOut, {}}; }

} // namespace

nb::object PyLiveValue::stripped_type() const { return _value.attr("type").attr("strip_typedefs")(); }

int PyLiveValue::type_code() const { return nb::cast<int>(stripped_type().attr("code")); }

bool PyLiveValue::optimized_out() const { return nb::cast<bool>(_value.attr("is_optimized_out")); }

std::string PyLiveValue::do_type_string() const { return nb::cast<std::string>(nb::str(_value.attr("type"))); }

AccessResult<std::vector<std::string>> PyLiveValue::do_field_names() const {
    const int code = type_code();
    if (code != gdb_constant("TYPE_CODE_STRUCT") && code != gdb_constant("TYPE_CODE_UNION")) return std::vector<std::string>{};
    std::vector<std::string> names;
    for (nb::handle f : stripped_type().attr("fields")()) {
        nb::object name = f.attr("name");
        if (!name.is_none()) names.push_back(nb::cast<std::string>(name));
    }
    return names;
}

AccessResult<LiveValuePtr> PyLiveValue::do_field(std::string_view name) const {
    if (optimized_out()) return optimized_out_failure();
    auto names = do_field_names();
    if (!names) return names.failure();
    if (std::find(names->begin(), names->end(), name) == names->end())
        return AccessFailure{AccessFailureReason::NoSuchField, std::string{name}};
    nb::object member = _value[nb::str(name.data(), name.size())];
    if (nb::cast<bool>(member.attr("is_optimized_out"))) return optimized_out_failure();
    return PyLiveValue::make(std::move(member));
}

AccessResult<LiveValuePtr> PyLiveValue::do_deref() const {
    const int code = type_code();
    if (code != gdb_constant("TYPE_CODE_PTR") && code != gdb_constant("TYPE_CODE_REF") &&
        code != gdb_constant("TYPE_CODE_RVALUE_REF"))
        return AccessFailure{AccessFailureReason::NotConvertible, "not a pointer or reference"};
    return PyLiveValue::make(_value.attr("referenced_value")());
}

AccessResult<LiveValuePtr> PyLiveValue::do_element(std::size_t index) const {
    if (optimized_out()) return optimized_out_failure();
    const int code = type_code();
    if (code != gdb_constant("TYPE_CODE_ARRAY") && code != gdb_constant("TYPE_CODE_PTR"))
        return AccessFailure{AccessFailureReason::NotIndexable, {}};
    if (code == gdb_constant("TYPE_CODE_ARRAY")) {
        auto count = do_element_count();
        if (count && index >= *count) return AccessFailure{AccessFailureReason::NotIndexable, "index out of range"};
    }
    nb::object element = _value[nb::int_(index)];
    if (nb::cast<bool>(element.attr("is_optimized_out"))) return optimized_out_failure();
    return PyLiveValue::make(std::move(element));
}

AccessResult<std::size_t> PyLiveValue::do_element_count() const {
    if (type_code() != gdb_constant("TYPE_CODE_ARRAY")) return AccessFailure{AccessFailureReason::NotIndexable, {}};
    nb::tuple bounds = nb::cast<nb::tuple>(stripped_type().attr("range")());
    auto low = nb::cast<std::int64_t>(bounds[0]);
    auto high = nb::cast<std::int64_t>(bounds[1]);
    return high < low ? std::size_t{0} : static_cast<std::size_t>(high - low + 1);
}

AccessResult<std::int64_t> PyLiveValue::do_to_int() const {
    if (optimized_out()) return optimized_out_failure();
    const int code = type_code();
    if (code != gdb_constant("TYPE_CODE_INT") && code != gdb_constant("TYPE_CODE_ENUM") &&
        code != gdb_constant("TYPE_CODE_BOOL") && code != gdb_constant("TYPE_CODE_CHAR"))
        return AccessFailure{AccessFailureReason::NotConvertible, {}};
    nb::object as_int = nb::module_::import_("builtins").attr("int")(_value);
    return nb::cast<std::int64_t>(as_int);
}

AccessResult<std::string> PyLiveValue::do_summary() const {
    if (optimized_out()) return optimized_out_failure();
    return nb::cast<std::string>(nb::str(_value));
}

} // namespace tileprint
