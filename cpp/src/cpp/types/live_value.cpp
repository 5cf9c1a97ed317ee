#include <tileprint/types/live_value.h>
#include <tileprint/util/log.h>

#include <fmt/format.h>

namespace tileprint {

std::string_view to_string(AccessFailureReason reason) {
    switch (reason) {
        case AccessFailureReason::Unavailable: return "unavailable";
        case AccessFailureReason::OptimizedOut: return "optimized out";
        case AccessFailureReason::NoSuchField: return "no such field";
        case AccessFailureReason::NotIndexable: return "not indexable";
        case AccessFailureReason::NotConvertible: return "not convertible";
        case AccessFailureReason::TypeOnly: return "type only";
        case AccessFailureReason::Insane: return "implausible value";
        case AccessFailureReason::Other: return "error";
    }
    return "error";
}

std::string AccessFailure::to_string() const {
    if (detail.empty()) return std::string{tileprint::to_string(reason)};
    return fmt::format("{}: {}", tileprint::to_string(reason), detail);
}

namespace {

// Host adapters signal faults by throwing; turn them into a failure the renderer can place.
template<typename F>
auto guarded(std::string_view operation, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const std::exception& e) {
        Log::debug("live value {} failed: {}", operation, e.what());
        return AccessFailure{AccessFailureReason::Unavailable, e.what()};
    }
}

} // namespace

std::string LiveValue::type_string() const {
    try {
        return do_type_string();
    } catch (const std::exception& e) {
        Log::debug("live value type lookup failed: {}", e.what());
        return {};
    }
}

AccessResult<LiveValuePtr> LiveValue::field(std::string_view name) const {
    return guarded("field", [&] { return do_field(name); });
}

AccessResult<std::vector<std::string>> LiveValue::field_names() const {
    return guarded("field_names", [&] { return do_field_names(); });
}

AccessResult<LiveValuePtr> LiveValue::deref() const {
    return guarded("deref", [&] { return do_deref(); });
}

AccessResult<LiveValuePtr> LiveValue::element(std::size_t index) const {
    return guarded("element", [&] { return do_element(index); });
}

AccessResult<std::size_t> LiveValue::element_count() const {
    return guarded("element_count", [&] { return do_element_count(); });
}

ElementRange LiveValue::elements() const {
    return ElementRange{this, element_count()};
}

AccessResult<std::int64_t> LiveValue::to_int() const {
    return guarded("to_int", [&] { return do_to_int(); });
}

AccessResult<std::string> LiveValue::summary() const {
    return guarded("summary", [&] { return do_summary(); });
}

ElementRange::ElementRange(const LiveValue* owner, AccessResult<std::size_t> count)
    : _owner(owner), _count(std::move(count)) {}

ElementRange::iterator::value_type ElementRange::iterator::operator*() const {
    return _owner->element(_index);
}

// ============================================================================
// TypeOnlyValue
// ============================================================================

namespace {

AccessFailure type_only(std::string_view what) {
    return AccessFailure{AccessFailureReason::TypeOnly, std::string{what}};
}

} // namespace

AccessResult<LiveValuePtr> TypeOnlyValue::do_field(std::string_view name) const { return type_only(name); }

AccessResult<std::vector<std::string>> TypeOnlyValue::do_field_names() const { return type_only("fields"); }

AccessResult<LiveValuePtr> TypeOnlyValue::do_deref() const { return type_only("deref"); }

AccessResult<LiveValuePtr> TypeOnlyValue::do_element(std::size_t index) const {
    return type_only(fmt::format("[{}]", index));
}

AccessResult<std::size_t> TypeOnlyValue::do_element_count() const { return type_only("elements"); }

AccessResult<std::int64_t> TypeOnlyValue::do_to_int() const { return type_only("value"); }

AccessResult<std::string> TypeOnlyValue::do_summary() const { return type_only("value"); }

} // namespace tileprint
