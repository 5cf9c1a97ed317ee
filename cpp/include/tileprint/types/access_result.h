/**
 * @file access_result.h
 * @brief Result-or-failure types returned by every live value accessor.
 */

#ifndef TILEPRINT_TYPES_ACCESS_RESULT_H
#define TILEPRINT_TYPES_ACCESS_RESULT_H

#include <tileprint/util/errors.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace tileprint {

enum class AccessFailureReason {
    Unavailable,    ///< memory cannot be read (stale pointer, unmapped address)
    OptimizedOut,   ///< the compiler dropped the variable or field
    NoSuchField,    ///< the value has no member of that name
    NotIndexable,   ///< element access on a non-array value
    NotConvertible, ///< the value cannot be read as an integer
    TypeOnly,       ///< the value is backed by a type string only, no storage
    Insane,         ///< the read succeeded but the value is implausible (uninitialised memory)
    Other
};

[[nodiscard]] std::string_view to_string(AccessFailureReason reason);

struct AccessFailure {
    AccessFailureReason reason{AccessFailureReason::Other};
    std::string detail;

    /** "optimized out", or "no such field: desc_" when a detail is present. */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const AccessFailure&) const = default;
};

/**
 * Value-or-AccessFailure. Accessors never throw; callers inspect the outcome and
 * substitute a placeholder for the failed part only.
 */
template<typename T>
class AccessResult {
public:
    using value_type = T;

    AccessResult(T value) : _storage(std::in_place_index<0>, std::move(value)) {}
    AccessResult(AccessFailure failure) : _storage(std::in_place_index<1>, std::move(failure)) {}

    [[nodiscard]] bool ok() const noexcept { return _storage.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T& value() const& {
        if (!ok()) throw_error<std::logic_error>("value() on failed access: {}", failure().to_string());
        return std::get<0>(_storage);
    }

    [[nodiscard]] T&& value() && {
        if (!ok()) throw_error<std::logic_error>("value() on failed access: {}", failure().to_string());
        return std::get<0>(std::move(_storage));
    }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] const AccessFailure& failure() const {
        if (ok()) throw_error<std::logic_error>("failure() on successful access");
        return std::get<1>(_storage);
    }

    [[nodiscard]] T value_or(T fallback) const {
        return ok() ? std::get<0>(_storage) : std::move(fallback);
    }

    /** Chains another accessor; a failure short-circuits. */
    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
        if (!ok()) return failure();
        return std::forward<F>(f)(std::get<0>(_storage));
    }

    template<typename F>
    auto transform(F&& f) const -> AccessResult<std::invoke_result_t<F, const T&>> {
        if (!ok()) return failure();
        return std::forward<F>(f)(std::get<0>(_storage));
    }

private:
    std::variant<T, AccessFailure> _storage;
};

/**
 * A slot in an extracted model. Distinguishes a value that was never applicable
 * (absent), a value that was read, and a value that should have been read but could
 * not be (unavailable, rendered as a placeholder).
 */
template<typename T>
class Field {
public:
    Field() = default;
    Field(T value) : _storage(std::in_place_index<1>, std::move(value)) {}
    Field(AccessFailure failure) : _storage(std::in_place_index<2>, std::move(failure)) {}
    Field(AccessResult<T> result) {
        if (result.ok()) _storage.template emplace<1>(std::move(result).value());
        else _storage.template emplace<2>(result.failure());
    }

    [[nodiscard]] bool is_absent() const noexcept { return _storage.index() == 0; }
    [[nodiscard]] bool has_value() const noexcept { return _storage.index() == 1; }
    [[nodiscard]] bool is_unavailable() const noexcept { return _storage.index() == 2; }

    [[nodiscard]] const T& value() const {
        if (!has_value()) throw_error<std::logic_error>("value() on a field without a value");
        return std::get<1>(_storage);
    }

    [[nodiscard]] const AccessFailure& failure() const {
        if (!is_unavailable()) throw_error<std::logic_error>("failure() on an available field");
        return std::get<2>(_storage);
    }

    [[nodiscard]] const T* get() const noexcept { return std::get_if<1>(&_storage); }

    bool operator==(const Field&) const = default;

private:
    std::variant<std::monostate, T, AccessFailure> _storage;
};

} // namespace tileprint

#endif // TILEPRINT_TYPES_ACCESS_RESULT_H
