/**
 * @file live_value.h
 * @brief Capability interface over an opaque value living in the debugged process.
 *
 * The engine never owns the underlying object: a LiveValue is borrowed for one
 * inspection request. Every accessor returns an AccessResult; host errors raised by an
 * adapter (unreadable memory, optimized-out fields, stale pointers) are converted to an
 * AccessFailure by the public wrappers so rendering can continue around them.
 */

#ifndef TILEPRINT_TYPES_LIVE_VALUE_H
#define TILEPRINT_TYPES_LIVE_VALUE_H

#include <tileprint/types/access_result.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tileprint {

class LiveValue;
using LiveValuePtr = std::shared_ptr<const LiveValue>;

/**
 * Lazy, finite sequence over the elements of an array-like live value.
 *
 * Each step calls LiveValue::element(i); nothing is read up front. The range is bound
 * to the value it came from; to restart, call LiveValue::elements() again.
 */
class ElementRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AccessResult<LiveValuePtr>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        iterator() = default;
        iterator(const LiveValue* owner, std::size_t index) : _owner(owner), _index(index) {}

        value_type operator*() const;
        iterator& operator++() { ++_index; return *this; }
        iterator operator++(int) { auto tmp = *this; ++_index; return tmp; }
        bool operator==(const iterator& other) const { return _index == other._index; }

        [[nodiscard]] std::size_t index() const { return _index; }

    private:
        const LiveValue* _owner{nullptr};
        std::size_t _index{0};
    };

    ElementRange(const LiveValue* owner, AccessResult<std::size_t> count);

    [[nodiscard]] iterator begin() const { return {_owner, 0}; }
    [[nodiscard]] iterator end() const { return {_owner, size()}; }

    [[nodiscard]] std::size_t size() const { return _count.value_or(0); }

    /** True when the element count itself could not be read (distinct from an empty range). */
    [[nodiscard]] bool unavailable() const { return !_count.ok(); }
    [[nodiscard]] const AccessFailure& failure() const { return _count.failure(); }

private:
    const LiveValue* _owner;
    AccessResult<std::size_t> _count;
};

class LiveValue {
public:
    virtual ~LiveValue() = default;

    /** Type as reported by the host, possibly truncated. Empty if the host cannot say. */
    [[nodiscard]] std::string type_string() const;

    /** Member or base-class subobject; base classes are fields named by their type. */
    [[nodiscard]] AccessResult<LiveValuePtr> field(std::string_view name) const;

    /** Names of members and base classes, in declaration order. */
    [[nodiscard]] AccessResult<std::vector<std::string>> field_names() const;

    /** Follows a pointer or reference. */
    [[nodiscard]] AccessResult<LiveValuePtr> deref() const;

    [[nodiscard]] AccessResult<LiveValuePtr> element(std::size_t index) const;
    [[nodiscard]] AccessResult<std::size_t> element_count() const;
    [[nodiscard]] ElementRange elements() const;

    [[nodiscard]] AccessResult<std::int64_t> to_int() const;

    /** The host's own one-line rendering of the value. */
    [[nodiscard]] AccessResult<std::string> summary() const;

    /** True for values that carry a type but no storage. */
    [[nodiscard]] virtual bool is_type_only() const { return false; }

protected:
    [[nodiscard]] virtual std::string do_type_string() const = 0;
    [[nodiscard]] virtual AccessResult<LiveValuePtr> do_field(std::string_view name) const = 0;
    [[nodiscard]] virtual AccessResult<std::vector<std::string>> do_field_names() const = 0;
    [[nodiscard]] virtual AccessResult<LiveValuePtr> do_deref() const = 0;
    [[nodiscard]] virtual AccessResult<LiveValuePtr> do_element(std::size_t index) const = 0;
    [[nodiscard]] virtual AccessResult<std::size_t> do_element_count() const = 0;
    [[nodiscard]] virtual AccessResult<std::int64_t> do_to_int() const = 0;
    [[nodiscard]] virtual AccessResult<std::string> do_summary() const = 0;
};

/**
 * A value known only by its type. Every data access fails with TypeOnly; this is how
 * members with no runtime storage (and the type-print operation) are rendered.
 */
class TypeOnlyValue final : public LiveValue {
public:
    explicit TypeOnlyValue(std::string type) : _type(std::move(type)) {}

    static LiveValuePtr make(std::string type) { return std::make_shared<TypeOnlyValue>(std::move(type)); }

    [[nodiscard]] bool is_type_only() const override { return true; }

protected:
    [[nodiscard]] std::string do_type_string() const override { return _type; }
    [[nodiscard]] AccessResult<LiveValuePtr> do_field(std::string_view name) const override;
    [[nodiscard]] AccessResult<std::vector<std::string>> do_field_names() const override;
    [[nodiscard]] AccessResult<LiveValuePtr> do_deref() const override;
    [[nodiscard]] AccessResult<LiveValuePtr> do_element(std::size_t index) const override;
    [[nodiscard]] AccessResult<std::size_t> do_element_count() const override;
    [[nodiscard]] AccessResult<std::int64_t> do_to_int() const override;
    [[nodiscard]] AccessResult<std::string> do_summary() const override;

private:
    std::string _type;
};

} // namespace tileprint

#endif // TILEPRINT_TYPES_LIVE_VALUE_H
