#include <tileprint/extract/value_access.h>
#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>

#include <fmt/format.h>

#include <cstdlib>

namespace tileprint {

std::optional<TypeNode> type_of(const LiveValue& value) {
    auto type = value.type_string();
    if (trim(type).empty()) return std::nullopt;
    try {
        return parse_type_lenient(type).node;
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

namespace {

AccessResult<std::int64_t> sane(std::int64_t v, std::int64_t max_sane) {
    if (v > max_sane || v < -max_sane)
        return AccessFailure{AccessFailureReason::Insane, fmt::format("{}", v)};
    return v;
}

} // namespace

AccessResult<std::int64_t> read_integer(const LiveValue& value, std::int64_t max_sane) {
    if (auto type = type_of(value)) {
        if (!type->is_leaf()) {
            if (auto constant = type->as_integer()) return sane(*constant, max_sane);
        }
    }

    auto direct = value.to_int();
    if (direct) return sane(*direct, max_sane);

    // wrappers such as integral_constant carry the number in a `value` member
    auto inner = value.field("value");
    if (inner) {
        if (auto wrapped = (*inner)->to_int()) return sane(*wrapped, max_sane);
    }
    return direct.failure();
}

AccessResult<std::int64_t> read_integer_field(const LiveValue& owner, std::string_view name, std::int64_t max_sane) {
    return owner.field(name).and_then([&](const LiveValuePtr& v) { return read_integer(*v, max_sane); });
}

AccessResult<LiveValuePtr> base_subobject(const LiveValue& owner, std::string_view base) {
    auto names = owner.field_names();
    if (!names) return names.failure();
    for (const auto& name : *names) {
        try {
            if (parse_type_lenient(name).node.is(base)) return owner.field(name);
        } catch (const ParseError&) {
            continue;
        }
    }
    return AccessFailure{AccessFailureReason::NoSuchField, std::string{base}};
}

} // namespace tileprint
