#include <tileprint/types/type_node.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_map>

namespace tileprint {

std::string_view TypeNode::base_name() const {
    std::string_view n{name};
    auto pos = n.rfind("::");
    return pos == std::string_view::npos ? n : n.substr(pos + 2);
}

std::string_view TypeNode::namespace_name() const {
    std::string_view n{name};
    auto pos = n.rfind("::");
    return pos == std::string_view::npos ? std::string_view{} : n.substr(0, pos);
}

std::optional<std::int64_t> parse_integer_literal(std::string_view text) {
    text = trim(text);
    if (text == "true") return 1;
    if (text == "false") return 0;

    // C-style cast emitted for enum non-type arguments: "(ck_tile::address_space_enum)1"
    if (!text.empty() && text.front() == '(') {
        auto close = text.find(')');
        if (close == std::string_view::npos) return std::nullopt;
        text = trim(text.substr(close + 1));
    }

    while (!text.empty()) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
        if (c == 'u' || c == 'l') text.remove_suffix(1);
        else break;
    }
    if (text.empty()) return std::nullopt;

    std::int64_t value{0};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

std::optional<std::int64_t> TypeNode::as_integer() const {
    if (args.empty()) {
        if (is_template) return std::nullopt;
        return parse_integer_literal(name);
    }
    auto base = base_name();
    if (base == "constant" || base == "number" || base == "bool_constant") return args.front().as_integer();
    if (base == "integral_constant" && args.size() >= 2) return args[1].as_integer();
    return std::nullopt;
}

std::optional<IntList> TypeNode::sequence_values() const {
    if (!is("sequence")) return std::nullopt;
    IntList values;
    values.reserve(args.size());
    for (const auto& a : args) {
        auto v = a.as_integer();
        if (!v) return std::nullopt;
        values.push_back(*v);
    }
    return values;
}

const TypeNode* TypeNode::find(std::string_view base) const {
    if (base_name() == base) return this;
    for (const auto& a : args) {
        if (auto* found = a.find(base)) return found;
    }
    return nullptr;
}

std::size_t TypeNode::depth() const {
    std::size_t deepest{0};
    for (const auto& a : args) deepest = std::max(deepest, a.depth());
    return deepest + 1;
}

std::string TypeNode::to_string() const {
    std::string out;
    if (is_const) out += "const ";
    if (is_volatile) out += "volatile ";
    out += name;
    if (is_template) {
        out += '<';
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0) out += ", ";
            out += args[i].to_string();
        }
        out += '>';
    }
    if (!member.empty()) {
        out += "::";
        out += member;
    }
    if (!indirection.empty()) {
        out += ' ';
        out += indirection;
    }
    return out;
}

std::optional<std::string> data_type_name(const TypeNode& type) {
    static const std::unordered_map<std::string_view, std::string_view> scalar_names{
        {"_Float16", "float16"},
        {"half_t", "float16"},
        {"fp16_t", "float16"},
        {"bf16_t", "bfloat16"},
        {"bfloat16_t", "bfloat16"},
        {"__bf16", "bfloat16"},
        {"fp8_t", "fp8"},
        {"bf8_t", "bf8"},
        {"float", "float"},
        {"double", "double"},
        {"int", "int"},
        {"int32_t", "int"},
        {"int8_t", "int8"},
        {"signed char", "int8"},
        {"uint8_t", "uint8"},
        {"unsigned char", "uint8"},
    };
    if (type.args.empty() && !type.is_template) {
        auto it = scalar_names.find(type.base_name());
        if (it != scalar_names.end()) return std::string{it->second};
        return std::nullopt;
    }
    for (const auto& a : type.args) {
        if (auto found = data_type_name(a)) return found;
    }
    return std::nullopt;
}

} // namespace tileprint
