/**
 * @file test_dispatch_table.cpp
 * @brief Unit tests for printer dispatch ordering and table validation.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tileprint/printers/default_printers.h>
#include <tileprint/printers/dispatch_table.h>
#include <tileprint/types/type_parser.h>
#include <tileprint/util/errors.h>

#include <memory>
#include <string>

using namespace tileprint;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Helpers
// ============================================================================

namespace {

class NamedPrinter final : public Printer {
public:
    explicit NamedPrinter(std::string name) : _name(std::move(name)) {}

    [[nodiscard]] std::string_view name() const override { return _name; }
    [[nodiscard]] std::string render(const TypeNode&, const LiveValue&, const RenderContext&) const override {
        return _name;
    }

private:
    std::string _name;
};

PrinterPtr named(std::string name) { return std::make_shared<NamedPrinter>(std::move(name)); }

std::string_view resolved(const PrinterDispatchTable& table, std::string_view signature) {
    return table.resolve(parse_type(signature)).name();
}

}  // namespace

// ============================================================================
// Matching
// ============================================================================

TEST_CASE("dispatch - more specific entry listed first wins", "[dispatch]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tile_window_with_static_distribution", named("static"));
    table.add("tile_window", named("plain"));

    CHECK(resolved(table, "ck_tile::tile_window_with_static_distribution<int, int>") == "static");
    CHECK(resolved(table, "ck_tile::tile_window_with_static_lengths<int, int>") == "fallback");
    CHECK(resolved(table, "ck_tile::tile_window<int>") == "plain");
    CHECK(table.validate().empty());
}

TEST_CASE("dispatch - miss resolves to the fallback", "[dispatch]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tuple", named("tuple"));

    CHECK(table.match(parse_type("ck_tile::sequence<1>")) == nullptr);
    CHECK(resolved(table, "ck_tile::sequence<1>") == "fallback");
}

TEST_CASE("dispatch - matches on the base name only", "[dispatch]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tuple", named("tuple"));

    CHECK(resolved(table, "ck_tile::tuple<int>") == "tuple");
    CHECK(resolved(table, "ck_tile::detail::my_tuple<int>") == "fallback");
}

TEST_CASE("dispatch - pattern must cover the whole base name", "[dispatch]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tuple", named("tuple"));

    CHECK(resolved(table, "ck_tile::tuple_object<0, int, false>") == "fallback");
    CHECK(resolved(table, "ck_tile::detail::tuple_base<ck_tile::sequence<0, 1>, int, float>") == "fallback");
    CHECK(resolved(table, "ck_tile::tuple<>") == "tuple");
}

TEST_CASE("dispatch - required namespace", "[dispatch]") {
    PrinterDispatchTable table{named("fallback"), "ck_tile"};
    table.add("tuple", named("tuple"));

    CHECK(resolved(table, "ck_tile::tuple<int>") == "tuple");
    CHECK(resolved(table, "ck_tile::detail::tuple<int>") == "tuple");
    CHECK(resolved(table, "tuple<int>") == "tuple");
    CHECK(resolved(table, "std::tuple<int>") == "fallback");
    CHECK(resolved(table, "ck_tile_ext::tuple<int>") == "fallback");
}

TEST_CASE("dispatch - nested names never match", "[dispatch]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tile_window", named("window"));

    CHECK(table.match(parse_type("ck_tile::tile_window<int>::BottomTensorView")) == nullptr);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("validate - general entry listed first does not claim a specific one", "[dispatch][validate]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tile_window", named("plain"));
    table.add("tile_window_with_static_distribution", named("static"));

    CHECK(resolved(table, "ck_tile::tile_window_with_static_distribution<int>") == "static");
    CHECK(resolved(table, "ck_tile::tile_window<int>") == "plain");
    CHECK(table.validate().empty());
}

TEST_CASE("validate - patterns that are not bare names", "[dispatch][validate]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tuple<", named("a"));
    table.add("ck_tile::array", named("b"));

    CHECK(resolved(table, "ck_tile::tuple<int>") == "fallback");

    auto problems = table.validate();
    REQUIRE(problems.size() == 2);
    CHECK_THAT(problems[0], ContainsSubstring("never matches"));
    CHECK_THAT(problems[1], ContainsSubstring("'ck_tile::array'"));
    CHECK_THROWS_AS(table.check(), DispatchTableError);
}

TEST_CASE("validate - duplicate and empty patterns", "[dispatch][validate]") {
    PrinterDispatchTable table{named("fallback")};
    table.add("tuple", named("a"));
    table.add("tuple", named("b"));
    table.add("", named("c"));

    auto problems = table.validate();
    REQUIRE(problems.size() == 2);
    CHECK_THAT(problems[0], ContainsSubstring("duplicates"));
    CHECK_THAT(problems[1], ContainsSubstring("empty"));
    CHECK_THROWS_WITH(table.check(), ContainsSubstring("duplicates") && ContainsSubstring("empty"));
}

TEST_CASE("table - null printers are rejected", "[dispatch][validate]") {
    CHECK_THROWS_AS(PrinterDispatchTable{nullptr}, DispatchTableError);

    PrinterDispatchTable table{named("fallback")};
    CHECK_THROWS_AS(table.add("tuple", nullptr), DispatchTableError);
}

// ============================================================================
// Default table
// ============================================================================

TEST_CASE("default table - passes validation", "[dispatch][default]") {
    auto table = make_default_printer_table();
    CHECK(table.validate().empty());
    CHECK_NOTHROW(table.check());
    CHECK(table.entries().size() == 16);
    CHECK(&PrinterDispatchTable::instance() == &PrinterDispatchTable::instance());
}

TEST_CASE("default table - specific variants resolve to their own printers", "[dispatch][default]") {
    const auto& table = PrinterDispatchTable::instance();

    CHECK(resolved(table, "ck_tile::tensor_adaptor_coordinate<3, ck_tile::sequence<0>, ck_tile::sequence<1>>") == "tensor_coordinate");
    CHECK(resolved(table, "ck_tile::tensor_adaptor<int>") == "tensor_descriptor");
    CHECK(resolved(table, "ck_tile::tile_distribution_encoding<>") == "tile_distribution_encoding");
    CHECK(resolved(table, "ck_tile::tile_distribution<int>") == "tile_distribution");
    CHECK(resolved(table, "ck_tile::tile_window_with_static_lengths<int, int>") == "tile_window");
    CHECK(resolved(table, "ck_tile::multi_index<2>") == "array");
    CHECK(resolved(table, "ck_tile::thread_buffer<float, 4>") == "thread_buffer");
    CHECK(resolved(table, "ck_tile::sequence<1>") == "fallback");
    CHECK(resolved(table, "std::array<int, 4>") == "fallback");
    CHECK(resolved(table, "ck_tile::tuple_object<0, int, false>") == "fallback");
    CHECK(resolved(table, "ck_tile::tensor_descriptor_ext<int>") == "fallback");
}

TEST_CASE("default table - describe lists entries in dispatch order", "[dispatch][default]") {
    auto text = PrinterDispatchTable::instance().describe();
    CHECK_THAT(text, ContainsSubstring("  [0] tile_window_with_static_distribution -> tile_window\n"));
    CHECK_THAT(text, ContainsSubstring("  [15] thread_buffer -> thread_buffer\n"));
    CHECK_THAT(text, ContainsSubstring("  (otherwise) -> fallback\n"));
    CHECK(text.find("tensor_adaptor_coordinate") < text.find("[7] tensor_adaptor "));
}
