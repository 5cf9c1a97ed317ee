/**
 * @file test_end_to_end.cpp
 * @brief Inspector tests: whole values from type string to rendered text and diagrams.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <fixtures/ck_tile_values.h>
#include <tileprint/runtime/inspector.h>
#include <tileprint/types/type_parser.h>

using namespace tileprint;
using namespace tileprint::testing;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// to_string
// ============================================================================

TEST_CASE("Inspector - tuple holding a live tensor_view", "[inspector]") {
    const std::string type = "ck_tile::tuple<" + runtime_view + ">";
    auto value = fake_tuple(type, {{runtime_view, make_runtime_view()}});

    Inspector inspector;
    auto text = inspector.to_string(*value);

    CHECK(text.starts_with("tuple<1 element> {\n  [0]: tensor_view{\n"));
    CHECK_THAT(text, ContainsSubstring("tensor_descriptor{"));
    CHECK_THAT(text, ContainsSubstring("ntransform: 2"));
    CHECK_THAT(text, ContainsSubstring("address_space: global"));

    auto embed = text.find("[0] embed");
    auto pass_through = text.find("[1] pass_through");
    REQUIRE(embed != std::string::npos);
    REQUIRE(pass_through != std::string::npos);
    CHECK(embed < pass_through);
}

TEST_CASE("Inspector - empty tuple", "[inspector]") {
    Inspector inspector;
    CHECK(inspector.to_string(*fake("ck_tile::tuple<>")) == "tuple<0 elements> {}");
}

TEST_CASE("Inspector - uninitialized descriptor", "[inspector]") {
    Inspector inspector;
    CHECK(inspector.to_string(*make_runtime_descriptor({.uninitialized = true})) == "tensor_descriptor{[UNINITIALIZED]}");
}

TEST_CASE("Inspector - references are followed", "[inspector]") {
    const std::string type = "ck_tile::tuple<ck_tile::constant<4>>";
    auto target = fake(type);
    auto reference = fake(type + " &")->set_deref(target);

    Inspector inspector;
    CHECK(inspector.to_string(*reference) == "tuple<1 element> {\n  [0]: 4\n}");
}

TEST_CASE("Inspector - unreadable pointer", "[inspector]") {
    Inspector inspector;
    CHECK(inspector.to_string(*fake("ck_tile::tensor_view<int> *")) ==
          "ck_tile::tensor_view<int> * = <not convertible: not a pointer or reference>");
}

TEST_CASE("Inspector - unparseable type falls back to the summary", "[inspector]") {
    Inspector inspector;
    CHECK(inspector.to_string(*fake("int>")->set_summary("7")) == "int> = 7");
    CHECK(inspector.to_string(*fake("")->set_summary("7")) == "7");
}

TEST_CASE("Inspector - non ck_tile values use the fallback printer", "[inspector]") {
    auto value = fake("std::pair<int, int>")->set_field("first", fake_int(1))->set_field("second", fake_int(2));

    Inspector inspector;
    CHECK(inspector.to_string(*value) == "std::pair<int, int> {\n  first: 1\n  second: 2\n}");
    CHECK(inspector.lookup(*value) == nullptr);
}

TEST_CASE("Inspector - tuple storage types keep their stored element", "[inspector]") {
    auto slot = fake("ck_tile::tuple_object<0, int, false>")->set_field("element", fake_int(7));

    Inspector inspector;
    CHECK(inspector.lookup(*slot) == nullptr);
    CHECK(inspector.to_string(*slot) == "ck_tile::tuple_object<0, int, false> {\n  element: 7\n}");
}

TEST_CASE("Inspector - options flow into rendering", "[inspector]") {
    RenderOptions options;
    options.indent_width = 4;
    options.max_elements = 1;
    Inspector inspector{PrinterDispatchTable::instance(), options};

    CHECK(inspector.to_string(*fake_int_array("ck_tile::array<int, 3>", {7, 8, 9})) == "array<int, 3> = [7, ... (3 total)]");
    CHECK(inspector.type_print("ck_tile::tuple<ck_tile::tuple<ck_tile::constant<1>>>") ==
          "tuple<1 element> {\n"
          "  [0]: tuple<1 element> {\n"
          "          [0]: 1\n"
          "        }\n"
          "}");
}

// ============================================================================
// type_print and lookup
// ============================================================================

TEST_CASE("Inspector - type_print renders from the signature alone", "[inspector]") {
    Inspector inspector;
    auto text = inspector.type_print(static_descriptor);
    CHECK(text.starts_with("tensor_descriptor{\n  element_space_size: 64\n"));
    CHECK_THAT(text, ContainsSubstring("        coefficients: [32, 8, 1]\n"));

    CHECK(inspector.type_print("ck_tile::tuple<ck_tile::constant<1>, ck_tile::constant<2>") ==
          "tuple<2 elements> {\n  [0]: 1\n  [1]: 2\n}");
    CHECK_THROWS_AS(inspector.type_print(""), ParseError);
}

TEST_CASE("Inspector - lookup names the matching printer", "[inspector]") {
    Inspector inspector;
    const Printer* printer = inspector.lookup(*make_runtime_view());
    REQUIRE(printer != nullptr);
    CHECK(printer->name() == "tensor_view");

    const Printer* window = inspector.lookup(*fake("ck_tile::tile_window_with_static_lengths<int, int>"));
    REQUIRE(window != nullptr);
    CHECK(window->name() == "tile_window");
}

// ============================================================================
// Diagrams
// ============================================================================

TEST_CASE("Inspector - diagram of a live tensor_view", "[inspector][diagram]") {
    Inspector inspector;
    auto graph = inspector.diagram(*make_runtime_view());
    REQUIRE(graph.has_value());
    CHECK(graph->nodes.size() == 5);
    CHECK(graph->edges.size() == 4);
}

TEST_CASE("Inspector - diagram of a view whose descriptor cannot be read", "[inspector][diagram]") {
    Inspector inspector;
    auto graph = inspector.diagram(*fake(static_view));
    REQUIRE(graph.has_value());
    CHECK(graph->nodes.size() == 5);
}

TEST_CASE("Inspector - mermaid output and errors", "[inspector][diagram]") {
    Inspector inspector;
    auto text = inspector.mermaid(*make_runtime_descriptor(), "desc");
    CHECK(text.starts_with("```mermaid\ngraph TD\n    %% desc\n"));
    CHECK_THAT(text, ContainsSubstring("    D2 -->|\"[1] pass_through\"| D4\n"));
    CHECK_THAT(text, ContainsSubstring("    style D3 fill:#c8e6c9\n"));

    CHECK(inspector.mermaid(*fake("ck_tile::tuple<>"), "t") == "Error: Not a tensor_descriptor or tensor_adaptor");
    CHECK_FALSE(inspector.diagram(*fake("float")).has_value());
}
