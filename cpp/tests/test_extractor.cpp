/**
 * @file test_extractor.cpp
 * @brief Unit tests for tuple, array, descriptor, coordinate and encoding extraction.
 */

#include <catch2/catch_test_macros.hpp>
#include <fixtures/ck_tile_values.h>
#include <tileprint/extract/coordinate_extractor.h>
#include <tileprint/extract/descriptor_extractor.h>
#include <tileprint/extract/tuple_extractor.h>
#include <tileprint/types/type_parser.h>

using namespace tileprint;
using namespace tileprint::testing;

namespace {

const RenderOptions options{};

Descriptor extract(const std::string& signature, const LiveValue& value) {
    return extract_descriptor(parse_type(signature), value, options);
}

}  // namespace

// ============================================================================
// Tuples and arrays
// ============================================================================

TEST_CASE("extract_tuple - empty tuple is empty, not unavailable", "[extract][tuple]") {
    auto model = extract_tuple(parse_type("ck_tile::tuple<>"), TypeOnlyValue{"ck_tile::tuple<>"});
    REQUIRE(model);
    CHECK(model->elements.empty());
    CHECK(model->declared_size == 0);
}

TEST_CASE("extract_tuple - constants come from the type", "[extract][tuple]") {
    auto type = parse_type("ck_tile::tuple<ck_tile::constant<8>, ck_tile::constant<128>>");
    auto model = extract_tuple(type, TypeOnlyValue{type.to_string()});
    REQUIRE(model);
    REQUIRE(model->elements.size() == 2);
    CHECK(*model->elements[0].constant() == 8);
    CHECK(*model->elements[1].constant() == 128);
}

TEST_CASE("extract_tuple - runtime elements through tuple_object storage", "[extract][tuple]") {
    auto type = parse_type("ck_tile::tuple<int, ck_tile::constant<4>, float>");
    auto value = fake_tuple(type.to_string(), {{"int", fake_int(7)}, {"ck_tile::constant<4>", fake("ck_tile::constant<4>")},
                                               {"float", fake("float")->set_summary("1.5")}});
    auto model = extract_tuple(type, *value);
    REQUIRE(model);
    REQUIRE(model->elements.size() == 3);
    REQUIRE(model->elements[0].live() != nullptr);
    CHECK(*(*model->elements[0].live())->to_int() == 7);
    CHECK(*model->elements[1].constant() == 4);
    CHECK(*(*model->elements[2].live())->summary() == "1.5");
}

TEST_CASE("extract_tuple - unreadable storage fails the tuple", "[extract][tuple]") {
    auto type = parse_type("ck_tile::tuple<int>");
    auto model = extract_tuple(type, *fake("ck_tile::tuple<int>")->set_throwing("Cannot access memory"));
    REQUIRE_FALSE(model);
    CHECK(model.failure().reason == AccessFailureReason::Unavailable);
}

TEST_CASE("extract_tuple - type-only storage fails each runtime element", "[extract][tuple]") {
    auto type = parse_type("ck_tile::tuple<int, ck_tile::constant<2>>");
    auto model = extract_tuple(type, TypeOnlyValue{type.to_string()});
    REQUIRE(model);
    CHECK(model->elements[0].failure()->reason == AccessFailureReason::TypeOnly);
    CHECK(*model->elements[1].constant() == 2);
}

TEST_CASE("declared_array_size - by container kind", "[extract][array]") {
    CHECK(declared_array_size(parse_type("ck_tile::array<float, 4>")) == 4u);
    CHECK(declared_array_size(parse_type("ck_tile::thread_buffer<float, 16>")) == 16u);
    CHECK(declared_array_size(parse_type("ck_tile::multi_index<3>")) == 3u);
    CHECK_FALSE(declared_array_size(parse_type("ck_tile::array<float>")).has_value());
    CHECK_FALSE(declared_array_size(parse_type("ck_tile::tuple<int>")).has_value());
}

TEST_CASE("extract_array - truncated to the limit", "[extract][array]") {
    auto value = fake_int_array("ck_tile::array<int, 5>", {1, 2, 3, 4, 5});
    auto model = extract_array(parse_type("ck_tile::array<int, 5>"), *value, 3);
    REQUIRE(model);
    CHECK(model->kind == ContainerKind::Array);
    CHECK(model->elements.size() == 3);
    CHECK(model->truncated());
}

TEST_CASE("extract_array - unreadable elements stay in place", "[extract][array]") {
    auto data = fake("int [3]")->set_elements({fake_int(1)});
    auto value = fake("ck_tile::array<int, 3>")->set_field("data", data);
    auto model = extract_array(parse_type("ck_tile::array<int, 3>"), *value, 20);
    REQUIRE(model);
    REQUIRE(model->elements.size() == 3);
    CHECK(model->elements[0].live() != nullptr);
    CHECK(model->elements[1].failure()->reason == AccessFailureReason::NotIndexable);
    CHECK_FALSE(model->truncated());
}

TEST_CASE("read_int_list - sequences, tuples and multi_index", "[extract][array]") {
    CHECK(*read_int_list(parse_type("ck_tile::sequence<3, 4>"), TypeOnlyValue{"ck_tile::sequence<3, 4>"}, options) == IntList{3, 4});

    auto index = fake_int_array("ck_tile::multi_index<2>", {12, 5});
    CHECK(*read_int_list(parse_type("ck_tile::multi_index<2>"), *index, options) == IntList{12, 5});

    auto garbage = fake_int_array("ck_tile::multi_index<1>", {-1'094'795'586});
    CHECK(read_int_list(parse_type("ck_tile::multi_index<1>"), *garbage, options).failure().reason == AccessFailureReason::Insane);

    CHECK(read_int_list(parse_type("float"), *fake("float"), options).failure().reason == AccessFailureReason::NotConvertible);
}

// ============================================================================
// Transforms
// ============================================================================

TEST_CASE("extract_transform - kinds by exact base name", "[extract][transform]") {
    CHECK(transform_kind_of(parse_type("ck_tile::merge_v2_magic_division<int>")) == TransformKind::MergeV2MagicDivision);
    CHECK(transform_kind_of(parse_type("ck_tile::merge_v3_division_mod<int>")) == TransformKind::MergeV2MagicDivision);
    CHECK(transform_kind_of(parse_type("ck_tile::xor_t<int>")) == TransformKind::Xor);
    CHECK(transform_kind_of(parse_type("ck_tile::embed_like<int>")) == TransformKind::Unknown);
}

TEST_CASE("extract_transform - arity mismatch becomes a placeholder", "[extract][transform]") {
    auto type = parse_type("ck_tile::pass_through<int>");
    AccessResult<LiveValuePtr> runtime = AccessFailure{AccessFailureReason::TypeOnly, {}};

    auto t = extract_transform(type, IntList{0, 1}, IntList{2}, runtime, options);
    CHECK(t.kind == TransformKind::Unknown);
    CHECK(t.lower_dims.empty());
    CHECK(t.upper_dims.empty());
    CHECK(t.type_name == "ck_tile::pass_through<int>");
}

TEST_CASE("extract_transform - missing required member becomes a placeholder", "[extract][transform]") {
    auto type = parse_type(runtime_embed);
    AccessResult<LiveValuePtr> runtime = LiveValuePtr{fake(runtime_embed)};

    auto t = extract_transform(type, IntList{0}, IntList{1, 2}, runtime, options);
    CHECK(t.kind == TransformKind::Unknown);
}

TEST_CASE("extract_transform - pad and slice scalars", "[extract][transform]") {
    auto pad = fake("ck_tile::pad<int, int, int, false>")
                   ->set_field("up_lengths_", fake_tuple("ck_tile::tuple<int>", {{"int", fake_int(34)}}))
                   ->set_field("left_pad_length_", fake_int(1))
                   ->set_field("right_pad_length_", fake_int(1));
    auto t = extract_transform(parse_type("ck_tile::pad<int, int, int, false>"), {0}, {1}, LiveValuePtr{pad}, options);
    CHECK(t.kind == TransformKind::Pad);
    CHECK(t.up_lengths.value() == IntList{34});
    REQUIRE(t.scalars.size() == 2);
    CHECK(t.scalars[0].name == "left_pad_length");
    CHECK(t.scalars[0].value.value() == 1);

    auto slice_type = parse_type("ck_tile::slice<int, ck_tile::constant<2>, ck_tile::constant<6>>");
    AccessResult<LiveValuePtr> type_only = AccessFailure{AccessFailureReason::TypeOnly, {}};
    auto s = extract_transform(slice_type, {0}, {1}, type_only, options);
    REQUIRE(s.scalars.size() == 2);
    CHECK(s.scalars[0].value.value() == 2);
    CHECK(s.scalars[1].value.value() == 6);
    CHECK(s.up_lengths.is_absent());
}

TEST_CASE("extract_transform - freeze index kept as multi_index", "[extract][transform]") {
    auto freeze = fake("ck_tile::freeze<ck_tile::multi_index<1>>")
                      ->set_field("low_idx_", fake_int_array("ck_tile::multi_index<1>", {3}));
    auto t = extract_transform(parse_type("ck_tile::freeze<ck_tile::multi_index<1>>"), {2}, {}, LiveValuePtr{freeze}, options);
    CHECK(t.kind == TransformKind::Freeze);
    REQUIRE(t.scalars.size() == 1);
    CHECK(t.scalars[0].name == "low_idx");
    CHECK(t.scalars[0].value.value() == 3);
}

TEST_CASE("extract_transform - unknown kinds dump their members", "[extract][transform]") {
    auto custom = fake("ck_tile::my_transform<int>")->set_field("stride_", fake_int(4));
    auto t = extract_transform(parse_type("ck_tile::my_transform<int>"), {0}, {1}, LiveValuePtr{custom}, options);
    CHECK(t.kind == TransformKind::Unknown);
    REQUIRE(t.raw_fields.size() == 1);
    CHECK(t.raw_fields[0] == std::pair<std::string, std::string>{"stride_", "4"});
}

// ============================================================================
// Descriptors
// ============================================================================

TEST_CASE("extract_descriptor - compile-time descriptor from the type alone", "[extract][descriptor]") {
    auto d = extract(static_descriptor, TypeOnlyValue{static_descriptor});

    CHECK(d.entity == DescriptorEntity::Descriptor);
    CHECK_FALSE(d.uninitialized);
    REQUIRE(d.transforms.size() == 2);
    CHECK(d.transforms[0].kind == TransformKind::Embed);
    CHECK(d.transforms[0].lower_dims == IntList{0});
    CHECK(d.transforms[0].upper_dims == IntList{1, 2, 3});
    CHECK(d.transforms[0].up_lengths.value() == IntList{2, 4, 8});
    CHECK(d.transforms[0].coefficients.value() == IntList{32, 8, 1});
    CHECK(d.transforms[1].kind == TransformKind::PassThrough);
    CHECK(d.transforms[1].up_lengths.is_absent());

    CHECK(d.bottom_dimension_ids.value() == IntList{0});
    CHECK(d.top_dimension_ids.value() == IntList{3, 4});
    CHECK(d.element_space_size.value() == 64);
    CHECK(d.ntransform.value() == 2);
    CHECK(d.ndim_hidden.value() == 5);
    CHECK(d.ndim_top.value() == 2);
    CHECK(d.ndim_bottom.value() == 1);
    CHECK(d.topology_problems().empty());
}

TEST_CASE("extract_descriptor - runtime descriptor", "[extract][descriptor]") {
    auto value = make_runtime_descriptor();
    auto d = extract(runtime_descriptor, *value);

    REQUIRE(d.transforms.size() == 2);
    CHECK(d.transforms[0].up_lengths.value() == IntList{2, 4, 8});
    CHECK(d.transforms[0].coefficients.value() == IntList{32, 8, 1});
    CHECK(d.transforms[1].up_lengths.value() == IntList{4});
    CHECK(d.element_space_size.value() == 64);
    CHECK(d.ndim_bottom.value() == 1);
    CHECK_FALSE(d.uninitialized);
}

TEST_CASE("extract_descriptor - one unreadable member leaves the rest intact", "[extract][descriptor]") {
    auto value = make_runtime_descriptor({.failing_member = "coefficients_"});
    auto d = extract(runtime_descriptor, *value);

    REQUIRE(d.transforms.size() == 2);
    REQUIRE(d.transforms[0].coefficients.is_unavailable());
    CHECK(d.transforms[0].coefficients.failure().reason == AccessFailureReason::OptimizedOut);
    CHECK(d.transforms[0].up_lengths.value() == IntList{2, 4, 8});
    CHECK(d.transforms[1].up_lengths.value() == IntList{4});
    CHECK(d.element_space_size.value() == 64);
    CHECK(d.ntransform.value() == 2);
}

TEST_CASE("extract_descriptor - unreadable scalar without a type fallback", "[extract][descriptor]") {
    auto value = make_runtime_descriptor({.failing_member = "element_space_size_"});
    auto d = extract(runtime_descriptor, *value);

    REQUIRE(d.element_space_size.is_unavailable());
    CHECK(d.element_space_size.failure().reason == AccessFailureReason::OptimizedOut);
    CHECK(d.ntransform.value() == 2);
    CHECK(d.transforms[0].up_lengths.value() == IntList{2, 4, 8});
}

TEST_CASE("extract_descriptor - unreadable transform storage keeps the type's structure", "[extract][descriptor]") {
    auto value = make_runtime_descriptor({.failing_member = "transforms_"});
    auto d = extract(runtime_descriptor, *value);

    REQUIRE(d.transforms.size() == 2);
    CHECK(d.transforms[0].kind == TransformKind::Embed);
    CHECK(d.transforms[0].upper_dims == IntList{1, 2, 3});
    CHECK(d.transforms[0].up_lengths.is_unavailable());
    CHECK(d.top_dimension_ids.value() == IntList{3, 4});
}

TEST_CASE("extract_descriptor - garbage scalars mark the descriptor uninitialized", "[extract][descriptor]") {
    auto value = make_runtime_descriptor({.uninitialized = true});
    auto d = extract(runtime_descriptor, *value);
    CHECK(d.uninitialized);
}

TEST_CASE("extract_descriptor - adaptor ids come from the type", "[extract][descriptor]") {
    const std::string adaptor =
        "ck_tile::tensor_adaptor<ck_tile::tuple<ck_tile::replicate<ck_tile::tuple<ck_tile::constant<4>>>>, "
        "ck_tile::tuple<ck_tile::sequence<>>, ck_tile::tuple<ck_tile::sequence<2>>, ck_tile::sequence<0, 1>, ck_tile::sequence<2>>";
    auto d = extract(adaptor, TypeOnlyValue{adaptor});

    CHECK(d.entity == DescriptorEntity::Adaptor);
    CHECK(d.bottom_dimension_ids.value() == IntList{0, 1});
    CHECK(d.top_dimension_ids.value() == IntList{2});
    REQUIRE(d.transforms.size() == 1);
    CHECK(d.transforms[0].kind == TransformKind::Replicate);
    CHECK(d.transforms[0].lower_dims.empty());
    CHECK(d.element_space_size.is_absent());
    CHECK(d.ndim_bottom.value() == 2);
}

TEST_CASE("Descriptor - topology problems", "[extract][descriptor]") {
    Descriptor d;
    d.bottom_dimension_ids = IntList{0};
    d.top_dimension_ids = IntList{2};
    Transform first;
    first.kind = TransformKind::PassThrough;
    first.lower_dims = {1};
    first.upper_dims = {2};
    d.transforms.push_back(first);

    auto problems = d.topology_problems();
    REQUIRE(problems.size() == 1);
    CHECK(problems.front().find("1") != std::string::npos);
}

// ============================================================================
// Coordinates and encodings
// ============================================================================

TEST_CASE("extract_coordinate - tensor_coordinate", "[extract][coordinate]") {
    const std::string type = "ck_tile::tensor_coordinate<5, ck_tile::sequence<3, 4>>";
    auto value = fake(type)->set_field("idx_hidden_", fake_int_array("ck_tile::multi_index<5>", {37, 1, 1, 5, 2}));

    auto c = extract_coordinate(parse_type(type), *value, options);
    CHECK(c.entity == CoordinateEntity::Coordinate);
    CHECK(c.ndim_hidden == 5);
    CHECK(c.bottom_dimension_ids == IntList{0});
    CHECK(c.top_dimension_ids == IntList{3, 4});
    CHECK(c.idx_hidden.value() == HiddenIndex{37, 1, 1, 5, 2});
    CHECK(c.top_index() == HiddenIndex{5, 2});
    CHECK(c.bottom_index() == HiddenIndex{37});
}

TEST_CASE("extract_coordinate - unreadable index", "[extract][coordinate]") {
    const std::string type = "ck_tile::tensor_adaptor_coordinate<3, ck_tile::sequence<0>, ck_tile::sequence<2>>";
    auto value = fake(type)->fail_field("idx_hidden_", AccessFailure{AccessFailureReason::OptimizedOut, {}});

    auto c = extract_coordinate(parse_type(type), *value, options);
    CHECK(c.entity == CoordinateEntity::AdaptorCoordinate);
    CHECK(c.idx_hidden.is_unavailable());
    CHECK(c.top_index().empty());

    auto type_only = extract_coordinate(parse_type(type), TypeOnlyValue{type}, options);
    CHECK(type_only.idx_hidden.is_absent());
}

namespace {

/** multi_index whose third entry throws on read. */
FakeValuePtr index_with_bad_entry() {
    std::vector<LiveValuePtr> items{fake_int(11), fake_int(3), fake("int")->set_throwing("cannot access memory at 0x10"),
                                    fake_int(5)};
    auto data = fake("int [4]")->set_elements(std::move(items));
    return fake("ck_tile::multi_index<4>")->set_field("data", data);
}

} // namespace

TEST_CASE("extract_coordinate - unreadable entry keeps its slot", "[extract][coordinate]") {
    const std::string type = "ck_tile::tensor_adaptor_coordinate<4, ck_tile::sequence<0>, ck_tile::sequence<2, 3>>";
    auto value = fake(type)->set_field("idx_hidden_", index_with_bad_entry());

    auto c = extract_coordinate(parse_type(type), *value, options);
    const AccessFailure lost{AccessFailureReason::Unavailable, "cannot access memory at 0x10"};
    REQUIRE(c.idx_hidden.has_value());
    CHECK(c.idx_hidden.value() == HiddenIndex{11, 3, lost, 5});
    CHECK(c.top_index() == HiddenIndex{lost, 5});
    CHECK(c.bottom_index() == HiddenIndex{11});
}

TEST_CASE("extract_coordinate - unknown count stops at the first unreadable entry", "[extract][coordinate]") {
    const std::string type = "ck_tile::tensor_coordinate<0, ck_tile::sequence<1>>";
    auto value = fake(type)->set_field("idx_hidden_", index_with_bad_entry());

    auto c = extract_coordinate(parse_type(type), *value, options);
    CHECK(c.idx_hidden.value() == HiddenIndex{11, 3});
    CHECK(c.top_index() == HiddenIndex{3});
}

TEST_CASE("extract_encoding - sequences from the type", "[extract][encoding]") {
    auto type = parse_type(
        "ck_tile::tile_distribution_encoding<ck_tile::sequence<1>, "
        "ck_tile::tuple<ck_tile::sequence<4, 2>, ck_tile::sequence<8>>, "
        "ck_tile::tuple<ck_tile::sequence<1, 2>>, ck_tile::tuple<ck_tile::sequence<0, 0>>, "
        "ck_tile::sequence<1>, ck_tile::sequence<1>>");
    auto e = extract_encoding(type);
    REQUIRE(e.has_value());
    CHECK(e->rs_lengths == IntList{1});
    REQUIRE(e->hs_lengthss.size() == 2);
    CHECK(e->hs_lengthss[0] == IntList{4, 2});
    CHECK(e->ps_to_rhss_major[0] == IntList{1, 2});
    CHECK(e->rh_length(1, 1) == 2);
    CHECK(e->rh_length(0, 0) == 1);
    CHECK_FALSE(e->rh_length(3, 0).has_value());

    CHECK_FALSE(extract_encoding(parse_type("ck_tile::tuple<>")).has_value());
}
