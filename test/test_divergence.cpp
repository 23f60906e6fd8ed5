// test_divergence.cpp - Tests for Divergence reports and path rendering

#include <catch2/catch_all.hpp>
#include <deepeq/divergence.h>

#include <sstream>

using namespace deepeq;

// ============================================================
// Path rendering
// ============================================================

TEST_CASE("path_to_string renders steps in order", "[path]") {
    REQUIRE(path_to_string({}).empty());
    REQUIRE(path_to_string({FieldStep{"Hobbies"}}) == ".Hobbies");
    REQUIRE(path_to_string({FieldStep{"Hobbies"}, IndexStep{0}}) == ".Hobbies[0]");
    REQUIRE(path_to_string({KeyStep{"\"k\""}, IndexStep{12}, FieldStep{"x"}}) == "[\"k\"][12].x");
}

TEST_CASE("describe_step", "[path]") {
    REQUIRE(describe_step(FieldStep{"Name"}) == "struct field Name");
    REQUIRE(describe_step(IndexStep{2}) == "index 2");
    REQUIRE(describe_step(KeyStep{"\"k\""}) == "map key \"k\"");
    REQUIRE(describe_step(KeyStep{"3"}) == "map key 3");
}

// ============================================================
// Divergence
// ============================================================

TEST_CASE("Leaf divergence has an empty path", "[divergence]") {
    Divergence d{DivergenceKind::ValueMismatch, "values differ (1 vs 2)"};

    REQUIRE(d.kind() == DivergenceKind::ValueMismatch);
    REQUIRE(d.detail() == "values differ (1 vs 2)");
    REQUIRE(d.path().empty());
    REQUIRE(d.message() == d.detail());
}

TEST_CASE("Wrapping prepends steps", "[divergence]") {
    Divergence d{DivergenceKind::ValueMismatch, "values differ (2 vs 3)"};

    // innermost step is wrapped first while unwinding
    d.wrap_index(1).wrap_field("Pets");

    REQUIRE(d.path() == Path{FieldStep{"Pets"}, IndexStep{1}});
    REQUIRE(path_to_string(d.path()) == ".Pets[1]");
    REQUIRE(d.message() == "struct field Pets: index 1: values differ (2 vs 3)");

    d.wrap_key("\"owner\"");
    REQUIRE(d.message() == "map key \"owner\": struct field Pets: index 1: values differ (2 vs 3)");
    REQUIRE(d.detail() == "values differ (2 vs 3)");
}

TEST_CASE("Divergence streams its message", "[divergence]") {
    Divergence d{DivergenceKind::MissingKey, "key missing from second map"};
    d.wrap_field("Index");

    std::ostringstream os;
    os << d;
    REQUIRE(os.str() == "struct field Index: key missing from second map");
}

TEST_CASE("divergence_kind_name", "[divergence]") {
    REQUIRE(divergence_kind_name(DivergenceKind::NilMismatch) == "NilMismatch");
    REQUIRE(divergence_kind_name(DivergenceKind::TypeMismatch) == "TypeMismatch");
    REQUIRE(divergence_kind_name(DivergenceKind::LengthMismatch) == "LengthMismatch");
    REQUIRE(divergence_kind_name(DivergenceKind::ValueMismatch) == "ValueMismatch");
    REQUIRE(divergence_kind_name(DivergenceKind::MissingKey) == "MissingKey");
    REQUIRE(divergence_kind_name(DivergenceKind::UncomparableFunction) == "UncomparableFunction");
    REQUIRE(divergence_kind_name(DivergenceKind::CycleUnverified) == "CycleUnverified");
    REQUIRE(divergence_kind_name(DivergenceKind::DepthExceeded) == "DepthExceeded");
}
