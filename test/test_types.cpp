// test_types.cpp - Tests for runtime type descriptors

#include <catch2/catch_all.hpp>
#include <deepeq/type.h>

#include <stdexcept>
#include <string>

using namespace deepeq;

// ============================================================
// Scalars
// ============================================================

TEST_CASE("Scalar types are singletons", "[types][scalar]") {
    REQUIRE(types::int32_type() == types::int32_type());
    REQUIRE(types::int32_type() != types::int64_type());
    REQUIRE(types::scalar_type(Kind::String) == types::string_type());

    REQUIRE(types::bool_type()->kind() == Kind::Bool);
    REQUIRE(types::float32_type()->kind() == Kind::Float32);
    REQUIRE(types::uint16_type()->to_string() == "uint16");
}

TEST_CASE("scalar_type rejects composite kinds", "[types][scalar]") {
    REQUIRE_THROWS_AS(types::scalar_type(Kind::Slice), std::invalid_argument);
    REQUIRE_THROWS_AS(types::scalar_type(Kind::Invalid), std::invalid_argument);
}

TEST_CASE("Kind helpers", "[types][kind]") {
    STATIC_REQUIRE(is_integer_kind(Kind::Uint8));
    STATIC_REQUIRE_FALSE(is_integer_kind(Kind::Float64));
    STATIC_REQUIRE(is_float_kind(Kind::Float32));
    STATIC_REQUIRE(is_nilable_kind(Kind::Map));
    STATIC_REQUIRE_FALSE(is_nilable_kind(Kind::Array));

    REQUIRE(kind_name(Kind::Pointer) == "ptr");
    REQUIRE(kind_name(Kind::Interface) == "interface");
}

// ============================================================
// Unnamed composites
// ============================================================

TEST_CASE("Unnamed composite types are interned by structure", "[types][composite]") {
    SECTION("slices") {
        auto* a = types::slice_of(types::string_type());
        auto* b = types::slice_of(types::string_type());
        REQUIRE(a == b);
        REQUIRE(a->kind() == Kind::Slice);
        REQUIRE(a->elem() == types::string_type());
        REQUIRE(a->to_string() == "[]string");
    }

    SECTION("arrays differ by length") {
        auto* three = types::array_of(types::int32_type(), 3);
        REQUIRE(three == types::array_of(types::int32_type(), 3));
        REQUIRE(three != types::array_of(types::int32_type(), 4));
        REQUIRE(three->length() == 3);
        REQUIRE(three->to_string() == "[3]int32");
    }

    SECTION("maps") {
        auto* m = types::map_of(types::string_type(), types::int64_type());
        REQUIRE(m == types::map_of(types::string_type(), types::int64_type()));
        REQUIRE(m->key() == types::string_type());
        REQUIRE(m->elem() == types::int64_type());
        REQUIRE(m->to_string() == "map[string]int64");
    }

    SECTION("pointers, chans and funcs") {
        REQUIRE(types::pointer_to(types::bool_type())->to_string() == "*bool");
        REQUIRE(types::chan_of(types::int32_type())->to_string() == "chan int32");

        auto* f = types::func_type("(int32) bool");
        REQUIRE(f == types::func_type("(int32) bool"));
        REQUIRE(f != types::func_type("()"));
        REQUIRE(f->to_string() == "func(int32) bool");
    }

    SECTION("anonymous structs") {
        auto* s = types::struct_of({{"X", types::int32_type()}, {"y", types::string_type()}});
        REQUIRE(s == types::struct_of({{"X", types::int32_type()}, {"y", types::string_type()}}));
        REQUIRE(s != types::struct_of({{"X", types::int32_type()}}));
        REQUIRE(s->to_string() == "struct { X int32; y string }");
    }

    SECTION("empty interface") {
        REQUIRE(types::any_type()->kind() == Kind::Interface);
        REQUIRE(types::any_type()->to_string() == "interface {}");
    }
}

TEST_CASE("Map keys must be comparable", "[types][composite]") {
    auto* strings = types::slice_of(types::string_type());
    REQUIRE_THROWS_AS(types::map_of(strings, types::int32_type()), std::invalid_argument);
    REQUIRE_THROWS_AS(types::map_of(types::func_type("()"), types::int32_type()), std::invalid_argument);

    auto* holds_slice = types::struct_of({{"Items", strings}});
    REQUIRE_FALSE(holds_slice->comparable());
    REQUIRE_THROWS_AS(types::map_of(holds_slice, types::int32_type()), std::invalid_argument);

    auto* point = types::struct_of({{"X", types::int32_type()}, {"Y", types::int32_type()}});
    REQUIRE(point->comparable());
    REQUIRE_NOTHROW(types::map_of(point, types::string_type()));
    REQUIRE_NOTHROW(types::map_of(types::any_type(), types::string_type()));
}

// ============================================================
// Named types
// ============================================================

TEST_CASE("Every named declaration is a distinct type", "[types][named]") {
    auto* a = types::define_struct("Pair", {{"A", types::int32_type()}});
    auto* b = types::define_struct("Pair", {{"A", types::int32_type()}});
    REQUIRE(a != b);
    REQUIRE(a->name() == "Pair");
    REQUIRE(a->to_string() == "Pair");

    auto* celsius = types::define_named("Celsius", types::float64_type());
    REQUIRE(celsius != types::float64_type());
    REQUIRE(celsius->kind() == Kind::Float64);
    REQUIRE(celsius->named());

    auto* iface = types::named_interface("Stringer");
    REQUIRE(iface->kind() == Kind::Interface);
    REQUIRE(iface != types::any_type());

    auto* handle = types::opaque_type("Handle");
    REQUIRE(handle->kind() == Kind::Opaque);
}

TEST_CASE("Struct fields", "[types][struct]") {
    auto* t = types::define_struct("Record", {
        {"Name", types::string_type()},
        {"hidden", types::int64_type()},
    });

    REQUIRE(t->num_fields() == 2);
    REQUIRE(t->field(0).name == "Name");
    REQUIRE(t->field(0).exported());
    REQUIRE_FALSE(t->field(1).exported());
    REQUIRE(t->field_index("hidden") == 1);
    REQUIRE(t->field_index("missing") == t->num_fields());
    REQUIRE_THROWS_AS(t->field(2), std::out_of_range);
}

TEST_CASE("Recursive struct declaration", "[types][struct]") {
    Type* node = types::declare_struct("Node");
    REQUIRE_FALSE(node->complete());

    types::define_fields(node, {
        {"Value", types::int32_type()},
        {"Next", types::pointer_to(node)},
        {"Children", types::slice_of(types::pointer_to(node))},
    });
    REQUIRE(node->complete());
    REQUIRE(node->field(1).type->elem() == node);
    REQUIRE(node->field(1).type->to_string() == "*Node");

    SECTION("cannot be defined twice") {
        REQUIRE_THROWS_AS(types::define_fields(node, {{"X", types::int32_type()}}), std::logic_error);
    }
}

TEST_CASE("Invalid struct definitions", "[types][struct]") {
    SECTION("duplicate field") {
        Type* t = types::declare_struct("Dup");
        REQUIRE_THROWS_AS(types::define_fields(t, {{"A", types::int32_type()}, {"A", types::int64_type()}}),
                          std::logic_error);
    }

    SECTION("untyped field") {
        Type* t = types::declare_struct("Untyped");
        REQUIRE_THROWS_AS(types::define_fields(t, {{"A", nullptr}}), std::logic_error);
    }

    SECTION("struct embedding itself by value") {
        Type* t = types::declare_struct("Loop");
        REQUIRE_THROWS_AS(types::define_fields(t, {{"Self", t}}), std::logic_error);
        REQUIRE_THROWS_AS(types::define_fields(t, {{"Many", types::array_of(t, 2)}}), std::logic_error);
    }

    SECTION("empty name") {
        REQUIRE_THROWS_AS(types::declare_struct(""), std::invalid_argument);
    }
}

TEST_CASE("Registry grows with declarations", "[types][registry]") {
    const auto before = types::registered_count();
    (void)types::define_named("Meters", types::float64_type());
    REQUIRE(types::registered_count() == before + 1);

    // interned types are only registered once
    (void)types::slice_of(types::uint8_type());
    const auto after_first = types::registered_count();
    (void)types::slice_of(types::uint8_type());
    REQUIRE(types::registered_count() == after_first);
}
