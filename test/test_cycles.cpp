// test_cycles.cpp - Tests for deep_equal on cyclic and shared value graphs

#include <catch2/catch_all.hpp>
#include <deepeq/deep_equal.h>
#include <deepeq/heap.h>

#include <cstdint>
#include <vector>

using namespace deepeq;

// ============================================================
// Helper Functions
// ============================================================

namespace {

const Type* node_type()
{
    static const Type* type = [] {
        Type* node = types::declare_struct("Node");
        types::define_fields(node, {
            {"Value", types::int32_type()},
            {"Next", types::pointer_to(node)},
        });
        return node;
    }();
    return type;
}

/// Ring of nodes n0 -> n1 -> ... -> n0 holding `values`; returns n0
Value make_ring(Heap& heap, const std::vector<std::int32_t>& values)
{
    std::vector<Value> nodes;
    for (std::size_t i = 0; i < values.size(); ++i) {
        nodes.push_back(heap.new_object(node_type()));
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        heap.store(nodes[i], Value::structure(node_type(), {values[i], nodes[(i + 1) % nodes.size()]}));
    }
    return nodes.front();
}

/// []any whose only element is the slice itself
Value make_self_slice(Heap& heap)
{
    Value s = heap.make_slice(types::slice_of(types::any_type()), 1, 1);
    heap.set_index(s, 0, s);
    return s;
}

/// map[string]any with m["self"] = m
Value make_self_map(Heap& heap, std::int64_t tag)
{
    Value m = heap.empty_map(types::map_of(types::string_type(), types::any_type()));
    heap.map_set(m, "self", m);
    heap.map_set(m, "tag", tag);
    return m;
}

const CompareOptions strict{.cycles = CyclePolicy::Report};

} // namespace

// ============================================================
// Termination with the default policy
// ============================================================

TEST_CASE("Self-referential structs terminate", "[cycles]") {
    Heap heap;
    Value p = make_ring(heap, {1});
    Value q = make_ring(heap, {1});

    REQUIRE(p.elem().field("Next").identity() == p.identity());
    REQUIRE(deep_equal(p, q).equal);
    REQUIRE(deep_equal(q, p).equal);
    REQUIRE(deep_equal(p, p).equal);
}

TEST_CASE("Rings compare through every node", "[cycles]") {
    Heap heap;

    SECTION("equal rings") {
        REQUIRE(deep_equal(make_ring(heap, {1, 2, 3}), make_ring(heap, {1, 2, 3})).equal);
    }

    SECTION("a difference before the cycle closes is found") {
        auto result = deep_equal(make_ring(heap, {1, 2, 3}), make_ring(heap, {1, 2, 4}));
        REQUIRE_FALSE(result);
        REQUIRE(result.divergence->kind() == DivergenceKind::ValueMismatch);
        REQUIRE(path_to_string(result.divergence->path()) == ".Next.Next.Value");
    }

    SECTION("rotated rings differ at the first node") {
        auto result = deep_equal(make_ring(heap, {1, 2}), make_ring(heap, {2, 1}));
        REQUIRE_FALSE(result);
        REQUIRE(result.divergence->message() == "struct field Value: values differ (1 vs 2)");
    }

    SECTION("rings of different length with the same unrolling are equal") {
        REQUIRE(deep_equal(make_ring(heap, {5}), make_ring(heap, {5, 5})).equal);
        REQUIRE(deep_equal(make_ring(heap, {5, 5}), make_ring(heap, {5})).equal);
    }
}

TEST_CASE("Cycles through slices and interfaces", "[cycles]") {
    Heap heap;
    Value s = make_self_slice(heap);
    Value t = make_self_slice(heap);

    REQUIRE(s.index(0).elem().identity() == s.identity());
    REQUIRE(deep_equal(s, t).equal);
    REQUIRE(deep_equal(Value::any(s), Value::any(t)).equal);
}

TEST_CASE("Cycles through maps", "[cycles]") {
    Heap heap;
    REQUIRE(deep_equal(make_self_map(heap, 1), make_self_map(heap, 1)).equal);

    auto result = deep_equal(make_self_map(heap, 1), make_self_map(heap, 2));
    REQUIRE_FALSE(result);
    REQUIRE(path_to_string(result.divergence->path()) == "[\"tag\"]");
}

// ============================================================
// CyclePolicy::Report
// ============================================================

TEST_CASE("Report policy flags revisits of in-progress pairs", "[cycles][report]") {
    Heap heap;

    SECTION("identical but separate self-referential structs") {
        auto result = deep_equal(make_ring(heap, {1}), make_ring(heap, {1}), strict);
        REQUIRE_FALSE(result);
        REQUIRE(result.divergence->kind() == DivergenceKind::CycleUnverified);
        REQUIRE(result.divergence->message() == "struct field Next: cycle detected, cannot verify");
    }

    SECTION("cyclic slices") {
        auto result = deep_equal(make_self_slice(heap), make_self_slice(heap), strict);
        REQUIRE(result.divergence->kind() == DivergenceKind::CycleUnverified);
        REQUIRE(result.divergence->path() == Path{IndexStep{0}});
    }

    SECTION("the same graph on both sides is still equal") {
        Value p = make_ring(heap, {1, 2});
        REQUIRE(deep_equal(p, p, strict).equal);
    }

    SECTION("differences are still reported as such") {
        auto result = deep_equal(make_ring(heap, {1}), make_ring(heap, {2}), strict);
        REQUIRE(result.divergence->kind() == DivergenceKind::ValueMismatch);
    }
}

TEST_CASE("Report policy accepts shared acyclic substructure", "[cycles][report]") {
    Heap heap;
    auto* leaf = types::pointer_to(types::string_type());
    auto* pair = types::define_struct("Pair", {{"Left", leaf}, {"Right", leaf}});

    Value l = heap.make_pointer(Value{"leaf"});
    Value m = heap.make_pointer(Value{"leaf"});
    Value x = Value::structure(pair, {l, l});
    Value y = Value::structure(pair, {m, m});

    // The second visit of (l, m) finds a finished pair
    REQUIRE(deep_equal(x, y, strict).equal);
    REQUIRE(deep_equal(x, y).equal);

    SECTION("slices sharing one backing array") {
        auto* ints = types::slice_of(types::int32_type());
        auto* twice = types::define_struct("Twice", {{"A", ints}, {"B", ints}});
        Value s = heap.make_slice(ints, {std::int32_t{1}, std::int32_t{2}});
        Value t = heap.make_slice(ints, {std::int32_t{1}, std::int32_t{2}});
        REQUIRE(deep_equal(Value::structure(twice, {s, s}), Value::structure(twice, {t, t}), strict).equal);
    }
}
