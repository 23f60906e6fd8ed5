// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file heap.h
/// @brief Arena owning the storage behind reference-like values.
///
/// Pointers, slices, maps and channels refer to cells of a Heap through
/// HeapRef handles. The (heap id, cell index) pair of a handle is the
/// identity token used for the identity shortcuts and cycle detection of
/// deep_equal(), so no comparison ever depends on a machine address.
///
/// Cells can be mutated after creation, which is what makes cyclic graphs
/// possible:
/// @code
///   Heap heap;
///   auto* node = types::declare_struct("Node");
///   types::define_fields(node, {{"Next", types::pointer_to(node)}});
///
///   Value p = heap.new_object(node);              // p := &Node{}
///   heap.store(p, Value::structure(node, {p}));   // p.Next = p
/// @endcode
///
/// A Heap is not thread-safe for mutation. Once built, its values may be
/// read (and compared) from several threads. Values referring into a Heap
/// must not outlive it.

#pragma once

#include <deepeq/api.h>
#include <deepeq/value.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <utility>
#include <variant>
#include <vector>

namespace deepeq {

// ============================================================
// Cells
// ============================================================

/// Target of a pointer (what new(T) allocates)
struct PointeeCell {
    Value value;
};

/// Backing array of one or more slices
struct ArrayCell {
    const Type* elem = nullptr;
    ValueVector elements;
};

struct MapCell {
    ValueMap entries;
};

struct ChanCell {
    const Type* elem = nullptr;
    std::size_t capacity = 0;
};

using Cell = std::variant<PointeeCell, ArrayCell, MapCell, ChanCell>;

// ============================================================
// Heap
// ============================================================

class DEEPEQ_API Heap {
public:
    Heap();

    // Values refer to the heap by address
    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;
    Heap(Heap&&) = delete;
    Heap& operator=(Heap&&) = delete;

    /// Process-wide unique id of this heap
    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

    /// Number of allocated cells
    [[nodiscard]] std::size_t size() const noexcept { return cells_.size(); }

    /// @throws std::out_of_range for an unknown index
    [[nodiscard]] const Cell& cell(std::uint32_t index) const;

    // ------------------------------------------------------------
    // Pointers
    // ------------------------------------------------------------

    /// &v: allocate a pointee initialised with `pointee`
    Value make_pointer(Value pointee);

    /// new(T): allocate a zeroed pointee of `type`
    Value new_object(const Type* type);

    /// *ptr = v
    void store(const Value& ptr, Value v);

    /// *ptr
    [[nodiscard]] const Value& load(const Value& ptr) const;

    // ------------------------------------------------------------
    // Slices
    // ------------------------------------------------------------

    Value make_slice(const Type* slice_type, std::initializer_list<Value> elements);
    Value make_slice(const Type* slice_type, const std::vector<Value>& elements);

    /// make([]T, len, cap) with zeroed elements
    Value make_slice(const Type* slice_type, std::size_t length, std::size_t capacity);

    /// Non-nil slice of length 0 ([]T{})
    Value empty_slice(const Type* slice_type);

    /// s[lo:hi], sharing the backing array of `s`
    /// @throws std::out_of_range unless lo <= hi <= cap(s)
    [[nodiscard]] Value slice(const Value& s, std::size_t lo, std::size_t hi) const;

    /// s[i] = v
    void set_index(const Value& s, std::size_t i, Value v);

    /// append(s, v): reuses the backing array when capacity allows,
    /// otherwise copies into a new one with doubled capacity
    Value append(const Value& s, Value v);

    // ------------------------------------------------------------
    // Maps
    // ------------------------------------------------------------

    Value make_map(const Type* map_type, std::initializer_list<std::pair<Value, Value>> entries);

    /// Non-nil map without entries
    Value empty_map(const Type* map_type);

    /// m[key] = v
    /// @throws std::invalid_argument if key is not hashable
    void map_set(const Value& m, Value key, Value v);

    /// delete(m, key); returns whether an entry was removed
    bool map_erase(const Value& m, const Value& key);

    // ------------------------------------------------------------
    // Channels
    // ------------------------------------------------------------

    Value make_chan(const Type* chan_type, std::size_t capacity = 0);

private:
    HeapRef allocate(Cell cell);
    Cell& mutable_cell(const HeapRef& ref, const char* func);
    HeapRef owned_ref(const HeapRef& ref, const char* func) const;

    template <typename T>
    T& cell_as(const HeapRef& ref, const char* func);

    std::uint32_t id_;
    std::deque<Cell> cells_;
};

} // namespace deepeq
