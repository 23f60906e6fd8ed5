// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// heap.cpp - Arena of pointees, backing arrays, maps and channels

#include <deepeq/heap.h>

#include <immer/vector_transient.hpp>

#include <algorithm>
#include <atomic>
#include <limits>
#include <stdexcept>
#include <string>

namespace deepeq {

namespace {

std::uint32_t next_heap_id()
{
    // 0 is reserved so that a nil handle never shares a token with a cell
    static std::atomic<std::uint32_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

void require_kind(const Type* type, Kind kind, const char* func)
{
    if (!type || type->kind() != kind) {
        throw std::invalid_argument(std::string{func} + ": expected " +
                                    std::string{kind_name(kind)} + " type, got " +
                                    (type ? type->to_string() : std::string{"<null type>"}));
    }
}

} // anonymous namespace

Heap::Heap() : id_(next_heap_id()) {}

const Cell& Heap::cell(std::uint32_t index) const
{
    if (index >= cells_.size()) {
        throw std::out_of_range("Heap::cell: index " + std::to_string(index) + " out of range");
    }
    return cells_[index];
}

HeapRef Heap::allocate(Cell cell)
{
    if (cells_.size() >= std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("Heap::allocate: heap is full");
    }
    cells_.push_back(std::move(cell));
    return HeapRef{this, static_cast<std::uint32_t>(cells_.size() - 1)};
}

HeapRef Heap::owned_ref(const HeapRef& ref, const char* func) const
{
    if (!ref) {
        throw std::logic_error(std::string{func} + ": nil reference");
    }
    if (ref.heap != this) {
        throw std::invalid_argument(std::string{func} + ": value belongs to another heap");
    }
    return ref;
}

Cell& Heap::mutable_cell(const HeapRef& ref, const char* func)
{
    const auto owned = owned_ref(ref, func);
    if (owned.index >= cells_.size()) {
        throw std::out_of_range(std::string{func} + ": dangling reference");
    }
    return cells_[owned.index];
}

template <typename T>
T& Heap::cell_as(const HeapRef& ref, const char* func)
{
    auto* cell = std::get_if<T>(&mutable_cell(ref, func));
    if (!cell) {
        throw std::logic_error(std::string{func} + ": reference to a cell of another kind");
    }
    return *cell;
}

// ============================================================
// Pointers
// ============================================================

Value Heap::make_pointer(Value pointee)
{
    if (!pointee.valid()) {
        throw std::invalid_argument("Heap::make_pointer: cannot take the address of nil");
    }
    const Type* ptr_type = types::pointer_to(pointee.type());
    return Value{ptr_type, PointerData{allocate(PointeeCell{std::move(pointee)})}};
}

Value Heap::new_object(const Type* type)
{
    return make_pointer(Value::zero(type));
}

void Heap::store(const Value& ptr, Value v)
{
    const auto* p = ptr.get_if<PointerData>();
    if (!p) {
        throw std::invalid_argument("Heap::store: not a pointer");
    }
    auto& cell = cell_as<PointeeCell>(p->target, "Heap::store");
    cell.value = detail::assign_to(ptr.type()->elem(), std::move(v), "Heap::store");
}

const Value& Heap::load(const Value& ptr) const
{
    const auto* p = ptr.get_if<PointerData>();
    if (!p) {
        throw std::invalid_argument("Heap::load: not a pointer");
    }
    const auto ref = owned_ref(p->target, "Heap::load");
    return std::get<PointeeCell>(cell(ref.index)).value;
}

// ============================================================
// Slices
// ============================================================

Value Heap::make_slice(const Type* slice_type, std::initializer_list<Value> elements)
{
    return make_slice(slice_type, std::vector<Value>{elements});
}

Value Heap::make_slice(const Type* slice_type, const std::vector<Value>& elements)
{
    require_kind(slice_type, Kind::Slice, "Heap::make_slice");
    auto t = ValueVector{}.transient();
    for (const auto& e : elements) {
        t.push_back(ValueBox{detail::assign_to(slice_type->elem(), e, "Heap::make_slice")});
    }
    auto ref = allocate(ArrayCell{slice_type->elem(), t.persistent()});
    return Value{slice_type, SliceData{ref, 0, elements.size(), elements.size()}};
}

Value Heap::make_slice(const Type* slice_type, std::size_t length, std::size_t capacity)
{
    require_kind(slice_type, Kind::Slice, "Heap::make_slice");
    if (length > capacity) {
        throw std::out_of_range("Heap::make_slice: len larger than cap");
    }
    const ValueBox zero{Value::zero(slice_type->elem())};
    auto t = ValueVector{}.transient();
    for (std::size_t i = 0; i < capacity; ++i) {
        t.push_back(zero);
    }
    auto ref = allocate(ArrayCell{slice_type->elem(), t.persistent()});
    return Value{slice_type, SliceData{ref, 0, length, capacity}};
}

Value Heap::empty_slice(const Type* slice_type)
{
    return make_slice(slice_type, 0, 0);
}

Value Heap::slice(const Value& s, std::size_t lo, std::size_t hi) const
{
    const auto* data = s.get_if<SliceData>();
    if (!data) {
        throw std::invalid_argument("Heap::slice: not a slice");
    }
    if (lo > hi || hi > data->capacity) {
        throw std::out_of_range("Heap::slice: bounds [" + std::to_string(lo) + ":" +
                                std::to_string(hi) + "] with capacity " +
                                std::to_string(data->capacity));
    }
    if (data->backing && data->backing.heap != this) {
        throw std::invalid_argument("Heap::slice: value belongs to another heap");
    }
    if (!data->backing) {
        // slicing nil[0:0] stays nil
        return s;
    }
    return Value{s.type(), SliceData{data->backing, data->offset + lo, hi - lo, data->capacity - lo}};
}

void Heap::set_index(const Value& s, std::size_t i, Value v)
{
    const auto* data = s.get_if<SliceData>();
    if (!data) {
        throw std::invalid_argument("Heap::set_index: not a slice");
    }
    if (i >= data->length) {
        throw std::out_of_range("Heap::set_index: index " + std::to_string(i) + " out of range");
    }
    auto& cell = cell_as<ArrayCell>(data->backing, "Heap::set_index");
    cell.elements = std::move(cell.elements)
                        .set(data->offset + i,
                             ValueBox{detail::assign_to(cell.elem, std::move(v), "Heap::set_index")});
}

Value Heap::append(const Value& s, Value v)
{
    const auto* data = s.get_if<SliceData>();
    if (!data) {
        throw std::invalid_argument("Heap::append: not a slice");
    }
    const Type* elem = s.type()->elem();
    ValueBox item{detail::assign_to(elem, std::move(v), "Heap::append")};

    if (data->backing && data->length < data->capacity) {
        auto& cell = cell_as<ArrayCell>(data->backing, "Heap::append");
        cell.elements = std::move(cell.elements).set(data->offset + data->length, std::move(item));
        return Value{s.type(), SliceData{data->backing, data->offset, data->length + 1, data->capacity}};
    }

    const std::size_t capacity = std::max<std::size_t>(1, data->capacity * 2);
    auto t = ValueVector{}.transient();
    if (data->backing) {
        const auto& old = cell_as<ArrayCell>(data->backing, "Heap::append").elements;
        for (std::size_t i = 0; i < data->length; ++i) {
            t.push_back(old[data->offset + i]);
        }
    }
    t.push_back(std::move(item));
    const ValueBox zero{Value::zero(elem)};
    while (t.size() < capacity) {
        t.push_back(zero);
    }
    auto ref = allocate(ArrayCell{elem, t.persistent()});
    return Value{s.type(), SliceData{ref, 0, data->length + 1, capacity}};
}

// ============================================================
// Maps
// ============================================================

Value Heap::make_map(const Type* map_type, std::initializer_list<std::pair<Value, Value>> entries)
{
    Value m = empty_map(map_type);
    for (const auto& [key, value] : entries) {
        map_set(m, key, value);
    }
    return m;
}

Value Heap::empty_map(const Type* map_type)
{
    require_kind(map_type, Kind::Map, "Heap::empty_map");
    return Value{map_type, MapData{allocate(MapCell{})}};
}

void Heap::map_set(const Value& m, Value key, Value v)
{
    const auto* data = m.get_if<MapData>();
    if (!data) {
        throw std::invalid_argument("Heap::map_set: not a map");
    }
    key = detail::assign_to(m.type()->key(), std::move(key), "Heap::map_set");
    if (!is_hashable(key)) {
        throw std::invalid_argument("Heap::map_set: unhashable key " + value_to_string(key, 1));
    }
    v = detail::assign_to(m.type()->elem(), std::move(v), "Heap::map_set");
    auto& cell = cell_as<MapCell>(data->cell, "Heap::map_set");
    cell.entries = std::move(cell.entries).set(std::move(key), ValueBox{std::move(v)});
}

bool Heap::map_erase(const Value& m, const Value& key)
{
    const auto* data = m.get_if<MapData>();
    if (!data) {
        throw std::invalid_argument("Heap::map_erase: not a map");
    }
    if (!data->cell) {
        // delete on a nil map is a no-op
        return false;
    }
    auto& cell = cell_as<MapCell>(data->cell, "Heap::map_erase");
    if (!m.map_find(key)) {
        return false;
    }
    const Value stored_key = key.type() == m.type()->key() ? key : Value::box(m.type()->key(), key);
    cell.entries = std::move(cell.entries).erase(stored_key);
    return true;
}

// ============================================================
// Channels
// ============================================================

Value Heap::make_chan(const Type* chan_type, std::size_t capacity)
{
    require_kind(chan_type, Kind::Chan, "Heap::make_chan");
    return Value{chan_type, ChanData{allocate(ChanCell{chan_type->elem(), capacity})}};
}

} // namespace deepeq
