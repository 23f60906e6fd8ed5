// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic Value type: a typed payload that can be inspected generically.
///
/// A Value pairs a runtime Type (see type.h) with its payload:
/// - Scalars (bool, fixed-width integers, float, double, string) are stored inline
/// - Arrays and structs hold their elements in persistent immer vectors
///   (value semantics, copies are cheap)
/// - Slices, maps, pointers and channels hold a HeapRef into a Heap arena
///   (see heap.h); a null HeapRef is the nil value of those kinds
/// - Interfaces hold an optional boxed concrete value
/// - Funcs hold a shared callable
/// - Opaque values hold a foreign payload the dynamic layer cannot look into
///
/// A default-constructed Value is *invalid*: it is the nil of the dynamic
/// boundary, e.g. what a nil interface unwraps to.
///
/// Values that hold HeapRefs must not outlive the Heap they point into.

#pragma once

#include <deepeq/deepeq_config.h>
#include <deepeq/api.h>
#include <deepeq/concepts.h>
#include <deepeq/log.h>
#include <deepeq/type.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace deepeq {

// ============================================================
// Memory Policy
// ============================================================

#if DEEPEQ_THREAD_SAFE
using memory_policy = immer::default_memory_policy;
#else
using memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                           immer::unsafe_refcount_policy,
                                           immer::no_lock_policy>;
#endif

class Value;
class Heap;

/// Primitive (==) hash of a comparable value, consistent with primitive_equal()
struct KeyHash {
    DEEPEQ_API std::size_t operator()(const Value& v) const;
};

/// Primitive (==) equality, the native key equality of maps
struct KeyEqual {
    DEEPEQ_API bool operator()(const Value& a, const Value& b) const;
};

using ValueBox    = immer::box<Value, memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;
using ValueMap    = immer::map<Value, ValueBox, KeyHash, KeyEqual, memory_policy>;

using Callable = std::function<Value(std::span<const Value>)>;

// ============================================================
// Handles and identity
// ============================================================

/// Handle to a cell owned by a Heap; a null handle is nil
struct HeapRef {
    Heap* heap = nullptr;
    std::uint32_t index = 0;

    explicit operator bool() const noexcept { return heap != nullptr; }
    bool operator==(const HeapRef&) const = default;

    /// Process-wide unique token: heap id in the high bits, cell index in the low bits
    [[nodiscard]] DEEPEQ_API std::uint64_t token() const noexcept;
};

/// Identity of a reference-like value, independent of its content.
///
/// - pointer, map, chan: the referenced cell
/// - slice: the backing cell, the offset of the first element and the length
struct Identity {
    std::uint64_t cell = 0;
    std::size_t offset = 0;
    std::size_t extent = 0;

    auto operator<=>(const Identity&) const = default;
};

// ============================================================
// Payloads of composite kinds
// ============================================================

struct ArrayData {
    ValueVector elements;
};

struct StructData {
    ValueVector fields;
};

struct SliceData {
    HeapRef backing;
    std::size_t offset = 0;
    std::size_t length = 0;
    std::size_t capacity = 0;
};

struct MapData {
    HeapRef cell;
};

struct PointerData {
    HeapRef target;
};

struct ChanData {
    HeapRef cell;
};

struct InterfaceData {
    std::optional<ValueBox> held;
};

struct FuncData {
    std::shared_ptr<const Callable> fn;
};

struct OpaqueData {
    std::shared_ptr<const void> payload;
};

// ============================================================
// Value
// ============================================================

class DEEPEQ_API Value {
public:
    using data_type = std::variant<std::monostate,
                                   bool,
                                   std::int8_t,
                                   std::int16_t,
                                   std::int32_t,
                                   std::int64_t,
                                   std::uint8_t,
                                   std::uint16_t,
                                   std::uint32_t,
                                   std::uint64_t,
                                   float,
                                   double,
                                   std::string,
                                   ArrayData,
                                   StructData,
                                   SliceData,
                                   MapData,
                                   PointerData,
                                   InterfaceData,
                                   FuncData,
                                   ChanData,
                                   OpaqueData>;

    /// Invalid value (nil at the dynamic boundary)
    Value() noexcept = default;

    Value(bool v);
    Value(std::int8_t v);
    Value(std::int16_t v);
    Value(std::int32_t v);
    Value(std::int64_t v);
    Value(std::uint8_t v);
    Value(std::uint16_t v);
    Value(std::uint32_t v);
    Value(std::uint64_t v);
    Value(float v);
    Value(double v);
    Value(const std::string& v);
    Value(std::string&& v);
    Value(const char* v);

    // ------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------

    /// Re-tag `underlying` with a named type of the same structure
    /// @throws std::invalid_argument if the structures differ
    static Value of(const Type* type, Value underlying);

    /// Zero value of `type`: false, 0, "", nil, or zeroed fields/elements
    static Value zero(const Type* type);

    /// Nil value of a slice, map, pointer, interface, func or chan type
    /// @throws std::invalid_argument for other kinds
    static Value nil(const Type* type);

    /// Array literal; `elements.size()` must equal the array length
    static Value array(const Type* type, std::initializer_list<Value> elements);
    static Value array(const Type* type, const std::vector<Value>& elements);

    /// Positional struct literal; missing trailing fields take their zero value
    static Value structure(const Type* type, std::initializer_list<Value> fields);
    static Value structure(const Type* type, const std::vector<Value>& fields);

    /// Wrap `held` in an interface. An interface `held` is unwrapped first;
    /// an invalid `held` yields the nil interface.
    static Value box(const Type* iface, Value held);

    /// Empty-interface shorthand for box(types::any_type(), held)
    static Value any(Value held);

    static Value function(const Type* type, Callable fn);

    static Value opaque(const Type* type, std::shared_ptr<const void> payload);

    // ------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------

    [[nodiscard]] bool valid() const noexcept { return type_ != nullptr; }
    [[nodiscard]] const Type* type() const noexcept { return type_; }
    [[nodiscard]] Kind kind() const noexcept { return type_ ? type_->kind() : Kind::Invalid; }

    /// True for nil slices, maps, pointers, interfaces, funcs and chans.
    /// Always false for other kinds.
    [[nodiscard]] bool is_nil() const noexcept;

    /// False for values whose content the dynamic layer cannot see (Opaque)
    [[nodiscard]] bool inspectable() const noexcept { return kind() != Kind::Opaque; }

    /// Length of arrays, slices, maps and strings; 0 otherwise
    [[nodiscard]] std::size_t len() const;

    /// Capacity of slices and chans; len() otherwise
    [[nodiscard]] std::size_t cap() const;

    /// Element of an array or slice. Logs and returns an invalid value when
    /// out of range or not indexable.
    [[nodiscard]] const Value& index(std::size_t i) const;

    /// Struct field by declaration position, exported or not
    [[nodiscard]] const Value& field(std::size_t i) const;

    /// Struct field by name, exported or not
    [[nodiscard]] const Value& field(std::string_view name) const;

    /// Pointee of a pointer or held value of an interface; invalid when nil
    [[nodiscard]] const Value& elem() const;

    /// Map lookup with the map's native key equality; nullptr when absent
    [[nodiscard]] const Value* map_find(const Value& key) const;

    /// Keys of a map in unspecified order
    [[nodiscard]] std::vector<Value> map_keys() const;

    /// Entries of a non-nil map; nullptr for nil maps and other kinds
    [[nodiscard]] const ValueMap* map_entries() const;

    /// Visit each map entry as fn(key, value), in unspecified order
    template <typename Fn>
        requires EntryVisitor<Fn, Value>
    void for_each_entry(Fn&& fn) const;

    /// Identity token of non-nil pointers, slices, maps and chans
    [[nodiscard]] std::optional<Identity> identity() const noexcept;

    /// Invoke a non-nil func value
    /// @throws std::logic_error when nil or not a func
    Value call(std::span<const Value> args) const;

    // ------------------------------------------------------------
    // Payload access
    // ------------------------------------------------------------

    [[nodiscard]] const data_type& data() const noexcept { return data_; }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data_); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data_); }

    [[nodiscard]] std::int64_t as_int64(std::int64_t default_val = 0) const noexcept;
    [[nodiscard]] std::uint64_t as_uint64(std::uint64_t default_val = 0) const noexcept;
    [[nodiscard]] double as_double(double default_val = 0.0) const noexcept;
    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept;
    [[nodiscard]] std::string as_string(std::string default_val = "") const;

private:
    friend class Heap;
    friend class StructBuilder;
    friend class ArrayBuilder;

    Value(const Type* type, data_type data) : type_(type), data_(std::move(data)) {}

    const Type* type_ = nullptr;
    data_type data_;
};

template <typename Fn>
    requires EntryVisitor<Fn, Value>
void Value::for_each_entry(Fn&& fn) const
{
    if (const auto* entries = map_entries()) {
        for (const auto& [key, box] : *entries) {
            fn(key, box.get());
        }
    }
}

// ============================================================
// Primitive equality (the host == operator)
// ============================================================

/// Go-style ==: scalars by value (NaN != NaN), arrays and structs
/// elementwise, pointers and chans by handle, interfaces by dynamic type
/// and held value, opaque values by payload address.
/// @throws std::invalid_argument when a slice, map or func is reached
[[nodiscard]] DEEPEQ_API bool primitive_equal(const Value& x, const Value& y);

/// Hash consistent with primitive_equal()
/// @throws std::invalid_argument when a slice, map or func is reached
[[nodiscard]] DEEPEQ_API std::size_t primitive_hash(const Value& v);

/// Whether `v` can be used as a map key (checks held interface values too)
[[nodiscard]] DEEPEQ_API bool is_hashable(const Value& v) noexcept;

// ============================================================
// Formatting
// ============================================================

/// Go %v-like rendering: Person{Name:"A", Age:22, Hobbies:["Surfing"]}.
/// Content nested deeper than `depth` prints as "...", so cyclic graphs
/// print finitely.
[[nodiscard]] DEEPEQ_API std::string value_to_string(const Value& val,
                                                     std::size_t depth = DEEPEQ_DEFAULT_PRINT_DEPTH);

/// Print Value with indentation
DEEPEQ_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

DEEPEQ_API std::ostream& operator<<(std::ostream& os, const Value& val);

namespace detail {

/// Convert `v` for storage in a slot of type `target`: identical types pass
/// through, interface slots box the value, invalid values become nil.
/// @throws std::invalid_argument otherwise
[[nodiscard]] DEEPEQ_API Value assign_to(const Type* target, Value v, std::string_view func);

} // namespace detail

} // namespace deepeq
