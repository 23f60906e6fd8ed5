// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type.h
/// @brief Runtime type descriptors for dynamic values.
///
/// A Type describes the shape of a Value: its kind, its name (for declared
/// types) and its structural children (element, key, fields, length).
///
/// Types are immortal and never move. Type identity is pointer identity:
/// - built-in scalar types are singletons
/// - unnamed composite types are interned by structure, so
///   `slice_of(string_type()) == slice_of(string_type())`
/// - every call that declares a named type creates a new, distinct type
///
/// @code
///   auto* person = types::define_struct("Person", {
///       {"Name", types::string_type()},
///       {"Age", types::int64_type()},
///       {"Hobbies", types::slice_of(types::string_type())},
///   });
///
///   // Self-referential types are declared first, then defined
///   auto* node = types::declare_struct("Node");
///   types::define_fields(node, {
///       {"Value", types::int32_type()},
///       {"Next", types::pointer_to(node)},
///   });
/// @endcode

#pragma once

#include <deepeq/api.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace deepeq {

// ============================================================
// Kind - the shape of a value
// ============================================================

enum class Kind : std::uint8_t {
    Invalid,
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    Uint8,
    Uint16,
    Uint32,
    Uint64,
    Float32,
    Float64,
    String,
    Array,
    Slice,
    Struct,
    Map,
    Pointer,
    Interface,
    Func,
    Chan,
    Opaque,
};

[[nodiscard]] DEEPEQ_API std::string_view kind_name(Kind kind) noexcept;

[[nodiscard]] constexpr bool is_integer_kind(Kind k) noexcept {
    return k >= Kind::Int8 && k <= Kind::Uint64;
}

[[nodiscard]] constexpr bool is_float_kind(Kind k) noexcept {
    return k == Kind::Float32 || k == Kind::Float64;
}

/// Kinds whose values may be nil
[[nodiscard]] constexpr bool is_nilable_kind(Kind k) noexcept {
    return k == Kind::Slice || k == Kind::Map || k == Kind::Pointer ||
           k == Kind::Interface || k == Kind::Func || k == Kind::Chan;
}

class Type;

struct StructField {
    std::string name;
    const Type* type = nullptr;

    /// Fields whose name starts with an uppercase ASCII letter are exported
    [[nodiscard]] bool exported() const noexcept {
        return !name.empty() && name.front() >= 'A' && name.front() <= 'Z';
    }
};

// ============================================================
// Type
// ============================================================

class DEEPEQ_API Type {
public:
    Type(const Type&) = delete;
    Type& operator=(const Type&) = delete;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// Declared name; empty for unnamed types
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool named() const noexcept { return !name_.empty(); }

    /// Element type of arrays, slices, pointers, channels; value type of maps
    [[nodiscard]] const Type* elem() const noexcept { return elem_; }

    /// Key type of maps
    [[nodiscard]] const Type* key() const noexcept { return key_; }

    /// Length of array types
    [[nodiscard]] std::size_t length() const noexcept { return length_; }

    /// Signature text of function types, e.g. "(int32) bool"
    [[nodiscard]] const std::string& signature() const noexcept { return signature_; }

    [[nodiscard]] const std::vector<StructField>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t num_fields() const noexcept { return fields_.size(); }
    [[nodiscard]] const StructField& field(std::size_t i) const { return fields_.at(i); }

    /// Index of the named field, or num_fields() when absent
    [[nodiscard]] std::size_t field_index(std::string_view name) const noexcept;

    /// False for a struct that was declared but not yet defined
    [[nodiscard]] bool complete() const noexcept { return complete_; }

    /// Whether values of this type support primitive == (usable as map keys)
    [[nodiscard]] bool comparable() const noexcept;

    /// Unique, stable id (registration order)
    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

    /// Go-like rendering: "[]string", "map[string]int64", "*Node", "struct { A int32 }"
    [[nodiscard]] std::string to_string() const;

private:
    friend class TypeRegistry;

    Type() = default;

    Kind kind_ = Kind::Invalid;
    std::uint32_t id_ = 0;
    std::string name_;
    const Type* elem_ = nullptr;
    const Type* key_ = nullptr;
    std::size_t length_ = 0;
    std::string signature_;
    std::vector<StructField> fields_;
    bool complete_ = true;
};

// ============================================================
// Type construction
// ============================================================

namespace types {

[[nodiscard]] DEEPEQ_API const Type* bool_type();
[[nodiscard]] DEEPEQ_API const Type* int8_type();
[[nodiscard]] DEEPEQ_API const Type* int16_type();
[[nodiscard]] DEEPEQ_API const Type* int32_type();
[[nodiscard]] DEEPEQ_API const Type* int64_type();
[[nodiscard]] DEEPEQ_API const Type* uint8_type();
[[nodiscard]] DEEPEQ_API const Type* uint16_type();
[[nodiscard]] DEEPEQ_API const Type* uint32_type();
[[nodiscard]] DEEPEQ_API const Type* uint64_type();
[[nodiscard]] DEEPEQ_API const Type* float32_type();
[[nodiscard]] DEEPEQ_API const Type* float64_type();
[[nodiscard]] DEEPEQ_API const Type* string_type();

/// The empty interface; holds a value of any type
[[nodiscard]] DEEPEQ_API const Type* any_type();

/// Built-in type for a scalar kind (Bool .. String)
/// @throws std::invalid_argument for composite kinds
[[nodiscard]] DEEPEQ_API const Type* scalar_type(Kind kind);

[[nodiscard]] DEEPEQ_API const Type* array_of(const Type* elem, std::size_t length);
[[nodiscard]] DEEPEQ_API const Type* slice_of(const Type* elem);
[[nodiscard]] DEEPEQ_API const Type* pointer_to(const Type* elem);
[[nodiscard]] DEEPEQ_API const Type* chan_of(const Type* elem);

/// @throws std::invalid_argument when key is not comparable
[[nodiscard]] DEEPEQ_API const Type* map_of(const Type* key, const Type* value);

/// Function type interned by its signature text, e.g. "(int32) bool"
[[nodiscard]] DEEPEQ_API const Type* func_type(std::string_view signature);

/// Unnamed struct type, interned by its field list
[[nodiscard]] DEEPEQ_API const Type* struct_of(std::initializer_list<StructField> fields);

/// Declare a named struct whose fields are supplied later with define_fields()
[[nodiscard]] DEEPEQ_API Type* declare_struct(std::string name);

/// Complete a declared struct.
/// @throws std::logic_error if already defined or a field name repeats
DEEPEQ_API void define_fields(Type* type, std::initializer_list<StructField> fields);
DEEPEQ_API void define_fields(Type* type, std::vector<StructField> fields);

/// declare_struct() + define_fields() in one step
[[nodiscard]] DEEPEQ_API const Type* define_struct(std::string name, std::initializer_list<StructField> fields);

/// New named type sharing the structure of `underlying`, e.g. `type Celsius float64`
/// @throws std::invalid_argument for incomplete structs and invalid names
[[nodiscard]] DEEPEQ_API const Type* define_named(std::string name, const Type* underlying);

/// Distinct named interface type
[[nodiscard]] DEEPEQ_API const Type* named_interface(std::string name);

/// Named type whose values cannot be inspected by the dynamic layer
[[nodiscard]] DEEPEQ_API const Type* opaque_type(std::string name);

/// Number of types registered so far (for diagnostics and tests)
[[nodiscard]] DEEPEQ_API std::size_t registered_count();

} // namespace types

} // namespace deepeq
