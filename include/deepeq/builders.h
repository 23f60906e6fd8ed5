// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Keyed construction of struct and array values.
///
/// Builders start from the zero value of their type and edit the field or
/// element vector through an immer transient, so building is O(n):
/// @code
///   #include <deepeq/builders.h>
///
///   Value a = StructBuilder(person)
///       .set("Name", "A")
///       .set("Age", std::int64_t{22})
///       .set("Hobbies", heap.make_slice(strings, {"Surfing"}))
///       .finish();
///
///   // Copy of `a` with one field changed
///   Value b = StructBuilder(a).set("Age", std::int64_t{23}).finish();
/// @endcode

#pragma once

#include <deepeq/api.h>
#include <deepeq/value.h>

#include <immer/vector_transient.hpp>

#include <cstddef>
#include <string_view>

namespace deepeq {

class DEEPEQ_API StructBuilder {
public:
    /// Start from the zero value of a defined struct type
    /// @throws std::invalid_argument if `type` is not a complete struct type
    explicit StructBuilder(const Type* type);

    /// Start from the fields of an existing struct value
    explicit StructBuilder(const Value& existing);

    StructBuilder(StructBuilder&&) noexcept = default;
    StructBuilder& operator=(StructBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    StructBuilder(const StructBuilder&) = delete;
    StructBuilder& operator=(const StructBuilder&) = delete;

    /// Set a field by name, exported or not
    /// @throws std::invalid_argument for unknown fields or mismatched types
    StructBuilder& set(std::string_view name, Value val);

    /// Set a field by declaration position
    StructBuilder& set(std::size_t index, Value val);

    /// Current value of a field (invalid for unknown names)
    [[nodiscard]] Value get(std::string_view name) const;

    [[nodiscard]] const Type* type() const noexcept { return type_; }

    /// Produce the struct value; the builder can keep being used afterwards
    [[nodiscard]] Value finish();

private:
    const Type* type_;
    ValueVector::transient_type transient_;
};

/// Element-wise construction of fixed-length arrays
class DEEPEQ_API ArrayBuilder {
public:
    /// @throws std::invalid_argument if `type` is not an array type
    explicit ArrayBuilder(const Type* type);

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;
    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    /// @throws std::out_of_range when `index` >= the array length
    ArrayBuilder& set(std::size_t index, Value val);

    /// Set every element to `val`
    ArrayBuilder& fill(const Value& val);

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish();

private:
    const Type* type_;
    ValueVector::transient_type transient_;
};

} // namespace deepeq
