// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in deepeq.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>

namespace deepeq {

// ============================================================
// Scalar storage concepts
// ============================================================

/// Fixed-width integer types a Value can hold directly
template<typename T>
concept IntegerStorage = std::is_same_v<std::decay_t<T>, std::int8_t> ||
                         std::is_same_v<std::decay_t<T>, std::int16_t> ||
                         std::is_same_v<std::decay_t<T>, std::int32_t> ||
                         std::is_same_v<std::decay_t<T>, std::int64_t> ||
                         std::is_same_v<std::decay_t<T>, std::uint8_t> ||
                         std::is_same_v<std::decay_t<T>, std::uint16_t> ||
                         std::is_same_v<std::decay_t<T>, std::uint32_t> ||
                         std::is_same_v<std::decay_t<T>, std::uint64_t>;

template<typename T>
concept FloatStorage = std::is_same_v<std::decay_t<T>, float> ||
                       std::is_same_v<std::decay_t<T>, double>;

/// Types stored inline for scalar kinds (Bool .. String)
template<typename T>
concept ScalarStorage = IntegerStorage<T> ||
                        FloatStorage<T> ||
                        std::is_same_v<std::decay_t<T>, bool> ||
                        std::is_same_v<std::decay_t<T>, std::string>;

/// Callable usable as a visitor over map entries: fn(const Value& key, const Value& value)
template<typename Fn, typename V>
concept EntryVisitor = std::invocable<Fn, const V&, const V&>;

} // namespace deepeq
