// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deep_equal.h
/// @brief Structural equality over dynamic values, with a divergence report.
///
/// deep_equal() walks two value graphs in lockstep and stops at the first
/// node where they differ. Rules by kind:
///
/// - floats: NaN equals NaN, otherwise ==
/// - arrays: element by element in index order
/// - slices: nil-ness, then length, then the same backing range is equal
///   without looking at the elements, otherwise element by element
/// - interfaces: both nil are equal, one nil is not, otherwise the held values
/// - pointers: the same target is equal without dereferencing, otherwise
///   the pointees
/// - structs: every field, unexported ones included, in declaration order
/// - maps: nil-ness, length, the same map is equal, otherwise every key of
///   the first map is looked up in the second with the key's ==
/// - funcs: equal only when both are nil
/// - everything else: opaque values are equal only to opaque values,
///   others use primitive ==
///
/// Pairs of slices, maps and pointers are recorded in a visited set that
/// lives for one call. Reaching a recorded pair again means the graphs
/// are cyclic; by default such a pair is assumed equal, which guarantees
/// termination.
///
/// @code
///   if (auto r = deep_equal(got, want); !r) {
///       std::cerr << r.divergence->message() << "\n";
///   }
/// @endcode

#pragma once

#include <deepeq/api.h>
#include <deepeq/divergence.h>
#include <deepeq/value.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace deepeq {

enum class CyclePolicy : std::uint8_t {
    /// A revisited pair is equal
    AssumeEqual,
    /// A pair revisited while its own comparison is still running yields
    /// DivergenceKind::CycleUnverified; a finished pair is still equal
    Report
};

struct CompareOptions {
    CyclePolicy cycles = CyclePolicy::AssumeEqual;

    /// Maximum recursion depth below the roots; 0 means unbounded
    std::size_t max_depth = 0;

    /// Log the divergence through detail::log_divergence. Has no effect
    /// when DEEPEQ_VERBOSE_LOG is 0, the default under NDEBUG.
    bool log_divergence = false;
};

struct DeepEqualResult {
    bool equal = true;

    /// Set exactly when `equal` is false
    std::optional<Divergence> divergence;

    explicit operator bool() const noexcept { return equal; }
};

/// Compare two values structurally.
///
/// An argument of interface kind is replaced by the value it holds, so a
/// nil interface counts as nil and a boxed int32 equals a plain int32.
/// Invalid values stand for nil: two invalid values are equal, an invalid
/// and a valid one are not. Values of different types are never equal and
/// are not looked into.
///
/// Safe to call concurrently on values nobody is mutating.
[[nodiscard]] DEEPEQ_API DeepEqualResult deep_equal(const Value& x, const Value& y,
                                                    const CompareOptions& options = {});

} // namespace deepeq
