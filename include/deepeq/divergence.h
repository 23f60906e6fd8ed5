// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file divergence.h
/// @brief Explanation of the first point where two values stop being deeply equal.
///
/// A Divergence is created at the node where a comparison rule fails and
/// gains one path step per level while the comparison unwinds, so the
/// caller sees where the mismatch is and why:
/// @code
///   auto result = deep_equal(a, b);
///   if (!result) {
///       std::cout << *result.divergence << "\n";
///       // struct field Hobbies: slice lengths differ (["Surfing"] (len 1) vs [] (len 0))
///   }
/// @endcode
///
/// Divergences are ordinary results, never thrown.

#pragma once

#include <deepeq/api.h>
#include <deepeq/path.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace deepeq {

enum class DivergenceKind : std::uint8_t {
    NilMismatch,          // exactly one side is nil
    TypeMismatch,         // concrete types differ
    LengthMismatch,       // slices or maps of different length
    ValueMismatch,        // primitive == failed
    MissingKey,           // key of the first map absent from the second
    UncomparableFunction, // a non-nil func was reached
    CycleUnverified,      // revisited an in-progress pair under CyclePolicy::Report
    DepthExceeded         // CompareOptions::max_depth reached
};

[[nodiscard]] DEEPEQ_API std::string_view divergence_kind_name(DivergenceKind kind) noexcept;

class DEEPEQ_API Divergence {
public:
    Divergence(DivergenceKind kind, std::string detail);

    [[nodiscard]] DivergenceKind kind() const noexcept { return kind_; }

    /// Reason at the leaf, without path context
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    /// Steps from the root to the diverging node, outermost first
    [[nodiscard]] const Path& path() const noexcept { return path_; }

    // Prepend context while propagating outwards
    Divergence& wrap_field(std::string name);
    Divergence& wrap_index(std::size_t index);
    Divergence& wrap_key(std::string key_text);

    /// Path context followed by the detail:
    /// "struct field Pets: index 1: values differ (2 vs 3)"
    [[nodiscard]] std::string message() const;

private:
    DivergenceKind kind_;
    std::string detail_;
    Path path_;
};

DEEPEQ_API std::ostream& operator<<(std::ostream& os, const Divergence& d);

} // namespace deepeq
