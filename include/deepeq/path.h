// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Location of a node inside a compared value graph.
///
/// A Path lists the steps from the root of a comparison down to the node
/// where two values diverge, outermost step first:
///
/// | Step      | Rendered as | Reached through            |
/// |-----------|-------------|----------------------------|
/// | FieldStep | `.Name`     | struct field               |
/// | IndexStep | `[3]`       | array or slice element     |
/// | KeyStep   | `["k"]`     | map entry (key as printed) |

#pragma once

#include <deepeq/api.h>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace deepeq {

struct FieldStep {
    std::string name;
    bool operator==(const FieldStep&) const = default;
};

struct IndexStep {
    std::size_t index = 0;
    bool operator==(const IndexStep&) const = default;
};

/// Map entry; `text` is the key rendered by value_to_string()
struct KeyStep {
    std::string text;
    bool operator==(const KeyStep&) const = default;
};

using PathElement = std::variant<FieldStep, IndexStep, KeyStep>;

/// Steps from the root, outermost first
using Path = std::vector<PathElement>;

/// Render as `.Hobbies[0]["key"]`; the empty path renders as ""
[[nodiscard]] DEEPEQ_API std::string path_to_string(const Path& path);

/// Describe a single step as it reads in a divergence message:
/// `struct field Name`, `index 2`, `map key "k"`
[[nodiscard]] DEEPEQ_API std::string describe_step(const PathElement& step);

} // namespace deepeq
