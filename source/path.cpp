// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepeq/path.h>

#include <type_traits>

namespace deepeq {

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& step : path) {
        std::visit([&result](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, FieldStep>) {
                result += '.';
                result += s.name;
            } else if constexpr (std::is_same_v<T, IndexStep>) {
                result += '[';
                result += std::to_string(s.index);
                result += ']';
            } else {
                result += '[';
                result += s.text;
                result += ']';
            }
        }, step);
    }
    return result;
}

std::string describe_step(const PathElement& step)
{
    return std::visit([](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, FieldStep>) {
            return "struct field " + s.name;
        } else if constexpr (std::is_same_v<T, IndexStep>) {
            return "index " + std::to_string(s.index);
        } else {
            return "map key " + s.text;
        }
    }, step);
}

} // namespace deepeq
