// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// deep_equal.cpp - Recursive structural comparison with cycle bookkeeping

#include <deepeq/deep_equal.h>

#include <boost/container_hash/hash.hpp>

#include <cmath>
#include <string>
#include <unordered_map>

namespace deepeq {

namespace {

// ============================================================
// Visited set
// ============================================================

/// Canonicalized pair of identities (smaller first) plus the pair's type
struct VisitKey {
    Identity first;
    Identity second;
    const Type* type = nullptr;

    bool operator==(const VisitKey&) const = default;
};

struct VisitKeyHash {
    std::size_t operator()(const VisitKey& key) const noexcept
    {
        std::size_t seed = 0;
        for (const auto* id : {&key.first, &key.second}) {
            boost::hash_combine(seed, id->cell);
            boost::hash_combine(seed, id->offset);
            boost::hash_combine(seed, id->extent);
        }
        boost::hash_combine(seed, key.type);
        return seed;
    }
};

enum class VisitState : std::uint8_t { InProgress, Done };

/// Kinds whose pairs are recorded in the visited set
constexpr bool is_hard_kind(Kind kind) noexcept
{
    return kind == Kind::Map || kind == Kind::Slice || kind == Kind::Pointer ||
           kind == Kind::Interface;
}

/// Arguments are compared by the concrete value they hold, like
/// operands passed through an empty interface
const Value& concrete(const Value& v)
{
    return v.kind() == Kind::Interface ? v.elem() : v;
}

std::string type_mismatch_detail(const Value& x, const Value& y)
{
    return "types " + x.type()->to_string() + " and " + y.type()->to_string() + " do not match";
}

// ============================================================
// Comparator
// ============================================================

class Comparator {
public:
    explicit Comparator(const CompareOptions& options) : options_(options) {}

    /// nullopt when x and y are deeply equal
    std::optional<Divergence> compare(const Value& x, const Value& y, std::size_t depth);

private:
    std::optional<Divergence> dispatch(const Value& x, const Value& y, std::size_t depth);
    std::optional<Divergence> compare_elements(const Value& x, const Value& y, std::size_t depth);
    std::optional<Divergence> compare_fields(const Value& x, const Value& y, std::size_t depth);
    std::optional<Divergence> compare_slices(const Value& x, const Value& y, std::size_t depth);
    std::optional<Divergence> compare_maps(const Value& x, const Value& y, std::size_t depth);

    const CompareOptions& options_;
    std::unordered_map<VisitKey, VisitState, VisitKeyHash> visited_;
};

std::optional<Divergence> Comparator::compare(const Value& x, const Value& y, std::size_t depth)
{
    if (!x.valid() || !y.valid()) {
        if (x.valid() == y.valid()) return std::nullopt;
        return Divergence{DivergenceKind::NilMismatch, "only one value is valid"};
    }
    if (x.type() != y.type()) {
        return Divergence{DivergenceKind::TypeMismatch, type_mismatch_detail(x, y)};
    }
    if (options_.max_depth != 0 && depth > options_.max_depth) {
        return Divergence{DivergenceKind::DepthExceeded,
                          "maximum depth " + std::to_string(options_.max_depth) + " exceeded"};
    }

    if (is_hard_kind(x.kind())) {
        const auto ix = x.identity();
        const auto iy = y.identity();
        if (ix && iy) {
            const VisitKey key = *iy < *ix ? VisitKey{*iy, *ix, x.type()} : VisitKey{*ix, *iy, x.type()};
            const auto [it, inserted] = visited_.try_emplace(key, VisitState::InProgress);
            if (!inserted) {
                if (options_.cycles == CyclePolicy::Report && it->second == VisitState::InProgress) {
                    return Divergence{DivergenceKind::CycleUnverified, "cycle detected, cannot verify"};
                }
                return std::nullopt;
            }
            auto result = dispatch(x, y, depth);
            visited_[key] = VisitState::Done;
            return result;
        }
    }
    return dispatch(x, y, depth);
}

std::optional<Divergence> Comparator::dispatch(const Value& x, const Value& y, std::size_t depth)
{
    switch (x.kind()) {
        case Kind::Float32:
        case Kind::Float64:
            if (std::isnan(x.as_double()) && std::isnan(y.as_double())) {
                return std::nullopt;
            }
            break;

        case Kind::Array:
            return compare_elements(x, y, depth);

        case Kind::Slice:
            return compare_slices(x, y, depth);

        case Kind::Interface:
            if (x.is_nil() || y.is_nil()) {
                if (x.is_nil() == y.is_nil()) return std::nullopt;
                return Divergence{DivergenceKind::NilMismatch, "only one interface is nil (" +
                                                                   value_to_string(x) + " vs " +
                                                                   value_to_string(y) + ")"};
            }
            return compare(x.elem(), y.elem(), depth + 1);

        case Kind::Pointer:
            // Same target (or both nil): equal without looking at the pointee
            if (x.identity() == y.identity()) {
                return std::nullopt;
            }
            if (x.is_nil() != y.is_nil()) {
                return Divergence{DivergenceKind::NilMismatch, "only one pointer is nil"};
            }
            return compare(x.elem(), y.elem(), depth + 1);

        case Kind::Struct:
            return compare_fields(x, y, depth);

        case Kind::Map:
            return compare_maps(x, y, depth);

        case Kind::Func:
            if (x.is_nil() && y.is_nil()) {
                return std::nullopt;
            }
            return Divergence{DivergenceKind::UncomparableFunction,
                              "non-nil func values are not comparable"};

        default:
            break;
    }

    // Types are equal here, so either both sides are opaque or neither is
    if (!x.inspectable()) {
        return std::nullopt;
    }
    if (primitive_equal(x, y)) {
        return std::nullopt;
    }
    return Divergence{DivergenceKind::ValueMismatch,
                      "values differ (" + value_to_string(x) + " vs " + value_to_string(y) + ")"};
}

std::optional<Divergence> Comparator::compare_elements(const Value& x, const Value& y, std::size_t depth)
{
    for (std::size_t i = 0; i < x.len(); ++i) {
        if (auto d = compare(x.index(i), y.index(i), depth + 1)) {
            d->wrap_index(i);
            return d;
        }
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::compare_fields(const Value& x, const Value& y, std::size_t depth)
{
    const Type* type = x.type();
    for (std::size_t i = 0; i < type->num_fields(); ++i) {
        if (auto d = compare(x.field(i), y.field(i), depth + 1)) {
            d->wrap_field(type->field(i).name);
            return d;
        }
    }
    return std::nullopt;
}

std::optional<Divergence> Comparator::compare_slices(const Value& x, const Value& y, std::size_t depth)
{
    if (x.is_nil() != y.is_nil()) {
        return Divergence{DivergenceKind::NilMismatch, "only one slice is nil (" + value_to_string(x) +
                                                           " vs " + value_to_string(y) + ")"};
    }
    if (x.len() != y.len()) {
        return Divergence{DivergenceKind::LengthMismatch,
                          "slice lengths differ (" + value_to_string(x) + " (len " +
                              std::to_string(x.len()) + ") vs " + value_to_string(y) + " (len " +
                              std::to_string(y.len()) + "))"};
    }
    // Same backing range (or both nil)
    if (x.identity() == y.identity()) {
        return std::nullopt;
    }
    return compare_elements(x, y, depth);
}

std::optional<Divergence> Comparator::compare_maps(const Value& x, const Value& y, std::size_t depth)
{
    if (x.is_nil() != y.is_nil()) {
        return Divergence{DivergenceKind::NilMismatch, "only one map is nil (" + value_to_string(x) +
                                                           " vs " + value_to_string(y) + ")"};
    }
    if (x.len() != y.len()) {
        return Divergence{DivergenceKind::LengthMismatch, "map lengths differ (len " +
                                                              std::to_string(x.len()) + " vs len " +
                                                              std::to_string(y.len()) + ")"};
    }
    if (x.identity() == y.identity()) {
        return std::nullopt;
    }

    const auto* entries = x.map_entries();
    if (!entries) {
        return std::nullopt;
    }
    for (const auto& [key, box] : *entries) {
        const Value* other = y.map_find(key);
        if (!other) {
            Divergence d{DivergenceKind::MissingKey, "key missing from second map"};
            d.wrap_key(value_to_string(key, 1));
            return d;
        }
        if (auto d = compare(box.get(), *other, depth + 1)) {
            d->wrap_key(value_to_string(key, 1));
            return d;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

DeepEqualResult deep_equal(const Value& x_arg, const Value& y_arg, const CompareOptions& options)
{
    const Value& x = concrete(x_arg);
    const Value& y = concrete(y_arg);
    std::optional<Divergence> divergence;

    if (!x.valid() || !y.valid()) {
        if (x.valid() != y.valid()) {
            divergence.emplace(DivergenceKind::NilMismatch, "only one value is nil");
        }
    } else if (x.type() != y.type()) {
        // Values of different types are never looked into
        divergence.emplace(DivergenceKind::TypeMismatch, type_mismatch_detail(x, y));
    } else {
        Comparator comparator{options};
        divergence = comparator.compare(x, y, 0);
    }

    DeepEqualResult result;
    if (divergence) {
        if (options.log_divergence) {
            detail::log_divergence("deep_equal", divergence->message());
        }
        result.equal = false;
        result.divergence = std::move(divergence);
    }
    return result;
}

} // namespace deepeq
