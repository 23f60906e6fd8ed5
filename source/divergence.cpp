// divergence.cpp - Divergence report

#include <deepeq/divergence.h>

#include <ostream>
#include <utility>

namespace deepeq {

std::string_view divergence_kind_name(DivergenceKind kind) noexcept
{
    switch (kind) {
        case DivergenceKind::NilMismatch:          return "NilMismatch";
        case DivergenceKind::TypeMismatch:         return "TypeMismatch";
        case DivergenceKind::LengthMismatch:       return "LengthMismatch";
        case DivergenceKind::ValueMismatch:        return "ValueMismatch";
        case DivergenceKind::MissingKey:           return "MissingKey";
        case DivergenceKind::UncomparableFunction: return "UncomparableFunction";
        case DivergenceKind::CycleUnverified:      return "CycleUnverified";
        case DivergenceKind::DepthExceeded:        return "DepthExceeded";
    }
    return "Unknown";
}

Divergence::Divergence(DivergenceKind kind, std::string detail)
    : kind_(kind), detail_(std::move(detail))
{}

Divergence& Divergence::wrap_field(std::string name)
{
    path_.insert(path_.begin(), FieldStep{std::move(name)});
    return *this;
}

Divergence& Divergence::wrap_index(std::size_t index)
{
    path_.insert(path_.begin(), IndexStep{index});
    return *this;
}

Divergence& Divergence::wrap_key(std::string key_text)
{
    path_.insert(path_.begin(), KeyStep{std::move(key_text)});
    return *this;
}

std::string Divergence::message() const
{
    std::string result;
    for (const auto& step : path_) {
        result += describe_step(step);
        result += ": ";
    }
    result += detail_;
    return result;
}

std::ostream& operator<<(std::ostream& os, const Divergence& d)
{
    return os << d.message();
}

} // namespace deepeq
