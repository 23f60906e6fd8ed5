// builders.cpp - StructBuilder and ArrayBuilder

#include <deepeq/builders.h>

#include <stdexcept>
#include <string>

namespace deepeq {

namespace {

const Type* checked_struct(const Type* type)
{
    if (!type || type->kind() != Kind::Struct || !type->complete()) {
        throw std::invalid_argument("StructBuilder: not a defined struct type: " +
                                    (type ? type->to_string() : std::string{"<null type>"}));
    }
    return type;
}

const Type* checked_array(const Type* type)
{
    if (!type || type->kind() != Kind::Array) {
        throw std::invalid_argument("ArrayBuilder: not an array type: " +
                                    (type ? type->to_string() : std::string{"<null type>"}));
    }
    return type;
}

ValueVector fields_of(const Value& v)
{
    const auto* data = v.get_if<StructData>();
    if (!data) {
        throw std::invalid_argument("StructBuilder: not a struct value: " + value_to_string(v, 1));
    }
    return data->fields;
}

} // anonymous namespace

// ============================================================
// StructBuilder
// ============================================================

StructBuilder::StructBuilder(const Type* type)
    : type_(checked_struct(type))
    , transient_(std::get<StructData>(Value::zero(type_).data()).fields.transient())
{}

StructBuilder::StructBuilder(const Value& existing)
    : type_(existing.type())
    , transient_(fields_of(existing).transient())
{}

StructBuilder& StructBuilder::set(std::string_view name, Value val)
{
    const auto index = type_->field_index(name);
    if (index == type_->num_fields()) {
        throw std::invalid_argument("StructBuilder::set: " + type_->to_string() +
                                    " has no field " + std::string{name});
    }
    return set(index, std::move(val));
}

StructBuilder& StructBuilder::set(std::size_t index, Value val)
{
    if (index >= type_->num_fields()) {
        throw std::out_of_range("StructBuilder::set: field index " + std::to_string(index) +
                                " out of range");
    }
    transient_.set(index, ValueBox{detail::assign_to(type_->field(index).type, std::move(val),
                                                     "StructBuilder::set")});
    return *this;
}

Value StructBuilder::get(std::string_view name) const
{
    const auto index = type_->field_index(name);
    if (index == type_->num_fields()) {
        detail::log_key_error("StructBuilder::get", name, "no such field");
        return Value{};
    }
    return transient_[index].get();
}

Value StructBuilder::finish()
{
    return Value{type_, StructData{transient_.persistent()}};
}

// ============================================================
// ArrayBuilder
// ============================================================

ArrayBuilder::ArrayBuilder(const Type* type)
    : type_(checked_array(type))
    , transient_(std::get<ArrayData>(Value::zero(type_).data()).elements.transient())
{}

ArrayBuilder& ArrayBuilder::set(std::size_t index, Value val)
{
    if (index >= transient_.size()) {
        throw std::out_of_range("ArrayBuilder::set: index " + std::to_string(index) +
                                " out of range for " + type_->to_string());
    }
    transient_.set(index, ValueBox{detail::assign_to(type_->elem(), std::move(val), "ArrayBuilder::set")});
    return *this;
}

ArrayBuilder& ArrayBuilder::fill(const Value& val)
{
    const ValueBox item{detail::assign_to(type_->elem(), val, "ArrayBuilder::fill")};
    for (std::size_t i = 0; i < transient_.size(); ++i) {
        transient_.set(i, item);
    }
    return *this;
}

Value ArrayBuilder::finish()
{
    return Value{type_, ArrayData{transient_.persistent()}};
}

} // namespace deepeq
