// value.cpp - Value construction, introspection, primitive equality and formatting

#include <deepeq/value.h>
#include <deepeq/heap.h>

#include <immer/vector_transient.hpp>

#include <boost/container_hash/hash.hpp>

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <set>

namespace deepeq {

namespace {

const Value& invalid_value()
{
    static const Value v;
    return v;
}

std::invalid_argument bad_type(std::string_view func, std::string_view what, const Type* type)
{
    return std::invalid_argument(std::string{func} + ": " + std::string{what} + " " +
                                 (type ? type->to_string() : std::string{"<null type>"}));
}

void require_kind(const Type* type, Kind kind, std::string_view func)
{
    if (!type) throw bad_type(func, "null type, expected", nullptr);
    if (type->kind() != kind) {
        throw bad_type(func, "expected " + std::string{kind_name(kind)} + " type, got", type);
    }
}

bool same_structure(const Type* a, const Type* b)
{
    if (a == b) return true;
    if (a->kind() != b->kind() || a->elem() != b->elem() || a->key() != b->key() ||
        a->length() != b->length() || a->signature() != b->signature() ||
        a->num_fields() != b->num_fields()) {
        return false;
    }
    for (std::size_t i = 0; i < a->num_fields(); ++i) {
        if (a->field(i).name != b->field(i).name || a->field(i).type != b->field(i).type) {
            return false;
        }
    }
    return true;
}

template <typename T>
const T& payload(const Value& v)
{
    return std::get<T>(v.data());
}

const ArrayCell& backing_of(const SliceData& s)
{
    return std::get<ArrayCell>(s.backing.heap->cell(s.backing.index));
}

} // anonymous namespace

// ============================================================
// HeapRef
// ============================================================

std::uint64_t HeapRef::token() const noexcept
{
    if (!heap) return 0;
    return (static_cast<std::uint64_t>(heap->id()) << 32) | index;
}

// ============================================================
// Scalar constructors
// ============================================================

Value::Value(bool v) : type_(types::bool_type()), data_(v) {}
Value::Value(std::int8_t v) : type_(types::int8_type()), data_(v) {}
Value::Value(std::int16_t v) : type_(types::int16_type()), data_(v) {}
Value::Value(std::int32_t v) : type_(types::int32_type()), data_(v) {}
Value::Value(std::int64_t v) : type_(types::int64_type()), data_(v) {}
Value::Value(std::uint8_t v) : type_(types::uint8_type()), data_(v) {}
Value::Value(std::uint16_t v) : type_(types::uint16_type()), data_(v) {}
Value::Value(std::uint32_t v) : type_(types::uint32_type()), data_(v) {}
Value::Value(std::uint64_t v) : type_(types::uint64_type()), data_(v) {}
Value::Value(float v) : type_(types::float32_type()), data_(v) {}
Value::Value(double v) : type_(types::float64_type()), data_(v) {}
Value::Value(const std::string& v) : type_(types::string_type()), data_(v) {}
Value::Value(std::string&& v) : type_(types::string_type()), data_(std::move(v)) {}
Value::Value(const char* v)
    : type_(types::string_type()), data_(std::in_place_type<std::string>, v) {}

// ============================================================
// Factories
// ============================================================

Value Value::of(const Type* type, Value underlying)
{
    if (!type) throw bad_type("Value::of", "null type", nullptr);
    if (!underlying.valid() || !same_structure(type, underlying.type())) {
        throw std::invalid_argument(
            "Value::of: cannot convert " +
            (underlying.valid() ? underlying.type()->to_string() : std::string{"nil"}) +
            " to " + type->to_string());
    }
    return Value{type, std::move(underlying.data_)};
}

Value Value::zero(const Type* type)
{
    if (!type) throw bad_type("Value::zero", "null type", nullptr);

    switch (type->kind()) {
        case Kind::Bool:    return Value{type, false};
        case Kind::Int8:    return Value{type, std::int8_t{0}};
        case Kind::Int16:   return Value{type, std::int16_t{0}};
        case Kind::Int32:   return Value{type, std::int32_t{0}};
        case Kind::Int64:   return Value{type, std::int64_t{0}};
        case Kind::Uint8:   return Value{type, std::uint8_t{0}};
        case Kind::Uint16:  return Value{type, std::uint16_t{0}};
        case Kind::Uint32:  return Value{type, std::uint32_t{0}};
        case Kind::Uint64:  return Value{type, std::uint64_t{0}};
        case Kind::Float32: return Value{type, 0.0f};
        case Kind::Float64: return Value{type, 0.0};
        case Kind::String:  return Value{type, std::string{}};
        case Kind::Array: {
            const ValueBox element{zero(type->elem())};
            auto t = ValueVector{}.transient();
            for (std::size_t i = 0; i < type->length(); ++i) {
                t.push_back(element);
            }
            return Value{type, ArrayData{t.persistent()}};
        }
        case Kind::Struct: {
            if (!type->complete()) {
                throw bad_type("Value::zero", "struct is declared but not defined:", type);
            }
            auto t = ValueVector{}.transient();
            for (const auto& f : type->fields()) {
                t.push_back(ValueBox{zero(f.type)});
            }
            return Value{type, StructData{t.persistent()}};
        }
        case Kind::Slice:     return Value{type, SliceData{}};
        case Kind::Map:       return Value{type, MapData{}};
        case Kind::Pointer:   return Value{type, PointerData{}};
        case Kind::Interface: return Value{type, InterfaceData{}};
        case Kind::Func:      return Value{type, FuncData{}};
        case Kind::Chan:      return Value{type, ChanData{}};
        case Kind::Opaque:    return Value{type, OpaqueData{}};
        case Kind::Invalid:   break;
    }
    throw bad_type("Value::zero", "invalid type", type);
}

Value Value::nil(const Type* type)
{
    if (!type || !is_nilable_kind(type->kind())) {
        throw bad_type("Value::nil", "type has no nil value:", type);
    }
    return zero(type);
}

Value Value::array(const Type* type, std::initializer_list<Value> elements)
{
    return array(type, std::vector<Value>{elements});
}

Value Value::array(const Type* type, const std::vector<Value>& elements)
{
    require_kind(type, Kind::Array, "Value::array");
    if (elements.size() != type->length()) {
        throw std::invalid_argument("Value::array: " + std::to_string(elements.size()) +
                                    " elements for " + type->to_string());
    }
    auto t = ValueVector{}.transient();
    for (const auto& e : elements) {
        t.push_back(ValueBox{detail::assign_to(type->elem(), e, "Value::array")});
    }
    return Value{type, ArrayData{t.persistent()}};
}

Value Value::structure(const Type* type, std::initializer_list<Value> fields)
{
    return structure(type, std::vector<Value>{fields});
}

Value Value::structure(const Type* type, const std::vector<Value>& fields)
{
    require_kind(type, Kind::Struct, "Value::structure");
    if (!type->complete()) {
        throw bad_type("Value::structure", "struct is declared but not defined:", type);
    }
    if (fields.size() > type->num_fields()) {
        throw std::invalid_argument("Value::structure: too many values for " + type->to_string());
    }
    auto t = ValueVector{}.transient();
    for (std::size_t i = 0; i < type->num_fields(); ++i) {
        const Type* ft = type->field(i).type;
        t.push_back(ValueBox{i < fields.size() ? detail::assign_to(ft, fields[i], "Value::structure")
                                                : zero(ft)});
    }
    return Value{type, StructData{t.persistent()}};
}

Value Value::box(const Type* iface, Value held)
{
    require_kind(iface, Kind::Interface, "Value::box");
    if (held.kind() == Kind::Interface) {
        Value inner = held.elem();
        held = std::move(inner);
    }
    if (!held.valid()) {
        return Value{iface, InterfaceData{}};
    }
    return Value{iface, InterfaceData{ValueBox{std::move(held)}}};
}

Value Value::any(Value held)
{
    return box(types::any_type(), std::move(held));
}

Value Value::function(const Type* type, Callable fn)
{
    require_kind(type, Kind::Func, "Value::function");
    if (!fn) return Value{type, FuncData{}};
    return Value{type, FuncData{std::make_shared<const Callable>(std::move(fn))}};
}

Value Value::opaque(const Type* type, std::shared_ptr<const void> payload)
{
    require_kind(type, Kind::Opaque, "Value::opaque");
    return Value{type, OpaqueData{std::move(payload)}};
}

// ============================================================
// Introspection
// ============================================================

bool Value::is_nil() const noexcept
{
    switch (kind()) {
        case Kind::Slice:     return !std::get<SliceData>(data_).backing;
        case Kind::Map:       return !std::get<MapData>(data_).cell;
        case Kind::Pointer:   return !std::get<PointerData>(data_).target;
        case Kind::Chan:      return !std::get<ChanData>(data_).cell;
        case Kind::Interface: return !std::get<InterfaceData>(data_).held.has_value();
        case Kind::Func:      return !std::get<FuncData>(data_).fn;
        default:              return false;
    }
}

std::size_t Value::len() const
{
    switch (kind()) {
        case Kind::String: return payload<std::string>(*this).size();
        case Kind::Array:  return payload<ArrayData>(*this).elements.size();
        case Kind::Slice:  return payload<SliceData>(*this).length;
        case Kind::Map: {
            const auto* entries = map_entries();
            return entries ? entries->size() : 0;
        }
        default:
            return 0;
    }
}

std::size_t Value::cap() const
{
    switch (kind()) {
        case Kind::Slice:
            return payload<SliceData>(*this).capacity;
        case Kind::Chan: {
            const auto& ref = payload<ChanData>(*this).cell;
            return ref ? std::get<ChanCell>(ref.heap->cell(ref.index)).capacity : 0;
        }
        default:
            return len();
    }
}

const Value& Value::index(std::size_t i) const
{
    if (const auto* a = get_if<ArrayData>()) {
        if (i < a->elements.size()) return a->elements[i].get();
        detail::log_index_error("Value::index", i, "out of range");
        return invalid_value();
    }
    if (const auto* s = get_if<SliceData>()) {
        if (i < s->length) return backing_of(*s).elements[s->offset + i].get();
        detail::log_index_error("Value::index", i, "out of range");
        return invalid_value();
    }
    detail::log_index_error("Value::index", i, "on a value that is not an array or slice");
    return invalid_value();
}

const Value& Value::field(std::size_t i) const
{
    if (const auto* s = get_if<StructData>()) {
        if (i < s->fields.size()) return s->fields[i].get();
        detail::log_index_error("Value::field", i, "out of range");
        return invalid_value();
    }
    detail::log_index_error("Value::field", i, "on a value that is not a struct");
    return invalid_value();
}

const Value& Value::field(std::string_view name) const
{
    if (kind() != Kind::Struct) {
        detail::log_key_error("Value::field", name, "on a value that is not a struct");
        return invalid_value();
    }
    const auto i = type_->field_index(name);
    if (i == type_->num_fields()) {
        detail::log_key_error("Value::field", name, "no such field in " + type_->to_string());
        return invalid_value();
    }
    return field(i);
}

const Value& Value::elem() const
{
    if (const auto* p = get_if<PointerData>()) {
        if (!p->target) return invalid_value();
        return std::get<PointeeCell>(p->target.heap->cell(p->target.index)).value;
    }
    if (const auto* i = get_if<InterfaceData>()) {
        return i->held ? i->held->get() : invalid_value();
    }
    detail::log_access_error("Value::elem", "not a pointer or interface: " +
                                                (valid() ? type_->to_string() : std::string{"invalid"}));
    return invalid_value();
}

const ValueMap* Value::map_entries() const
{
    const auto* m = get_if<MapData>();
    if (!m || !m->cell) return nullptr;
    return &std::get<MapCell>(m->cell.heap->cell(m->cell.index)).entries;
}

const Value* Value::map_find(const Value& key) const
{
    const auto* entries = map_entries();
    if (!entries) return nullptr;

    const Type* key_type = type_->key();
    if (key.type() != key_type) {
        if (key_type->kind() == Kind::Interface && key.kind() != Kind::Interface) {
            return map_find(Value::box(key_type, key));
        }
        detail::log_access_error("Value::map_find", "key of type " +
                                     (key.valid() ? key.type()->to_string() : std::string{"nil"}) +
                                     " for " + type_->to_string());
        return nullptr;
    }
    if (!is_hashable(key)) {
        detail::log_access_error("Value::map_find", "unhashable key " + value_to_string(key));
        return nullptr;
    }
    const auto* found = entries->find(key);
    return found ? &found->get() : nullptr;
}

std::vector<Value> Value::map_keys() const
{
    std::vector<Value> keys;
    if (const auto* entries = map_entries()) {
        keys.reserve(entries->size());
        for (const auto& [key, box] : *entries) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::optional<Identity> Value::identity() const noexcept
{
    switch (kind()) {
        case Kind::Pointer: {
            const auto& p = std::get<PointerData>(data_);
            if (p.target) return Identity{p.target.token(), 0, 0};
            break;
        }
        case Kind::Slice: {
            const auto& s = std::get<SliceData>(data_);
            if (s.backing) return Identity{s.backing.token(), s.offset, s.length};
            break;
        }
        case Kind::Map: {
            const auto& m = std::get<MapData>(data_);
            if (m.cell) return Identity{m.cell.token(), 0, 0};
            break;
        }
        case Kind::Chan: {
            const auto& c = std::get<ChanData>(data_);
            if (c.cell) return Identity{c.cell.token(), 0, 0};
            break;
        }
        default:
            break;
    }
    return std::nullopt;
}

Value Value::call(std::span<const Value> args) const
{
    const auto* f = get_if<FuncData>();
    if (!f) throw std::logic_error("Value::call: not a func");
    if (!f->fn) throw std::logic_error("Value::call: nil func");
    return (*f->fn)(args);
}

// ============================================================
// Payload access
// ============================================================

std::int64_t Value::as_int64(std::int64_t default_val) const noexcept
{
    if (auto* p = get_if<std::int8_t>()) return *p;
    if (auto* p = get_if<std::int16_t>()) return *p;
    if (auto* p = get_if<std::int32_t>()) return *p;
    if (auto* p = get_if<std::int64_t>()) return *p;
    return default_val;
}

std::uint64_t Value::as_uint64(std::uint64_t default_val) const noexcept
{
    if (auto* p = get_if<std::uint8_t>()) return *p;
    if (auto* p = get_if<std::uint16_t>()) return *p;
    if (auto* p = get_if<std::uint32_t>()) return *p;
    if (auto* p = get_if<std::uint64_t>()) return *p;
    return default_val;
}

double Value::as_double(double default_val) const noexcept
{
    if (auto* p = get_if<double>()) return *p;
    if (auto* p = get_if<float>()) return static_cast<double>(*p);
    return default_val;
}

bool Value::as_bool(bool default_val) const noexcept
{
    if (auto* p = get_if<bool>()) return *p;
    return default_val;
}

std::string Value::as_string(std::string default_val) const
{
    if (auto* p = get_if<std::string>()) return *p;
    return default_val;
}

// ============================================================
// Primitive equality and hashing
// ============================================================

bool primitive_equal(const Value& x, const Value& y)
{
    if (!x.valid() || !y.valid()) return x.valid() == y.valid();
    if (x.type() != y.type()) return false;

    switch (x.kind()) {
        case Kind::Array:
        case Kind::Struct: {
            const auto& a = x.is<ArrayData>() ? payload<ArrayData>(x).elements : payload<StructData>(x).fields;
            const auto& b = y.is<ArrayData>() ? payload<ArrayData>(y).elements : payload<StructData>(y).fields;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!primitive_equal(a[i].get(), b[i].get())) return false;
            }
            return true;
        }
        case Kind::Pointer:
            return payload<PointerData>(x).target == payload<PointerData>(y).target;
        case Kind::Chan:
            return payload<ChanData>(x).cell == payload<ChanData>(y).cell;
        case Kind::Interface:
            if (x.is_nil() || y.is_nil()) return x.is_nil() == y.is_nil();
            return primitive_equal(x.elem(), y.elem());
        case Kind::Opaque:
            return payload<OpaqueData>(x).payload.get() == payload<OpaqueData>(y).payload.get();
        case Kind::Slice:
        case Kind::Map:
        case Kind::Func:
            throw bad_type("primitive_equal", "comparing uncomparable type", x.type());
        default:
            return std::visit([&](const auto& a) -> bool {
                using T = std::decay_t<decltype(a)>;
                if constexpr (ScalarStorage<T>) {
                    return a == std::get<T>(y.data());
                } else {
                    return false;
                }
            }, x.data());
    }
}

std::size_t primitive_hash(const Value& v)
{
    std::size_t seed = 0;
    if (!v.valid()) return seed;
    boost::hash_combine(seed, v.type()->id());

    switch (v.kind()) {
        case Kind::Array:
        case Kind::Struct: {
            const auto& items = v.is<ArrayData>() ? payload<ArrayData>(v).elements : payload<StructData>(v).fields;
            for (const auto& item : items) {
                boost::hash_combine(seed, primitive_hash(item.get()));
            }
            return seed;
        }
        case Kind::Pointer:
            boost::hash_combine(seed, payload<PointerData>(v).target.token());
            return seed;
        case Kind::Chan:
            boost::hash_combine(seed, payload<ChanData>(v).cell.token());
            return seed;
        case Kind::Interface:
            boost::hash_combine(seed, v.is_nil() ? std::size_t{0} : primitive_hash(v.elem()));
            return seed;
        case Kind::Opaque:
            boost::hash_combine(seed, payload<OpaqueData>(v).payload.get());
            return seed;
        case Kind::Slice:
        case Kind::Map:
        case Kind::Func:
            throw bad_type("primitive_hash", "hash of unhashable type", v.type());
        default:
            std::visit([&](const auto& a) {
                using T = std::decay_t<decltype(a)>;
                if constexpr (FloatStorage<T>) {
                    // +0 and -0 compare equal
                    boost::hash_combine(seed, a == T{0} ? T{0} : a);
                } else if constexpr (ScalarStorage<T>) {
                    boost::hash_combine(seed, a);
                }
            }, v.data());
            return seed;
    }
}

bool is_hashable(const Value& v) noexcept
{
    switch (v.kind()) {
        case Kind::Slice:
        case Kind::Map:
        case Kind::Func:
            return false;
        case Kind::Array:
        case Kind::Struct: {
            const auto& items = v.is<ArrayData>() ? std::get<ArrayData>(v.data()).elements
                                                  : std::get<StructData>(v.data()).fields;
            for (const auto& item : items) {
                if (!is_hashable(item.get())) return false;
            }
            return true;
        }
        case Kind::Interface:
            return v.is_nil() || is_hashable(v.elem());
        default:
            return true;
    }
}

std::size_t KeyHash::operator()(const Value& v) const
{
    return primitive_hash(v);
}

bool KeyEqual::operator()(const Value& a, const Value& b) const
{
    return primitive_equal(a, b);
}

// ============================================================
// Formatting
// ============================================================

namespace {

void format_float(std::ostringstream& oss, double d)
{
    if (std::isnan(d)) {
        oss << "NaN";
    } else if (std::isinf(d)) {
        oss << (d > 0 ? "+Inf" : "-Inf");
    } else {
        oss << d;
    }
}

void format_value(std::ostringstream& oss, const Value& val, std::size_t depth)
{
    if (!val.valid()) {
        oss << "<nil>";
        return;
    }

    auto format_items = [&](const ValueVector& items, std::size_t offset, std::size_t count) {
        oss << "[";
        if (depth == 0 && count > 0) {
            oss << "...";
        } else {
            for (std::size_t i = 0; i < count; ++i) {
                if (i > 0) oss << ", ";
                format_value(oss, items[offset + i].get(), depth - 1);
            }
        }
        oss << "]";
    };

    switch (val.kind()) {
        case Kind::Bool:
            oss << (val.as_bool() ? "true" : "false");
            return;
        case Kind::Int8:
        case Kind::Int16:
        case Kind::Int32:
        case Kind::Int64:
            oss << val.as_int64();
            return;
        case Kind::Uint8:
        case Kind::Uint16:
        case Kind::Uint32:
        case Kind::Uint64:
            oss << val.as_uint64();
            return;
        case Kind::Float32:
        case Kind::Float64:
            format_float(oss, val.as_double());
            return;
        case Kind::String:
            oss << "\"" << payload<std::string>(val) << "\"";
            return;
        case Kind::Array: {
            const auto& items = payload<ArrayData>(val).elements;
            format_items(items, 0, items.size());
            return;
        }
        case Kind::Slice: {
            const auto& s = payload<SliceData>(val);
            if (!s.backing) {
                oss << "nil";
                return;
            }
            format_items(backing_of(s).elements, s.offset, s.length);
            return;
        }
        case Kind::Struct: {
            const auto& fields = payload<StructData>(val).fields;
            if (val.type()->named()) oss << val.type()->name();
            oss << "{";
            if (depth == 0 && !fields.empty()) {
                oss << "...";
            } else {
                for (std::size_t i = 0; i < fields.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << val.type()->field(i).name << ":";
                    format_value(oss, fields[i].get(), depth - 1);
                }
            }
            oss << "}";
            return;
        }
        case Kind::Map: {
            const auto* entries = val.map_entries();
            if (!entries) {
                oss << "nil";
                return;
            }
            oss << "map[";
            if (depth == 0 && !entries->empty()) {
                oss << "...";
            } else {
                bool first = true;
                for (const auto& [key, box] : *entries) {
                    if (!first) oss << ", ";
                    first = false;
                    format_value(oss, key, depth - 1);
                    oss << ":";
                    format_value(oss, box.get(), depth - 1);
                }
            }
            oss << "]";
            return;
        }
        case Kind::Pointer:
            if (val.is_nil()) {
                oss << "nil";
            } else if (depth == 0) {
                oss << "&...";
            } else {
                oss << "&";
                format_value(oss, val.elem(), depth - 1);
            }
            return;
        case Kind::Interface:
            format_value(oss, val.elem(), depth);
            return;
        case Kind::Func:
            if (val.is_nil()) {
                oss << "nil";
            } else {
                oss << "(" << val.type()->to_string() << ")";
            }
            return;
        case Kind::Chan:
            if (val.is_nil()) {
                oss << "nil";
            } else {
                oss << "(" << val.type()->to_string() << ")@" << payload<ChanData>(val).cell.token();
            }
            return;
        case Kind::Opaque:
            oss << "<opaque " << val.type()->to_string() << ">";
            return;
        case Kind::Invalid:
            oss << "<nil>";
            return;
    }
}

void print_tree(const Value& val, const std::string& prefix, std::size_t depth,
                std::set<Identity>& on_path);

/// Non-nil array, slice, map or pointer; a slice window, map or pointee
/// already open further up prints as <cycle>
void print_container(const Value& val, const std::string& prefix, std::size_t depth,
                     std::set<Identity>& on_path)
{
    const std::string indent(depth * 2, ' ');
    const auto id = val.identity();
    if (id && !on_path.insert(*id).second) {
        std::cout << indent << prefix << "<cycle>\n";
        return;
    }

    switch (val.kind()) {
        case Kind::Map:
            std::cout << indent << prefix << val.type()->to_string() << "\n";
            val.for_each_entry([&](const Value& key, const Value& item) {
                print_tree(item, value_to_string(key, 1) + ": ", depth + 1, on_path);
            });
            break;
        case Kind::Pointer:
            print_tree(val.elem(), prefix + "&", depth, on_path);
            break;
        default:
            std::cout << indent << prefix << val.type()->to_string() << "\n";
            for (std::size_t i = 0; i < val.len(); ++i) {
                print_tree(val.index(i), "[" + std::to_string(i) + "]: ", depth + 1, on_path);
            }
            break;
    }

    if (id) on_path.erase(*id);
}

void print_tree(const Value& val, const std::string& prefix, std::size_t depth,
                std::set<Identity>& on_path)
{
    switch (val.kind()) {
        case Kind::Array:
        case Kind::Slice:
        case Kind::Map:
        case Kind::Pointer:
            if (val.is_nil()) break;
            print_container(val, prefix, depth, on_path);
            return;
        case Kind::Struct:
            std::cout << std::string(depth * 2, ' ') << prefix << val.type()->to_string() << "\n";
            for (std::size_t i = 0; i < val.type()->num_fields(); ++i) {
                print_tree(val.field(i), val.type()->field(i).name + ": ", depth + 1, on_path);
            }
            return;
        case Kind::Interface:
            if (val.is_nil()) break;
            print_tree(val.elem(), prefix, depth, on_path);
            return;
        default:
            break;
    }
    std::cout << std::string(depth * 2, ' ') << prefix << value_to_string(val, 0) << "\n";
}

} // anonymous namespace

std::string value_to_string(const Value& val, std::size_t depth)
{
    std::ostringstream oss;
    format_value(oss, val, depth);
    return oss.str();
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::set<Identity> on_path;
    print_tree(val, prefix, depth, on_path);
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

// ============================================================
// Assignment conversion
// ============================================================

namespace detail {

Value assign_to(const Type* target, Value v, std::string_view func)
{
    if (!target) throw bad_type(func, "null target type", nullptr);
    if (!v.valid()) {
        if (is_nilable_kind(target->kind())) return Value::nil(target);
        throw bad_type(func, "cannot use nil as type", target);
    }
    if (v.type() == target) return v;
    if (target->kind() == Kind::Interface) return Value::box(target, std::move(v));
    throw std::invalid_argument(std::string{func} + ": cannot use " + value_to_string(v, 1) +
                                " (type " + v.type()->to_string() + ") as type " +
                                target->to_string());
}

} // namespace detail

} // namespace deepeq
