// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepeq/type.h>

#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace deepeq {

// ============================================================
// TypeRegistry
//
// Owns every Type ever created. Types are never released, so raw
// `const Type*` handles stay valid for the life of the process.
// Unnamed composite types are interned by a structural key built from
// the ids of their component types.
// ============================================================

class TypeRegistry {
public:
    static TypeRegistry& instance() {
        static TypeRegistry registry;
        return registry;
    }

    const Type* scalar(Kind kind) const {
        if (kind < Kind::Bool || kind > Kind::String) {
            throw std::invalid_argument("scalar_type: not a scalar kind: " +
                                        std::string{kind_name(kind)});
        }
        return scalars_[static_cast<std::size_t>(kind) - static_cast<std::size_t>(Kind::Bool)];
    }

    const Type* any() const { return any_; }

    template <typename Init>
    const Type* intern(const std::string& key, Init&& init) {
        std::lock_guard lock{mutex_};
        if (auto it = interned_.find(key); it != interned_.end()) {
            return it->second;
        }
        Type* type = create_locked();
        std::forward<Init>(init)(*type);
        interned_.emplace(key, type);
        return type;
    }

    template <typename Init>
    Type* create(Init&& init) {
        std::lock_guard lock{mutex_};
        Type* type = create_locked();
        std::forward<Init>(init)(*type);
        return type;
    }

    void define_fields(Type* type, std::vector<StructField> fields) {
        std::lock_guard lock{mutex_};
        if (type->kind_ != Kind::Struct) {
            throw std::logic_error("define_fields: " + type->to_string() + " is not a struct");
        }
        if (type->complete_) {
            throw std::logic_error("define_fields: " + type->to_string() + " is already defined");
        }
        check_fields(fields);
        type->fields_ = std::move(fields);
        type->complete_ = true;
    }

    std::size_t size() const {
        std::lock_guard lock{mutex_};
        return types_.size();
    }

    static void check_fields(const std::vector<StructField>& fields) {
        std::unordered_set<std::string_view> seen;
        for (const auto& f : fields) {
            if (f.name.empty()) {
                throw std::logic_error("struct field without a name");
            }
            if (!f.type) {
                throw std::logic_error("struct field " + f.name + " has no type");
            }
            if (!seen.insert(f.name).second) {
                throw std::logic_error("duplicate struct field " + f.name);
            }
            if (embeds_incomplete(f.type)) {
                // only pointers, slices and maps may refer to a struct being defined
                throw std::logic_error("struct field " + f.name + " has incomplete type " +
                                       f.type->to_string());
            }
        }
    }

    static bool embeds_incomplete(const Type* t) {
        if (t->kind_ == Kind::Struct) return !t->complete_;
        if (t->kind_ == Kind::Array) return embeds_incomplete(t->elem_);
        return false;
    }

    // Access to Type internals for the free construction functions
    static void set_kind(Type& t, Kind k) { t.kind_ = k; }
    static void set_name(Type& t, std::string n) { t.name_ = std::move(n); }
    static void set_elem(Type& t, const Type* e) { t.elem_ = e; }
    static void set_key(Type& t, const Type* k) { t.key_ = k; }
    static void set_length(Type& t, std::size_t n) { t.length_ = n; }
    static void set_signature(Type& t, std::string s) { t.signature_ = std::move(s); }
    static void set_fields(Type& t, std::vector<StructField> f) { t.fields_ = std::move(f); }
    static void set_complete(Type& t, bool c) { t.complete_ = c; }

private:
    TypeRegistry() {
        static constexpr std::pair<Kind, const char*> builtins[] = {
            {Kind::Bool, "bool"},       {Kind::Int8, "int8"},       {Kind::Int16, "int16"},
            {Kind::Int32, "int32"},     {Kind::Int64, "int64"},     {Kind::Uint8, "uint8"},
            {Kind::Uint16, "uint16"},   {Kind::Uint32, "uint32"},   {Kind::Uint64, "uint64"},
            {Kind::Float32, "float32"}, {Kind::Float64, "float64"}, {Kind::String, "string"},
        };
        for (std::size_t i = 0; i < std::size(builtins); ++i) {
            Type* t = create_locked();
            t->kind_ = builtins[i].first;
            t->name_ = builtins[i].second;
            scalars_[i] = t;
        }
        Type* any = create_locked();
        any->kind_ = Kind::Interface;
        any_ = any;
    }

    Type* create_locked() {
        auto type = std::unique_ptr<Type>(new Type());
        type->id_ = static_cast<std::uint32_t>(types_.size());
        types_.push_back(std::move(type));
        return types_.back().get();
    }

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Type>> types_;
    std::unordered_map<std::string, const Type*> interned_;
    const Type* scalars_[12] = {};
    const Type* any_ = nullptr;
};

// ============================================================
// Kind / Type
// ============================================================

std::string_view kind_name(Kind kind) noexcept
{
    switch (kind) {
        case Kind::Invalid:   return "invalid";
        case Kind::Bool:      return "bool";
        case Kind::Int8:      return "int8";
        case Kind::Int16:     return "int16";
        case Kind::Int32:     return "int32";
        case Kind::Int64:     return "int64";
        case Kind::Uint8:     return "uint8";
        case Kind::Uint16:    return "uint16";
        case Kind::Uint32:    return "uint32";
        case Kind::Uint64:    return "uint64";
        case Kind::Float32:   return "float32";
        case Kind::Float64:   return "float64";
        case Kind::String:    return "string";
        case Kind::Array:     return "array";
        case Kind::Slice:     return "slice";
        case Kind::Struct:    return "struct";
        case Kind::Map:       return "map";
        case Kind::Pointer:   return "ptr";
        case Kind::Interface: return "interface";
        case Kind::Func:      return "func";
        case Kind::Chan:      return "chan";
        case Kind::Opaque:    return "opaque";
    }
    return "unknown";
}

std::size_t Type::field_index(std::string_view name) const noexcept
{
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return fields_.size();
}

bool Type::comparable() const noexcept
{
    switch (kind_) {
        case Kind::Slice:
        case Kind::Map:
        case Kind::Func:
        case Kind::Invalid:
            return false;
        case Kind::Array:
            return elem_->comparable();
        case Kind::Struct:
            for (const auto& f : fields_) {
                if (!f.type->comparable()) return false;
            }
            return true;
        default:
            return true;
    }
}

std::string Type::to_string() const
{
    if (named()) return name_;

    switch (kind_) {
        case Kind::Array:
            return "[" + std::to_string(length_) + "]" + elem_->to_string();
        case Kind::Slice:
            return "[]" + elem_->to_string();
        case Kind::Pointer:
            return "*" + elem_->to_string();
        case Kind::Chan:
            return "chan " + elem_->to_string();
        case Kind::Map:
            return "map[" + key_->to_string() + "]" + elem_->to_string();
        case Kind::Func:
            return "func" + signature_;
        case Kind::Interface:
            return "interface {}";
        case Kind::Struct: {
            std::string result = "struct {";
            for (std::size_t i = 0; i < fields_.size(); ++i) {
                result += (i == 0) ? " " : "; ";
                result += fields_[i].name + " " + fields_[i].type->to_string();
            }
            return result + (fields_.empty() ? "}" : " }");
        }
        default:
            return std::string{kind_name(kind_)};
    }
}

// ============================================================
// Type construction
// ============================================================

namespace types {

namespace {

std::string id_key(const Type* t) {
    return "#" + std::to_string(t->id());
}

void require_type(const Type* t, const char* func) {
    if (!t) throw std::invalid_argument(std::string{func} + ": null type");
}

void require_name(const std::string& name, const char* func) {
    if (name.empty()) throw std::invalid_argument(std::string{func} + ": empty type name");
}

} // anonymous namespace

const Type* bool_type()    { return TypeRegistry::instance().scalar(Kind::Bool); }
const Type* int8_type()    { return TypeRegistry::instance().scalar(Kind::Int8); }
const Type* int16_type()   { return TypeRegistry::instance().scalar(Kind::Int16); }
const Type* int32_type()   { return TypeRegistry::instance().scalar(Kind::Int32); }
const Type* int64_type()   { return TypeRegistry::instance().scalar(Kind::Int64); }
const Type* uint8_type()   { return TypeRegistry::instance().scalar(Kind::Uint8); }
const Type* uint16_type()  { return TypeRegistry::instance().scalar(Kind::Uint16); }
const Type* uint32_type()  { return TypeRegistry::instance().scalar(Kind::Uint32); }
const Type* uint64_type()  { return TypeRegistry::instance().scalar(Kind::Uint64); }
const Type* float32_type() { return TypeRegistry::instance().scalar(Kind::Float32); }
const Type* float64_type() { return TypeRegistry::instance().scalar(Kind::Float64); }
const Type* string_type()  { return TypeRegistry::instance().scalar(Kind::String); }
const Type* any_type()     { return TypeRegistry::instance().any(); }

const Type* scalar_type(Kind kind)
{
    return TypeRegistry::instance().scalar(kind);
}

const Type* array_of(const Type* elem, std::size_t length)
{
    require_type(elem, "array_of");
    return TypeRegistry::instance().intern(
        "[" + std::to_string(length) + "]" + id_key(elem), [&](Type& t) {
            TypeRegistry::set_kind(t, Kind::Array);
            TypeRegistry::set_elem(t, elem);
            TypeRegistry::set_length(t, length);
        });
}

const Type* slice_of(const Type* elem)
{
    require_type(elem, "slice_of");
    return TypeRegistry::instance().intern("[]" + id_key(elem), [&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Slice);
        TypeRegistry::set_elem(t, elem);
    });
}

const Type* pointer_to(const Type* elem)
{
    require_type(elem, "pointer_to");
    return TypeRegistry::instance().intern("*" + id_key(elem), [&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Pointer);
        TypeRegistry::set_elem(t, elem);
    });
}

const Type* chan_of(const Type* elem)
{
    require_type(elem, "chan_of");
    return TypeRegistry::instance().intern("chan " + id_key(elem), [&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Chan);
        TypeRegistry::set_elem(t, elem);
    });
}

const Type* map_of(const Type* key, const Type* value)
{
    require_type(key, "map_of");
    require_type(value, "map_of");
    if (!key->comparable()) {
        throw std::invalid_argument("map_of: invalid map key type " + key->to_string());
    }
    return TypeRegistry::instance().intern(
        "map[" + id_key(key) + "]" + id_key(value), [&](Type& t) {
            TypeRegistry::set_kind(t, Kind::Map);
            TypeRegistry::set_key(t, key);
            TypeRegistry::set_elem(t, value);
        });
}

const Type* func_type(std::string_view signature)
{
    std::string sig{signature};
    return TypeRegistry::instance().intern("func" + sig, [&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Func);
        TypeRegistry::set_signature(t, sig);
    });
}

const Type* struct_of(std::initializer_list<StructField> fields)
{
    std::vector<StructField> list{fields};
    TypeRegistry::check_fields(list);

    std::string key = "struct{";
    for (const auto& f : list) {
        key += f.name + " " + id_key(f.type) + ";";
    }
    key += "}";

    return TypeRegistry::instance().intern(key, [&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Struct);
        TypeRegistry::set_fields(t, std::move(list));
    });
}

Type* declare_struct(std::string name)
{
    require_name(name, "declare_struct");
    return TypeRegistry::instance().create([&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Struct);
        TypeRegistry::set_name(t, std::move(name));
        TypeRegistry::set_complete(t, false);
    });
}

void define_fields(Type* type, std::initializer_list<StructField> fields)
{
    define_fields(type, std::vector<StructField>{fields});
}

void define_fields(Type* type, std::vector<StructField> fields)
{
    if (!type) throw std::invalid_argument("define_fields: null type");
    TypeRegistry::instance().define_fields(type, std::move(fields));
}

const Type* define_struct(std::string name, std::initializer_list<StructField> fields)
{
    Type* type = declare_struct(std::move(name));
    define_fields(type, fields);
    return type;
}

const Type* define_named(std::string name, const Type* underlying)
{
    require_name(name, "define_named");
    require_type(underlying, "define_named");
    if (!underlying->complete()) {
        throw std::invalid_argument("define_named: " + underlying->to_string() +
                                    " is declared but not defined");
    }
    return TypeRegistry::instance().create([&](Type& t) {
        TypeRegistry::set_kind(t, underlying->kind());
        TypeRegistry::set_name(t, std::move(name));
        TypeRegistry::set_elem(t, underlying->elem());
        TypeRegistry::set_key(t, underlying->key());
        TypeRegistry::set_length(t, underlying->length());
        TypeRegistry::set_signature(t, underlying->signature());
        TypeRegistry::set_fields(t, underlying->fields());
    });
}

const Type* named_interface(std::string name)
{
    require_name(name, "named_interface");
    return TypeRegistry::instance().create([&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Interface);
        TypeRegistry::set_name(t, std::move(name));
    });
}

const Type* opaque_type(std::string name)
{
    require_name(name, "opaque_type");
    return TypeRegistry::instance().create([&](Type& t) {
        TypeRegistry::set_kind(t, Kind::Opaque);
        TypeRegistry::set_name(t, std::move(name));
    });
}

std::size_t registered_count()
{
    return TypeRegistry::instance().size();
}

} // namespace types

} // namespace deepeq
