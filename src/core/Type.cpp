//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements construction, naming and identity for runtime type descriptors.
// The textual names produced here appear verbatim in error messages, so the
// spelling rules are part of the observable contract.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Factories, printers and identity checks for @ref litexport::core::Type.
/// @details Each factory allocates a fresh immutable descriptor.  Identity is
///          structural for unnamed types and nominal for named ones, so two
///          independently built `[]int` descriptors are interchangeable.

#include "core/Type.hpp"

#include <stdexcept>
#include <utility>

namespace litexport::core
{
namespace
{

std::shared_ptr<Type> make(Type::Kind k)
{
    auto t = std::make_shared<Type>();
    t->kind = k;
    return t;
}

void requireType(const TypeRef &t, const char *what)
{
    if (!t)
        throw std::invalid_argument(std::string(what) + " requires a component type");
}

/// @brief Join the printed names of @p types with ", ".
std::string joinTypes(const std::vector<TypeRef> &types)
{
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i)
    {
        if (i)
            out += ", ";
        out += types[i]->toString();
    }
    return out;
}

bool identicalList(const std::vector<TypeRef> &a, const std::vector<TypeRef> &b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!identical(a[i], b[i]))
            return false;
    }
    return true;
}

} // namespace

TypeRef Type::basic(Kind k)
{
    switch (k)
    {
        case Kind::Interface:
        case Kind::Slice:
        case Kind::Array:
        case Kind::Pointer:
        case Kind::Struct:
        case Kind::Map:
        case Kind::Func:
        case Kind::Chan:
            throw std::invalid_argument(std::string("kind ") + kindName(k) +
                                        " is not a basic kind");
        default:
            break;
    }
    return make(k);
}

TypeRef Type::slice(TypeRef elem)
{
    requireType(elem, "slice");
    auto t = make(Kind::Slice);
    t->elem = std::move(elem);
    return t;
}

TypeRef Type::array(std::size_t length, TypeRef elem)
{
    requireType(elem, "array");
    auto t = make(Kind::Array);
    t->length = length;
    t->elem = std::move(elem);
    return t;
}

TypeRef Type::pointer(TypeRef elem)
{
    requireType(elem, "pointer");
    auto t = make(Kind::Pointer);
    t->elem = std::move(elem);
    return t;
}

TypeRef Type::mapOf(TypeRef key, TypeRef value)
{
    requireType(key, "map");
    requireType(value, "map");
    auto t = make(Kind::Map);
    t->key = std::move(key);
    t->elem = std::move(value);
    return t;
}

TypeRef Type::chanOf(TypeRef elem)
{
    requireType(elem, "chan");
    auto t = make(Kind::Chan);
    t->elem = std::move(elem);
    return t;
}

TypeRef Type::func(std::vector<TypeRef> params, std::vector<TypeRef> results)
{
    for (const auto &p : params)
        requireType(p, "func");
    for (const auto &r : results)
        requireType(r, "func");
    auto t = make(Kind::Func);
    t->params = std::move(params);
    t->results = std::move(results);
    return t;
}

TypeRef Type::structOf(std::vector<Field> fields)
{
    for (const auto &f : fields)
        requireType(f.type, "struct field");
    auto t = make(Kind::Struct);
    t->fields = std::move(fields);
    return t;
}

TypeRef Type::interfaceOf(std::vector<std::string> methods)
{
    auto t = make(Kind::Interface);
    t->methods = std::move(methods);
    return t;
}

/// @brief Declare a named type.
/// @details Copies every component of @p underlying and stamps the package and
///          name on the copy.  Naming an already named type re-names it, the
///          same way a type declaration only inherits the underlying type.
TypeRef Type::named(std::string pkg, std::string name, const TypeRef &underlying)
{
    requireType(underlying, "named type");
    if (name.empty())
        throw std::invalid_argument("named type requires a name");
    auto t = std::make_shared<Type>(*underlying);
    t->pkg = std::move(pkg);
    t->name = std::move(name);
    return t;
}

/// @brief Print the canonical type name.
/// @details Named types print as `pkg.Name` (or just `Name` without a package).
///          Unnamed composites spell out their structure recursively; the
///          empty interface prints as `interface {}` and the empty struct as
///          `struct {}`.
std::string Type::toString() const
{
    if (isNamed())
        return pkg.empty() ? name : pkg + "." + name;

    switch (kind)
    {
        case Kind::Slice:
            return "[]" + elem->toString();
        case Kind::Array:
            return "[" + std::to_string(length) + "]" + elem->toString();
        case Kind::Pointer:
            return "*" + elem->toString();
        case Kind::Chan:
            return "chan " + elem->toString();
        case Kind::Map:
            return "map[" + key->toString() + "]" + elem->toString();
        case Kind::Func:
        {
            std::string out = "func(" + joinTypes(params) + ")";
            if (results.size() == 1)
                out += " " + results.front()->toString();
            else if (results.size() > 1)
                out += " (" + joinTypes(results) + ")";
            return out;
        }
        case Kind::Struct:
        {
            if (fields.empty())
                return "struct {}";
            std::string out = "struct { ";
            for (std::size_t i = 0; i < fields.size(); ++i)
            {
                if (i)
                    out += "; ";
                out += fields[i].name + " " + fields[i].type->toString();
            }
            return out + " }";
        }
        case Kind::Interface:
        {
            if (methods.empty())
                return "interface {}";
            std::string out = "interface { ";
            for (std::size_t i = 0; i < methods.size(); ++i)
            {
                if (i)
                    out += "; ";
                out += methods[i];
            }
            return out + " }";
        }
        default:
            return kindName(kind);
    }
}

const char *kindName(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Bool:
            return "bool";
        case Type::Kind::Int:
            return "int";
        case Type::Kind::Int8:
            return "int8";
        case Type::Kind::Int16:
            return "int16";
        case Type::Kind::Int32:
            return "int32";
        case Type::Kind::Int64:
            return "int64";
        case Type::Kind::Uint:
            return "uint";
        case Type::Kind::Uint8:
            return "uint8";
        case Type::Kind::Uint16:
            return "uint16";
        case Type::Kind::Uint32:
            return "uint32";
        case Type::Kind::Uint64:
            return "uint64";
        case Type::Kind::Uintptr:
            return "uintptr";
        case Type::Kind::Float32:
            return "float32";
        case Type::Kind::Float64:
            return "float64";
        case Type::Kind::Complex64:
            return "complex64";
        case Type::Kind::Complex128:
            return "complex128";
        case Type::Kind::String:
            return "string";
        case Type::Kind::Interface:
            return "interface";
        case Type::Kind::Slice:
            return "slice";
        case Type::Kind::Array:
            return "array";
        case Type::Kind::Pointer:
            return "ptr";
        case Type::Kind::Struct:
            return "struct";
        case Type::Kind::Map:
            return "map";
        case Type::Kind::Func:
            return "func";
        case Type::Kind::Chan:
            return "chan";
    }
    return "";
}

bool isSignedKind(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Int:
        case Type::Kind::Int8:
        case Type::Kind::Int16:
        case Type::Kind::Int32:
        case Type::Kind::Int64:
            return true;
        default:
            return false;
    }
}

bool isUnsignedKind(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Uint:
        case Type::Kind::Uint8:
        case Type::Kind::Uint16:
        case Type::Kind::Uint32:
        case Type::Kind::Uint64:
            return true;
        default:
            return false;
    }
}

bool isNumericKind(Type::Kind k)
{
    return isSignedKind(k) || isUnsignedKind(k) || k == Type::Kind::Float32 ||
           k == Type::Kind::Float64;
}

int bitWidth(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Int8:
        case Type::Kind::Uint8:
            return 8;
        case Type::Kind::Int16:
        case Type::Kind::Uint16:
            return 16;
        case Type::Kind::Int32:
        case Type::Kind::Uint32:
        case Type::Kind::Float32:
            return 32;
        default:
            return 64;
    }
}

bool identical(const Type &a, const Type &b)
{
    if (a.isNamed() || b.isNamed())
        return a.pkg == b.pkg && a.name == b.name;
    if (a.kind != b.kind)
        return false;

    switch (a.kind)
    {
        case Type::Kind::Array:
            return a.length == b.length && identical(a.elem, b.elem);
        case Type::Kind::Slice:
        case Type::Kind::Pointer:
        case Type::Kind::Chan:
            return identical(a.elem, b.elem);
        case Type::Kind::Map:
            return identical(a.key, b.key) && identical(a.elem, b.elem);
        case Type::Kind::Func:
            return identicalList(a.params, b.params) && identicalList(a.results, b.results);
        case Type::Kind::Struct:
            if (a.fields.size() != b.fields.size())
                return false;
            for (std::size_t i = 0; i < a.fields.size(); ++i)
            {
                if (a.fields[i].name != b.fields[i].name ||
                    !identical(a.fields[i].type, b.fields[i].type))
                    return false;
            }
            return true;
        case Type::Kind::Interface:
            return a.methods == b.methods;
        default:
            return true;
    }
}

bool identical(const TypeRef &a, const TypeRef &b)
{
    if (a == b)
        return true;
    if (!a || !b)
        return false;
    return identical(*a, *b);
}

} // namespace litexport::core
