//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Type.hpp
// Purpose: Declares the runtime type descriptor attached to every exported
//          value.  The descriptor replaces reflective type queries: encoders
//          decide what they can render by inspecting the kind tag, the
//          component types and whether the type is named.
// Key invariants: Types are immutable once built; a named type keeps the kind
//                 of its underlying type.
// Ownership/Lifetime: Types are shared through TypeRef and outlive every value
//                     that refers to them.
// Links: DESIGN.md#core
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace litexport::core
{

struct Type;

/// @brief Shared handle to an immutable type descriptor.
using TypeRef = std::shared_ptr<const Type>;

/// @brief Runtime type descriptor for exported values.
struct Type
{
    /// @brief Enumerates the kinds a value can have.
    enum class Kind
    {
        Bool,
        Int,
        Int8,
        Int16,
        Int32,
        Int64,
        Uint,
        Uint8,
        Uint16,
        Uint32,
        Uint64,
        Uintptr,
        Float32,
        Float64,
        Complex64,
        Complex128,
        String,
        Interface,
        Slice,
        Array,
        Pointer,
        Struct,
        Map,
        Func,
        Chan
    };

    /// @brief Single struct field, used only for naming struct types.
    struct Field
    {
        std::string name;
        TypeRef type;
    };

    Kind kind{Kind::Bool}; ///< Underlying kind; unchanged by naming.

    /// Package qualifier of a named type; empty for unnamed types.
    std::string pkg;
    /// Name of a named type; empty for unnamed types.
    std::string name;

    /// Element type for Slice, Array, Pointer and Chan; value type for Map.
    TypeRef elem;
    /// Key type for Map.
    TypeRef key;
    /// Number of elements for Array.
    std::size_t length{0};

    /// Method signatures required by an Interface, e.g. "Do()".
    std::vector<std::string> methods;
    /// Fields of a Struct.
    std::vector<Field> fields;
    /// Parameter and result types of a Func.
    std::vector<TypeRef> params;
    std::vector<TypeRef> results;

    static TypeRef basic(Kind k);
    static TypeRef slice(TypeRef elem);
    static TypeRef array(std::size_t length, TypeRef elem);
    static TypeRef pointer(TypeRef elem);
    static TypeRef mapOf(TypeRef key, TypeRef value);
    static TypeRef chanOf(TypeRef elem);
    static TypeRef func(std::vector<TypeRef> params, std::vector<TypeRef> results = {});
    static TypeRef structOf(std::vector<Field> fields = {});

    /// @brief Build an interface type.
    /// @param methods Required method signatures; empty for the unconstrained
    ///        placeholder type.
    static TypeRef interfaceOf(std::vector<std::string> methods = {});

    /// @brief Declare a named type over @p underlying.
    /// @param pkg Package qualifier printed before the name.
    /// @param name Type name.
    /// @param underlying Type supplying the kind and components.
    static TypeRef named(std::string pkg, std::string name, const TypeRef &underlying);

    /// @brief Whether the type was declared with a name.
    bool isNamed() const
    {
        return !name.empty();
    }

    /// @brief Whether this is an interface that requires behaviour.
    bool hasMethods() const
    {
        return kind == Kind::Interface && !methods.empty();
    }

    /// @brief Render the canonical type name used in diagnostics.
    std::string toString() const;
};

/// @brief Lowercase spelling of kind @p k ("int", "uint8", "slice", ...).
const char *kindName(Type::Kind k);

/// @brief True for the integer and floating-point kinds encoders can print.
bool isNumericKind(Type::Kind k);

/// @brief True for Int, Int8, Int16, Int32 and Int64.
bool isSignedKind(Type::Kind k);

/// @brief True for Uint, Uint8, Uint16, Uint32 and Uint64.
bool isUnsignedKind(Type::Kind k);

/// @brief Bit width of a sized numeric kind; 64 for Int and Uint.
int bitWidth(Type::Kind k);

/// @brief Type identity: same name for named types, same structure otherwise.
bool identical(const Type &a, const Type &b);

/// @brief Null-tolerant identity on shared handles.
bool identical(const TypeRef &a, const TypeRef &b);

} // namespace litexport::core
