//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the composite encoder.  A container literal is spelled from its
// type, not from its elements: the bracket prefix comes from stripping every
// unnamed sequence or array layer, and the remaining leaf supplies the element
// spelling.  Elements are rendered by the bound encoder, which re-enters the
// cycle guard for each of them.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Rendering of nested sequences and arrays.
/// @details Forms produced for a literal type `L`:
///          - nil sequence: `(L)(nil)`
///          - empty sequence: `make(L, 0)`
///          - anything else, arrays of length zero included: `L{e0, e1, ...}`

#include "encode/Composite.hpp"

namespace litexport::encode
{

using core::Type;
using core::Value;

namespace
{

bool isBuiltInContainer(const Type &t)
{
    return !t.isNamed() && (t.kind == Type::Kind::Slice || t.kind == Type::Kind::Array);
}

} // namespace

std::string ContainerShape::literalType() const
{
    // The unconstrained interface is spelled without the inner space.
    if (leaf->kind == Type::Kind::Interface)
        return prefix + "interface{}";
    return prefix + core::kindName(leaf->kind);
}

ContainerShape shapeOf(const core::TypeRef &t)
{
    ContainerShape shape;
    shape.leaf = t;
    while (isBuiltInContainer(*shape.leaf))
    {
        if (shape.leaf->kind == Type::Kind::Array)
            shape.prefix += "[" + std::to_string(shape.leaf->length) + "]";
        else
            shape.prefix += "[]";
        shape.leaf = shape.leaf->elem;
        ++shape.layers;
    }
    return shape;
}

CompositeEncoder::CompositeEncoder(Encoder *elements) : elements_(elements) {}

void CompositeEncoder::bind(Encoder &elements)
{
    elements_ = &elements;
}

std::string_view CompositeEncoder::name() const
{
    return "composite";
}

/// @brief Accept containers whose leaf elements the bound encoder can render.
/// @details The leaf is probed through its zero value.  A named leaf and an
///          interface that requires methods are rejected first: the zero value
///          of any interface is the absent value, which would otherwise pass
///          the probe for interfaces that carry behaviour.
bool CompositeEncoder::supports(const Value &v) const
{
    if (!elements_)
        return false;
    if (v.kind != Value::Kind::Sequence && v.kind != Value::Kind::Array)
        return false;
    if (!isBuiltInContainer(*v.type))
        return false;

    const ContainerShape shape = shapeOf(v.type);
    if (shape.leaf->isNamed() || shape.leaf->hasMethods())
        return false;

    return elements_->supports(Value::zero(shape.leaf));
}

support::Expected<std::string> CompositeEncoder::render(const Value &v)
{
    const std::string literal = shapeOf(v.type).literalType();

    if (v.kind == Value::Kind::Sequence)
    {
        if (!v.elems)
            return "(" + literal + ")(nil)";
        if (v.elems->empty())
            return "make(" + literal + ", 0)";
    }

    std::string out = literal + "{";
    for (std::size_t i = 0; i < v.size(); ++i)
    {
        auto part = elements_->render(v.at(i));
        if (!part)
            return support::wrapError("cannot export (" + literal + ")[" + std::to_string(i) + "]",
                                      part.error());
        if (i)
            out += ", ";
        out += part.value();
    }
    out += "}";
    return out;
}

} // namespace litexport::encode
