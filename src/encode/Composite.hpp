//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/Composite.hpp
// Purpose: Declares the encoder for nested sequences and fixed-length arrays.
// Key invariants: The bracket prefix lists every unnamed sequence or array
//                 layer of the value's type, outermost first.
// Ownership/Lifetime: Holds a non-owning pointer to the encoder used for
//                     elements; the graph guarantees it outlives this object.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Type.hpp"
#include "encode/Encoder.hpp"

#include <string>

namespace litexport::encode
{

/// @brief Leaf type and bracket prefix of a container type.
struct ContainerShape
{
    std::string prefix;  ///< e.g. "[][2][]"
    core::TypeRef leaf;  ///< Type left after stripping every layer
    std::size_t layers{0};

    /// @brief Literal type spelling, e.g. "[][2]interface{}".
    std::string literalType() const;
};

/// @brief Strip the unnamed sequence and array layers of @p t.
ContainerShape shapeOf(const core::TypeRef &t);

/// @brief Renders sequences and arrays, recursing for every element.
class CompositeEncoder final : public Encoder
{
  public:
    /// @param elements Encoder used for elements; may be bound later.
    explicit CompositeEncoder(Encoder *elements = nullptr);

    /// @brief Set the encoder used for elements, normally the cycle guard
    ///        that wraps the chain this encoder belongs to.
    void bind(Encoder &elements);

    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;

  private:
    Encoder *elements_;
};

} // namespace litexport::encode
