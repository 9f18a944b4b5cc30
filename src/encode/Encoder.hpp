//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/Encoder.hpp
// Purpose: Declares the capability interface shared by every encoder: a
//          predicate telling whether a value can be rendered and the renderer
//          itself.
// Key invariants: render() is only meaningful for values supports() accepts;
//                 callers that skip the check get an UnsupportedType
//                 diagnostic or an unspecified literal.
// Ownership/Lifetime: Encoders are owned by the graph that wires them; see
//                     encode/Factory.hpp.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Value.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace litexport::encode
{

/// @brief Unit that tests whether it can render a value and renders it.
class Encoder
{
  public:
    virtual ~Encoder() = default;

    /// @brief Short identifier used in trace output.
    virtual std::string_view name() const = 0;

    /// @brief Whether this encoder can render @p v.
    virtual bool supports(const core::Value &v) const = 0;

    /// @brief Render @p v as literal source text.
    /// @details Not const: encoders that recurse keep per-call state.
    virtual support::Expected<std::string> render(const core::Value &v) = 0;
};

} // namespace litexport::encode
