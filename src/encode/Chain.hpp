//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/Chain.hpp
// Purpose: Declares the dispatcher that owns an ordered list of encoders and
//          delegates each value to the first one that accepts it.
// Key invariants: Registration order is precedence; predicates of different
//                 encoders may overlap.
// Ownership/Lifetime: The chain owns its encoders.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/Encoder.hpp"
#include "support/trace.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace litexport::encode
{

/// @brief First-match dispatcher over an ordered list of encoders.
class Chain final : public Encoder
{
  public:
    explicit Chain(support::TraceSink trace = support::TraceSink{});

    /// @brief Append @p encoder at the lowest precedence.
    /// @return Reference to the stored encoder.
    Encoder &add(std::unique_ptr<Encoder> encoder);

    /// @brief Construct an encoder of type @p E in place and append it.
    template <class E, class... Args> E &emplace(Args &&...args)
    {
        auto encoder = std::make_unique<E>(std::forward<Args>(args)...);
        E &ref = *encoder;
        add(std::move(encoder));
        return ref;
    }

    /// @brief Number of registered encoders.
    std::size_t size() const;

    std::string_view name() const override;

    /// @brief True when any registered encoder accepts @p v.
    bool supports(const core::Value &v) const override;

    /// @brief Delegate to the first encoder accepting @p v.
    /// @return The encoder's result, or an UnsupportedType diagnostic naming
    ///         the value's type when none accepts it.
    support::Expected<std::string> render(const core::Value &v) override;

  private:
    std::vector<std::unique_ptr<Encoder>> encoders_;
    support::TraceSink trace_;
};

} // namespace litexport::encode
