//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/CycleGuard.hpp
// Purpose: Declares the recursion guard that wraps the dispatcher and rejects
//          a value that is deep-equal to one still being rendered.
// Key invariants: The stack holds exactly the values on the active render
//                 path; no two entries are deep-equal.
// Ownership/Lifetime: Owns the wrapped encoder.  Stack entries borrow values
//                     that stay alive for the duration of their render.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/Encoder.hpp"
#include "support/trace.hpp"

#include <memory>
#include <vector>

namespace litexport::encode
{

/// @brief Structural-equality recursion guard.
class CycleGuard final : public Encoder
{
  public:
    explicit CycleGuard(std::unique_ptr<Encoder> next,
                        support::TraceSink trace = support::TraceSink{});

    std::string_view name() const override;

    /// @brief Forwards to the wrapped encoder.
    bool supports(const core::Value &v) const override;

    /// @brief Push @p v, render it with the wrapped encoder, pop it.
    /// @return InfiniteLoop diagnostic, without calling the wrapped encoder,
    ///         when @p v is deep-equal to a value already on the stack.
    support::Expected<std::string> render(const core::Value &v) override;

    /// @brief Number of values currently being rendered.
    std::size_t depth() const;

  private:
    std::unique_ptr<Encoder> next_;
    std::vector<const core::Value *> stack_;
    support::TraceSink trace_;
};

} // namespace litexport::encode
