//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/Factory.hpp
// Purpose: Declares the factory that wires a fresh encoder graph and the
//          exporter that builds one graph per call.
// Key invariants: No two calls share a graph, so the cycle guard's stack is
//                 never visible outside the call that created it.
// Ownership/Lifetime: buildEncoder hands the whole graph to the caller through
//                     the returned guard; Exporter holds options only.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/Encoder.hpp"
#include "support/options.hpp"

#include <memory>
#include <string>

namespace litexport::encode
{

/// @brief Wire cycle guard -> chain -> encoders for @p opts.
/// @details Registration order is bool, nil, number, then text, bytes and
///          composite when enabled.  The composite encoder renders elements
///          through the returned guard.
std::unique_ptr<Encoder> buildEncoder(const support::Options &opts);

/// @brief Exporter that builds a disposable encoder graph for every call.
/// @details Holds nothing mutable, so one instance may be shared by any number
///          of threads.
class Exporter
{
  public:
    explicit Exporter(support::Options opts = support::Options::exporting());

    /// @brief Render @p v with a freshly built graph.
    support::Expected<std::string> run(const core::Value &v) const;

    /// @brief Whether a freshly built graph accepts @p v at the top level.
    bool supports(const core::Value &v) const;

    const support::Options &options() const;

  private:
    support::Options opts_;
};

} // namespace litexport::encode
