//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the configuration that selects which encoders an
//          exporter wires together.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values; exporters copy them.
// Links: DESIGN.md#support
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/trace.hpp"

namespace litexport::support
{

/// @brief Holds settings that shape the encoder graph of an exporter.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Wrap numbers with their kind name, e.g. `int(5)`.
    bool explicitTypes = true;

    /// @brief Register the text and byte-sequence encoders.
    bool text = true;

    /// @brief Register the composite (sequence and array) encoder.
    bool composites = true;

    /// @brief Tracing of encoder selection and recursion.
    TraceConfig trace{};

    /// @brief Configuration of the full value export.
    static Options exporting()
    {
        return Options{};
    }

    /// @brief Configuration of the restricted plain-string cast: booleans,
    ///        absent values and untagged numbers only.
    static Options casting()
    {
        Options o;
        o.explicitTypes = false;
        o.text = false;
        o.composites = false;
        return o;
    }
};
} // namespace litexport::support
