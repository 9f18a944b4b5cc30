//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record produced when a value cannot be
//          exported, together with the error taxonomy.
// Key invariants: cause is the kind of the innermost failure; for a leaf
//                 diagnostic it equals kind.
// Ownership/Lifetime: Diagnostics are value types.
// Links: DESIGN.md#support
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace litexport::support
{

/// @brief Error taxonomy of the exporter.
enum class ErrorKind
{
    UnsupportedType,  ///< No encoder accepts the value.
    CompositeElement, ///< An element of a container failed to render.
    InfiniteLoop      ///< A value re-entered while still being rendered.
};

/// @brief Single failure report.
struct Diagnostic
{
    ErrorKind kind;      ///< Kind of this (outermost) failure
    std::string message; ///< Full human-readable text
    ErrorKind cause;     ///< Kind of the innermost failure
};

/// @brief Lowercase spelling of @p kind for traces and test output.
const char *errorKindToString(ErrorKind kind);

} // namespace litexport::support
