//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic constructors used by the encoders.  Keeping them
// in one place guarantees that every layer composes messages the same way:
// leaves state the problem, containers prefix their position.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Diagnostic factories and error-kind spelling.

#include "support/diag_expected.hpp"

namespace litexport::support
{

/// @brief Map an error kind to the lowercase string used in traces.
/// @details New kinds should extend this switch so trace output stays
///          predictable.
const char *errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::UnsupportedType:
            return "unsupported-type";
        case ErrorKind::CompositeElement:
            return "composite-element";
        case ErrorKind::InfiniteLoop:
            return "infinite-loop";
    }
    return "";
}

Diag makeError(ErrorKind kind, std::string msg)
{
    return Diag{kind, std::move(msg), kind};
}

/// @brief Wrap a failure reported by a nested render.
/// @details Nesting composes left to right, so the outermost container comes
///          first and the original failure stays at the tail of the message.
Diag wrapError(std::string context, const Diag &inner)
{
    return Diag{ErrorKind::CompositeElement, std::move(context) + ": " + inner.message,
                inner.cause};
}

} // namespace litexport::support
