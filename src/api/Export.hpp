//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: api/Export.hpp
// Purpose: Public entry points: full literal export and the restricted cast
//          to a plain string, each in a fallible and a throwing form.
// Key invariants: Fallible forms never throw for unsupported input; throwing
//                 forms raise ExportFailure carrying the diagnostic text and
//                 the input's type.
// Ownership/Lifetime: Stateless free functions over shared immutable
//                     exporters.
// Links: DESIGN.md#api
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Adapt.hpp"
#include "core/Value.hpp"
#include "encode/Factory.hpp"
#include "support/diag_expected.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>

namespace litexport
{

/// @brief Raised by mustExport and mustCastToString.
class ExportFailure : public std::runtime_error
{
  public:
    ExportFailure(std::string message, support::Diag diag);

    /// @brief Diagnostic returned by the fallible form.
    const support::Diag &diagnostic() const;

  private:
    support::Diag diag_;
};

/// @brief Exporter with the full configuration, built on first use.
const encode::Exporter &defaultExporter();

/// @brief Exporter with the restricted cast configuration, built on first use.
const encode::Exporter &defaultCaster();

/// @brief Render @p v as literal source text with explicit numeric types.
support::Expected<std::string> exportValue(const core::Value &v);

/// @brief Like exportValue, but throws ExportFailure with the message
///        "cannot export <type> to string: <error>".
std::string mustExport(const core::Value &v);

/// @brief Cast @p v to a plain string.
/// @details Unnamed text is returned unchanged.  Otherwise only booleans, the
///          absent value and numbers are accepted, and numbers are printed
///          without their kind name.
support::Expected<std::string> castToString(const core::Value &v);

/// @brief Like castToString, but throws ExportFailure with the message
///        "cannot cast <type> to string: <error>".
std::string mustCastToString(const core::Value &v);

template <class T, class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, core::Value>>>
support::Expected<std::string> exportValue(const T &x)
{
    return exportValue(core::toValue(x));
}

template <class T, class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, core::Value>>>
std::string mustExport(const T &x)
{
    return mustExport(core::toValue(x));
}

template <class T, class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, core::Value>>>
support::Expected<std::string> castToString(const T &x)
{
    return castToString(core::toValue(x));
}

template <class T, class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, core::Value>>>
std::string mustCastToString(const T &x)
{
    return mustCastToString(core::toValue(x));
}

} // namespace litexport
