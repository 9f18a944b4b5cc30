//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the public export and cast entry points on top of two lazily
// built, immutable exporters.  The exporters keep only their options; every
// call still receives its own encoder graph and cycle-guard stack.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Public entry points of the exporter.

#include "api/Export.hpp"

#include <utility>

namespace litexport
{

ExportFailure::ExportFailure(std::string message, support::Diag diag)
    : std::runtime_error(std::move(message)), diag_(std::move(diag))
{
}

const support::Diag &ExportFailure::diagnostic() const
{
    return diag_;
}

const encode::Exporter &defaultExporter()
{
    static const encode::Exporter exporter(support::Options::exporting());
    return exporter;
}

const encode::Exporter &defaultCaster()
{
    static const encode::Exporter caster(support::Options::casting());
    return caster;
}

support::Expected<std::string> exportValue(const core::Value &v)
{
    return defaultExporter().run(v);
}

std::string mustExport(const core::Value &v)
{
    auto result = exportValue(v);
    if (!result)
        throw ExportFailure("cannot export " + core::typeName(v) + " to string: " +
                                result.error().message,
                            result.error());
    return std::move(result.value());
}

/// @brief Cast to a plain string.
/// @details Text of the unnamed string type short-circuits before any encoder
///          is consulted, so it comes back verbatim instead of quoted.  Named
///          string types take the encoder path and are rejected there.
support::Expected<std::string> castToString(const core::Value &v)
{
    if (v.kind == core::Value::Kind::Text && !v.type->isNamed())
        return v.str;
    return defaultCaster().run(v);
}

std::string mustCastToString(const core::Value &v)
{
    auto result = castToString(v);
    if (!result)
        throw ExportFailure("cannot cast " + core::typeName(v) + " to string: " +
                                result.error().message,
                            result.error());
    return std::move(result.value());
}

} // namespace litexport
