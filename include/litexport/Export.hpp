// File: include/litexport/Export.hpp
// Purpose: Stable facade for exporting values as literal source text.
// Key invariants: Re-exports the value model, the C++ adapter and the public
//                 entry points; encoder internals stay under src/encode.
// Ownership/Lifetime: Mirrors the underlying implementations.
// Links: DESIGN.md#api
#pragma once

#include "api/Export.hpp"
#include "core/Adapt.hpp"
#include "core/Type.hpp"
#include "core/Value.hpp"
#include "support/diag_expected.hpp"

/// @file include/litexport/Export.hpp
/// @brief Aggregated public header.  Provides the Value and Type model, the
///        toValue adapter for C++ values, and exportValue / castToString with
///        their throwing counterparts.
