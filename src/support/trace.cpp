//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/trace.cpp
// Purpose: Format trace lines for the encoder graph.
// Links: DESIGN.md#support
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Line-oriented tracing of export steps.
/// @details Every line starts with `[litexport]` followed by the event and the
///          printed type of the value involved, so traces of the same input are
///          byte-identical across runs.

#include "support/trace.hpp"

#include "core/Value.hpp"

#include <iostream>
#include <string>

namespace litexport::support
{

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

bool TraceSink::enabled() const
{
    return cfg.enabled;
}

void TraceSink::onEnter(std::size_t depth, const core::Value &v) const
{
    if (!cfg.enabled)
        return;
    line("enter #" + std::to_string(depth) + " " + core::typeName(v));
}

void TraceSink::onLoop(std::size_t depth, const core::Value &v) const
{
    if (!cfg.enabled)
        return;
    line("loop #" + std::to_string(depth) + " " + core::typeName(v));
}

void TraceSink::onSelect(std::string_view encoder, const core::Value &v) const
{
    if (!cfg.enabled)
        return;
    line("select " + std::string(encoder) + " for " + core::typeName(v));
}

void TraceSink::onUnsupported(const core::Value &v) const
{
    if (!cfg.enabled)
        return;
    line("no encoder for " + core::typeName(v));
}

void TraceSink::line(std::string_view text) const
{
    std::ostream &os = cfg.os ? *cfg.os : std::cerr;
    os << "[litexport] " << text << '\n';
}

} // namespace litexport::support
