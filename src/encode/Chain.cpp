//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements first-match dispatch.  The chain performs no rendering of its
// own; it only resolves precedence and reports values nobody accepts.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Ordered dispatcher over encoders.

#include "encode/Chain.hpp"

#include <stdexcept>

namespace litexport::encode
{

Chain::Chain(support::TraceSink trace) : trace_(trace) {}

Encoder &Chain::add(std::unique_ptr<Encoder> encoder)
{
    if (!encoder)
        throw std::invalid_argument("Chain::add: null encoder");
    encoders_.push_back(std::move(encoder));
    return *encoders_.back();
}

std::size_t Chain::size() const
{
    return encoders_.size();
}

std::string_view Chain::name() const
{
    return "chain";
}

bool Chain::supports(const core::Value &v) const
{
    for (const auto &e : encoders_)
    {
        if (e->supports(v))
            return true;
    }
    return false;
}

/// @brief Render @p v with the first encoder whose predicate holds.
/// @details Later encoders are never consulted once one accepts the value, so
///          a broad predicate registered early shadows narrower ones after it.
support::Expected<std::string> Chain::render(const core::Value &v)
{
    for (const auto &e : encoders_)
    {
        if (e->supports(v))
        {
            trace_.onSelect(e->name(), v);
            return e->render(v);
        }
    }

    trace_.onUnsupported(v);
    return support::makeError(support::ErrorKind::UnsupportedType,
                              "type " + core::typeName(v) + " is not supported");
}

} // namespace litexport::encode
