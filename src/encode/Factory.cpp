//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements encoder graph construction.  The graph is cyclic by design of
// the recursion: the composite encoder lives inside the chain, the chain
// inside the guard, and the composite renders elements through the guard.
// Ownership runs guard -> chain -> composite; the back edge is a plain
// pointer set once the guard exists.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Encoder graph factory and the per-call exporter.

#include "encode/Factory.hpp"

#include "encode/Chain.hpp"
#include "encode/Composite.hpp"
#include "encode/CycleGuard.hpp"
#include "encode/Primitives.hpp"

#include <utility>

namespace litexport::encode
{

std::unique_ptr<Encoder> buildEncoder(const support::Options &opts)
{
    const support::TraceSink trace(opts.trace);

    auto chain = std::make_unique<Chain>(trace);
    chain->emplace<BoolEncoder>();
    chain->emplace<AbsentEncoder>();
    chain->emplace<NumberEncoder>(opts.explicitTypes);

    if (opts.text)
    {
        chain->emplace<TextEncoder>();
        chain->emplace<BytesEncoder>();
    }

    CompositeEncoder *composite = nullptr;
    if (opts.composites)
        composite = &chain->emplace<CompositeEncoder>();

    auto guard = std::make_unique<CycleGuard>(std::move(chain), trace);
    if (composite)
        composite->bind(*guard);
    return guard;
}

Exporter::Exporter(support::Options opts) : opts_(opts) {}

support::Expected<std::string> Exporter::run(const core::Value &v) const
{
    auto encoder = buildEncoder(opts_);
    return encoder->render(v);
}

bool Exporter::supports(const core::Value &v) const
{
    return buildEncoder(opts_)->supports(v);
}

const support::Options &Exporter::options() const
{
    return opts_;
}

} // namespace litexport::encode
