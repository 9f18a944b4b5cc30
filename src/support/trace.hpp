// File: src/support/trace.hpp
// Purpose: Declare tracing configuration and sink for encoder selection and
//          recursion steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value; the stream is
//                     borrowed and must outlive the sink.
// Links: DESIGN.md#support
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string_view>

namespace litexport::core
{
struct Value;
} // namespace litexport::core

namespace litexport::support
{

/// @brief Configuration for export tracing.
struct TraceConfig
{
    /// @brief Emit trace lines when true.
    bool enabled = false;

    /// @brief Destination stream; standard error when null.
    std::ostream *os = nullptr;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Check whether tracing is enabled.
    bool enabled() const;

    /// @brief Record that @p v entered the render stack at @p depth.
    void onEnter(std::size_t depth, const core::Value &v) const;

    /// @brief Record that @p v was rejected because it is already on the stack.
    void onLoop(std::size_t depth, const core::Value &v) const;

    /// @brief Record that encoder @p encoder was selected for @p v.
    void onSelect(std::string_view encoder, const core::Value &v) const;

    /// @brief Record that no encoder accepted @p v.
    void onUnsupported(const core::Value &v) const;

  private:
    void line(std::string_view text) const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace litexport::support
