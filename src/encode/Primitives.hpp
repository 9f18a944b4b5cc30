//===----------------------------------------------------------------------===//
//
// Part of the litexport project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/Primitives.hpp
// Purpose: Declares the leaf encoders for booleans, the absent value,
//          numbers, text and UTF-8 byte sequences.
// Key invariants: None of these encoders accepts a value of a named type.
// Ownership/Lifetime: Stateless apart from NumberEncoder's tagging flag.
// Links: DESIGN.md#encode
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/Encoder.hpp"

namespace litexport::encode
{

/// @brief Renders `true` / `false`.
class BoolEncoder final : public Encoder
{
  public:
    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;
};

/// @brief Renders the absent value as `nil`.
class AbsentEncoder final : public Encoder
{
  public:
    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;
};

/// @brief Renders integers and floats, optionally as `kind(value)`.
class NumberEncoder final : public Encoder
{
  public:
    /// @param explicitType Wrap the digits with the lowercase kind name.
    explicit NumberEncoder(bool explicitType);

    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;

  private:
    bool explicitType_;
};

/// @brief Renders text as an escaped double-quoted literal.
class TextEncoder final : public Encoder
{
  public:
    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;
};

/// @brief Renders a `[]uint8` holding valid UTF-8 as `[]byte("...")`.
/// @details Other byte sequences are left to the composite encoder, which
///          prints them element by element.
class BytesEncoder final : public Encoder
{
  public:
    std::string_view name() const override;
    bool supports(const core::Value &v) const override;
    support::Expected<std::string> render(const core::Value &v) override;
};

} // namespace litexport::encode
