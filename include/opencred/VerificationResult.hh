// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef OPENCRED_VERIFICATION_RESULT_HH
#define OPENCRED_VERIFICATION_RESULT_HH

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "utils/Enum.hh"

namespace opencred
{
  enum class SignatureType
  {
    GraphSignature2012,
    LinkedDataSignature2015,
    Unknown,
  };

  /// Checks in evaluation order.
  enum class CheckName
  {
    Signed,
    PublicKeyAccessible,
    PublicKeyOwner,
    KnownSignatureType,
    PublicKeyNotRevoked,
    SignatureVerified,
    NotExpired,
  };

  /// Pipeline stages that record errors.
  enum class ErrorStage
  {
    Data,
    PublicKey,
    PublicKeyOwner,
    Normalization,
    Signature,
    Compact,
  };

  struct Signature
  {
    std::string type;
    SignatureType signature_type{SignatureType::Unknown};
    std::string creator;
    std::optional<std::string> created;
    std::optional<std::string> nonce;
    std::optional<std::string> domain;
    std::string signature_value;
  };

  struct VerificationError
  {
    std::error_code code;
    std::string message;
  };

  /**
   * @brief Ordered set of named boolean check results.
   *
   * Entries are kept in CheckName order regardless of the order in which they
   * are set. A check that was never evaluated is absent, which is distinct
   * from a check that evaluated to false.
   */
  class CheckResults
  {
  public:
    using entry_t = std::pair<CheckName, bool>;

    void set(CheckName name, bool value);
    std::optional<bool> get(CheckName name) const;
    bool contains(CheckName name) const;

    bool empty() const;
    std::size_t size() const;
    const std::vector<entry_t> &entries() const;

    /// True iff the credential is signed and none of the evaluated checks failed.
    bool verified() const;

    bool operator==(const CheckResults &other) const = default;

  private:
    std::vector<entry_t> checks;
  };

  class ErrorMap
  {
  public:
    using entry_t = std::pair<ErrorStage, VerificationError>;

    void set(ErrorStage stage, VerificationError error);
    const VerificationError *find(ErrorStage stage) const;
    bool contains(ErrorStage stage) const;

    bool empty() const;
    std::size_t size() const;
    const std::vector<entry_t> &entries() const;

  private:
    std::vector<entry_t> errors;
  };

  /// Parameters gathered and derived during a single verification.
  struct ParameterBundle
  {
    std::optional<boost::json::object> data;
    std::optional<Signature> signature;
    std::optional<boost::json::object> public_key;
    std::optional<boost::json::object> identity;
    std::optional<std::string> normalized;
    std::optional<std::string> signed_data;
    bool has_expiration{false};
    std::optional<std::chrono::sys_seconds> expiration;
    std::optional<boost::json::value> verified_data;
  };

  struct VerificationResult
  {
    ParameterBundle params;
    CheckResults tests;
    ErrorMap errors;

    bool verified() const
    {
      return tests.verified();
    }
  };

  SignatureType signature_type_from_string(std::string_view type);

  /// Report form of a result: {"params": {...}, "tests": {..., "verified": b}, "errors": {...}}.
  boost::json::value to_json(const VerificationResult &result);

} // namespace opencred

template<>
struct opencred::utils::enum_traits<opencred::SignatureType>
{
  static constexpr auto min = opencred::SignatureType::GraphSignature2012;
  static constexpr auto max = opencred::SignatureType::Unknown;
  static constexpr auto linear = true;
  static constexpr auto invalid = opencred::SignatureType::Unknown;

  static constexpr std::array<std::pair<std::string_view, opencred::SignatureType>, 2> names{
    {{"GraphSignature2012", opencred::SignatureType::GraphSignature2012},
     {"LinkedDataSignature2015", opencred::SignatureType::LinkedDataSignature2015}}};
};

template<>
struct opencred::utils::enum_traits<opencred::CheckName>
{
  static constexpr auto min = opencred::CheckName::Signed;
  static constexpr auto max = opencred::CheckName::NotExpired;
  static constexpr auto linear = true;

  static constexpr std::array<std::pair<std::string_view, opencred::CheckName>, 7> names{
    {{"signed", opencred::CheckName::Signed},
     {"publicKeyAccessible", opencred::CheckName::PublicKeyAccessible},
     {"publicKeyOwner", opencred::CheckName::PublicKeyOwner},
     {"knownSignatureType", opencred::CheckName::KnownSignatureType},
     {"publicKeyNotRevoked", opencred::CheckName::PublicKeyNotRevoked},
     {"signatureVerified", opencred::CheckName::SignatureVerified},
     {"notExpired", opencred::CheckName::NotExpired}}};
};

template<>
struct opencred::utils::enum_traits<opencred::ErrorStage>
{
  static constexpr auto min = opencred::ErrorStage::Data;
  static constexpr auto max = opencred::ErrorStage::Compact;
  static constexpr auto linear = true;

  static constexpr std::array<std::pair<std::string_view, opencred::ErrorStage>, 6> names{
    {{"data", opencred::ErrorStage::Data},
     {"publicKey", opencred::ErrorStage::PublicKey},
     {"publicKeyOwner", opencred::ErrorStage::PublicKeyOwner},
     {"normalization", opencred::ErrorStage::Normalization},
     {"signature", opencred::ErrorStage::Signature},
     {"compact", opencred::ErrorStage::Compact}}};
};

#endif // OPENCRED_VERIFICATION_RESULT_HH
