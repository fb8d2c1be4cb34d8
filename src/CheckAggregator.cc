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

#include "CheckAggregator.hh"

#include <utility>

#include <fmt/format.h>

#include "opencred/CredentialErrors.hh"
#include "utils/DateUtils.hh"

#include "SignedDataBuilder.hh"

using namespace opencred;

CheckAggregator::CheckAggregator(std::shared_ptr<crypto::CryptoProvider> crypto_provider,
                                 crypto::DigestAlgorithm digest_algorithm,
                                 std::shared_ptr<utils::TimeSource> time_source)
  : signature_verifier(std::move(crypto_provider), digest_algorithm)
  , time_source(std::move(time_source))
{
}

void
CheckAggregator::evaluate(ParameterBundle &params, CheckResults &tests, ErrorMap &errors) const
{
  tests.set(CheckName::PublicKeyAccessible, params.public_key.has_value());
  tests.set(CheckName::PublicKeyOwner, is_public_key_owner(params));

  const bool known_type = params.signature && params.signature->signature_type != SignatureType::Unknown;
  tests.set(CheckName::KnownSignatureType, known_type);

  if (params.public_key)
    {
      tests.set(CheckName::PublicKeyNotRevoked, is_not_revoked(params));
    }

  if (known_type)
    {
      tests.set(CheckName::SignatureVerified, verify_signature(params, errors));
    }
  else
    {
      logger->warn("unknown signature type '{}'", params.signature ? params.signature->type : "");
    }

  tests.set(CheckName::NotExpired, is_not_expired(params));
}

bool
CheckAggregator::is_public_key_owner(const ParameterBundle &params) const
{
  if (!params.public_key || !params.identity)
    {
      return false;
    }

  auto key_id = json_utils.node_id(*params.public_key);
  if (!key_id)
    {
      logger->warn("public key has no id");
      return false;
    }

  for (const auto &value: json_utils.get_values(*params.identity, "publicKey"))
    {
      if (json_utils.node_id(value) == key_id)
        {
          return true;
        }
    }

  logger->warn("public key {} is not listed by its owner", *key_id);
  return false;
}

bool
CheckAggregator::is_not_revoked(const ParameterBundle &params) const
{
  if (json_utils.has_property(*params.public_key, "revoked"))
    {
      logger->warn("public key is revoked");
      return false;
    }
  return true;
}

bool
CheckAggregator::verify_signature(ParameterBundle &params, ErrorMap &errors) const
{
  if (!params.public_key || !params.normalized)
    {
      return false;
    }

  params.signed_data = SignedDataBuilder::build(*params.signature, *params.normalized);
  if (!params.signed_data)
    {
      return false;
    }

  auto pem = json_utils.extract_string(*params.public_key, "publicKeyPem");
  if (!pem)
    {
      logger->error("public key has no PEM encoding");
      errors.set(ErrorStage::Signature, {CredentialErrc::SignatureVerificationFailed, "public key has no PEM encoding"});
      return false;
    }

  auto rc = signature_verifier.verify(*pem, *params.signed_data, params.signature->signature_value);
  if (!rc)
    {
      if (rc.error() == CredentialErrc::SignatureMismatch)
        {
          errors.set(ErrorStage::Signature, {rc.error(), "signature value incorrect"});
        }
      else
        {
          errors.set(ErrorStage::Signature,
                     {CredentialErrc::SignatureVerificationFailed,
                      fmt::format("failed to verify signature ({})", rc.error().message())});
        }
      return false;
    }
  return true;
}

bool
CheckAggregator::is_not_expired(ParameterBundle &params) const
{
  const auto *expires = params.data ? params.data->if_contains("expires") : nullptr;
  if (expires == nullptr)
    {
      return true;
    }

  params.has_expiration = true;
  params.expiration = parse_expiration(*expires);
  if (!params.expiration)
    {
      logger->warn("invalid expiration date {}", boost::json::serialize(*expires));
      return false;
    }

  if (*params.expiration <= std::chrono::floor<std::chrono::seconds>(time_source->now()))
    {
      logger->info("credential expired");
      return false;
    }
  return true;
}

std::optional<std::chrono::sys_seconds>
CheckAggregator::parse_expiration(const boost::json::value &expires) const
{
  if (expires.is_string())
    {
      return utils::DateUtils::try_parse_time_point(std::string(expires.as_string()));
    }

  // Milliseconds since the epoch.
  if (expires.is_int64() || expires.is_uint64() || expires.is_double())
    {
      return utils::DateUtils::from_epoch_milliseconds(expires.to_number<double>());
    }

  if (const auto *literal = expires.is_object() ? expires.as_object().if_contains("@value") : nullptr)
    {
      return parse_expiration(*literal);
    }
  return {};
}
