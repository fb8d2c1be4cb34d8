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

#include "ParameterAssembler.hh"

#include <exception>
#include <utility>

#include <fmt/format.h>

#include "opencred/CredentialErrors.hh"

#include "Frames.hh"
#include "SignedDataBuilder.hh"

using namespace opencred;

ParameterAssembler::ParameterAssembler(std::shared_ptr<DocumentResolver> resolver,
                                       std::shared_ptr<FrameExtractor> extractor,
                                       std::shared_ptr<jsonld::Normalizer> normalizer,
                                       std::string context)
  : resolver(std::move(resolver))
  , extractor(std::move(extractor))
  , normalizer(std::move(normalizer))
  , context(std::move(context))
{
}

boost::asio::awaitable<void>
ParameterAssembler::assemble(boost::json::value credential, ParameterBundle &params, ErrorMap &errors) const
{
  if (!co_await extract_data(std::move(credential), params, errors))
    {
      co_return;
    }

  if (!params.signature)
    {
      logger->info("credential is not signed");
      co_return;
    }

  co_await fetch_public_key(params, errors);
  if (params.public_key)
    {
      co_await fetch_identity(params, errors);
    }

  co_await normalize(params, errors);
}

boost::asio::awaitable<bool>
ParameterAssembler::extract_data(boost::json::value credential, ParameterBundle &params, ErrorMap &errors) const
{
  try
    {
      auto rc = co_await extractor->extract(std::move(credential), frames::signed_object(context));
      if (!rc)
        {
          record_framing(errors, ErrorStage::Data, rc.error(), "unable to extract signed credential");
          co_return false;
        }

      auto data = std::move(rc.value());
      if (const auto *signature = data.if_contains("signature"))
        {
          params.signature = parse_signature(*signature);
          data.erase("signature");
        }
      params.data = std::move(data);
      co_return true;
    }
  catch (std::exception &e)
    {
      logger->error("exception while extracting credential: {}", e.what());
      errors.set(ErrorStage::Data, {CredentialErrc::InternalError, e.what()});
    }
  co_return false;
}

boost::asio::awaitable<void>
ParameterAssembler::fetch_public_key(ParameterBundle &params, ErrorMap &errors) const
{
  const auto &creator = params.signature->creator;
  if (creator.empty())
    {
      record(errors, ErrorStage::PublicKey, CredentialErrc::InvalidCredential, "signature has no creator");
      co_return;
    }

  try
    {
      auto document = co_await resolver->load(creator);
      if (!document)
        {
          record(errors, ErrorStage::PublicKey, document.error(), fmt::format("unable to retrieve public key {}", creator));
          co_return;
        }

      auto key = co_await extractor->extract(std::move(document.value()), frames::public_key(context));
      if (!key)
        {
          record_framing(errors, ErrorStage::PublicKey, key.error(), fmt::format("unable to frame public key {}", creator));
          co_return;
        }

      logger->debug("retrieved public key {}", creator);
      params.public_key = std::move(key.value());
    }
  catch (std::exception &e)
    {
      logger->error("exception while retrieving public key: {}", e.what());
      errors.set(ErrorStage::PublicKey, {CredentialErrc::InternalError, e.what()});
    }
}

boost::asio::awaitable<void>
ParameterAssembler::fetch_identity(ParameterBundle &params, ErrorMap &errors) const
{
  std::optional<std::string> owner;
  if (const auto *value = params.public_key->if_contains("owner"))
    {
      owner = json_utils.node_id(*value);
    }

  if (!owner || owner->empty())
    {
      record(errors, ErrorStage::PublicKeyOwner, CredentialErrc::InvalidCredential, "public key has no owner");
      co_return;
    }

  try
    {
      auto document = co_await resolver->load(*owner);
      if (!document)
        {
          record(errors, ErrorStage::PublicKeyOwner, document.error(), fmt::format("unable to retrieve identity {}", *owner));
          co_return;
        }

      std::string failures;
      for (auto &frame: frames::identity_candidates(context))
        {
          std::string frame_context{frame["@context"].as_string()};
          auto identity = co_await extractor->extract(document.value(), std::move(frame));
          if (identity)
            {
              logger->debug("retrieved identity {} using {}", *owner, frame_context);
              params.identity = std::move(identity.value());
              co_return;
            }

          if (!failures.empty())
            {
              failures += "; ";
            }
          failures += fmt::format("{}: {}", frame_context, identity.error().message());
        }

      record(errors, ErrorStage::PublicKeyOwner, CredentialErrc::FramingFailed, fmt::format("unable to frame identity {} ({})", *owner, failures));
    }
  catch (std::exception &e)
    {
      logger->error("exception while retrieving identity: {}", e.what());
      errors.set(ErrorStage::PublicKeyOwner, {CredentialErrc::InternalError, e.what()});
    }
}

boost::asio::awaitable<void>
ParameterAssembler::normalize(ParameterBundle &params, ErrorMap &errors) const
{
  jsonld::NormalizeOptions options;
  options.algorithm = SignedDataBuilder::normalization_algorithm(params.signature->signature_type);

  try
    {
      logger->debug("normalizing claims using {}", utils::enum_to_string(options.algorithm));
      auto rc = co_await normalizer->normalize(*params.data, options);
      if (!rc)
        {
          logger->error("normalization failed ({})", rc.error().message());
          errors.set(ErrorStage::Normalization,
                     {CredentialErrc::NormalizationFailed, fmt::format("unable to normalize credential ({})", rc.error().message())});
          co_return;
        }
      params.normalized = std::move(rc.value());
    }
  catch (std::exception &e)
    {
      logger->error("exception while normalizing credential: {}", e.what());
      errors.set(ErrorStage::Normalization, {CredentialErrc::NormalizationFailed, e.what()});
    }
}

std::optional<Signature>
ParameterAssembler::parse_signature(const boost::json::value &value) const
{
  if (!value.is_object())
    {
      logger->warn("signature is not an object");
      return {};
    }
  const auto &obj = value.as_object();

  Signature signature;
  signature.type = json_utils.extract_string(value, "type").value_or("");
  signature.signature_type = signature_type_from_string(signature.type);
  if (const auto *creator = obj.if_contains("creator"))
    {
      signature.creator = json_utils.node_id(*creator).value_or("");
    }
  signature.created = parse_signature_field(obj, "created");
  signature.nonce = parse_signature_field(obj, "nonce");
  signature.domain = parse_signature_field(obj, "domain");
  signature.signature_value = json_utils.extract_string(value, "signatureValue").value_or("");

  logger->debug("signature type {} by {}", signature.type, signature.creator);
  return signature;
}

std::optional<std::string>
ParameterAssembler::parse_signature_field(const boost::json::object &signature, std::string_view key) const
{
  const auto *value = signature.if_contains(key);
  if (value == nullptr || value->is_null())
    {
      return {};
    }
  if (value->is_string())
    {
      return std::string(value->as_string());
    }
  if (const auto *obj = value->if_object())
    {
      // Typed literal, e.g. {"@value": "...", "@type": "xsd:dateTime"}
      if (const auto *literal = obj->if_contains("@value"); literal != nullptr && literal->is_string())
        {
          return std::string(literal->as_string());
        }
    }
  return boost::json::serialize(*value);
}

void
ParameterAssembler::record(ErrorMap &errors, ErrorStage stage, std::error_code ec, const std::string &what) const
{
  logger->error("{}: {}", what, ec.message());
  errors.set(stage, {ec, fmt::format("{} ({})", what, ec.message())});
}

void
ParameterAssembler::record_framing(ErrorMap &errors, ErrorStage stage, std::error_code ec, const std::string &what) const
{
  if (ec == CredentialErrc::ResolutionFailed)
    {
      record(errors, stage, ec, what);
      return;
    }

  // Keep the framer's reason in the message, report the stage as a framing failure.
  logger->error("{}: {}", what, ec.message());
  errors.set(stage, {CredentialErrc::FramingFailed, fmt::format("{} ({})", what, ec.message())});
}
