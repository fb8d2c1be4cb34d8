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

#include "VerificationPipeline.hh"

#include <exception>
#include <utility>

#include "crypto/OpenSSLCryptoProvider.hh"
#include "opencred/CredentialErrors.hh"
#include "utils/TimeSource.hh"

using namespace opencred;

outcome::std_result<std::shared_ptr<CredentialVerifier>>
CredentialVerifier::create(VerifierOptions options)
{
  auto logger = opencred::utils::Logging::create("opencred:verifier");

  if (!options.get_document_loader() || !options.get_framer() || !options.get_normalizer() || !options.get_compactor())
    {
      logger->error("document loader, framer, normalizer and compactor are required");
      return CredentialErrc::InvalidConfiguration;
    }

  if (options.get_credential_context().empty())
    {
      logger->error("no credential context");
      return CredentialErrc::InvalidConfiguration;
    }

  if (!options.get_crypto_provider())
    {
      options.set_crypto_provider(std::make_shared<crypto::OpenSSLCryptoProvider>());
    }

  if (!options.get_time_source())
    {
      options.set_time_source(std::make_shared<utils::RealTimeSource>());
    }

  if (options.get_disable_local_framing() && options.get_local_base_uri().empty())
    {
      logger->warn("local framing disabled without a local base URI; framing all documents");
    }

  return std::make_shared<VerificationPipeline>(options);
}

VerificationPipeline::VerificationPipeline(const VerifierOptions &options)
  : resolver(std::make_shared<DocumentResolver>(options.get_document_loader()))
  , extractor(std::make_shared<FrameExtractor>(options.get_framer(),
                                               resolver,
                                               options.is_local_framing_disabled(),
                                               options.get_local_base_uri()))
  , assembler(resolver, extractor, options.get_normalizer(), options.get_credential_context())
  , aggregator(options.get_crypto_provider(), options.get_digest_algorithm(), options.get_time_source())
  , finalizer(options.get_compactor(), options.get_credential_context())
{
}

boost::asio::awaitable<VerificationResult>
VerificationPipeline::verify_credential(boost::json::value credential)
{
  VerificationResult result;

  try
    {
      co_await run(std::move(credential), result);
    }
  catch (std::exception &e)
    {
      logger->error("exception during verification: {}", e.what());
      result.errors.set(ErrorStage::Data, {CredentialErrc::InternalError, e.what()});
    }

  logger->info("credential {}verified ({} checks, {} errors)",
               result.verified() ? "" : "not ",
               result.tests.size(),
               result.errors.size());
  co_return result;
}

boost::asio::awaitable<void>
VerificationPipeline::run(boost::json::value credential, VerificationResult &result) const
{
  co_await assembler.assemble(std::move(credential), result.params, result.errors);

  result.tests.set(CheckName::Signed, result.params.signature.has_value());
  if (!result.params.signature)
    {
      co_return;
    }

  aggregator.evaluate(result.params, result.tests, result.errors);
  co_await finalizer.finalize(result.params, result.errors);
}
