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

#include "CredentialSignatureVerifier.hh"

#include <utility>

#include "crypto/CryptoErrors.hh"
#include "opencred/CredentialErrors.hh"
#include "utils/Base64.hh"

using namespace opencred;

CredentialSignatureVerifier::CredentialSignatureVerifier(std::shared_ptr<crypto::CryptoProvider> crypto_provider,
                                                         crypto::DigestAlgorithm digest_algorithm)
  : crypto_provider(std::move(crypto_provider))
  , digest_algorithm(digest_algorithm)
{
}

outcome::std_result<void>
CredentialSignatureVerifier::verify(const std::string &public_key_pem,
                                    const std::string &signed_data,
                                    const std::string &signature_value) const
{
  auto key = crypto_provider->parse_public_key_pem(public_key_pem);
  if (!key)
    {
      logger->error("failed to parse public key ({})", key.error().message());
      return key.as_failure();
    }

  std::string signature;
  try
    {
      signature = utils::Base64::decode(signature_value);
    }
  catch (utils::Base64Exception &e)
    {
      logger->error("failed to decode signature value ({})", e.what());
      return crypto::CryptoErrc::InvalidSignature;
    }

  auto digest = crypto_provider->digest(digest_algorithm, signed_data);
  if (!digest)
    {
      logger->error("failed to compute digest ({})", digest.error().message());
      return digest.as_failure();
    }

  auto rc = crypto_provider->verify(*key.value(), digest_algorithm, digest.value(), signature);
  if (!rc)
    {
      logger->error("failed to verify signature ({})", rc.error().message());
      return rc.as_failure();
    }

  if (!rc.value())
    {
      logger->info("signature value incorrect");
      return CredentialErrc::SignatureMismatch;
    }

  logger->debug("signature verified");
  return outcome::success();
}
