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

#ifndef OPENCRED_CREDENTIAL_SIGNATURE_VERIFIER_HH
#define OPENCRED_CREDENTIAL_SIGNATURE_VERIFIER_HH

#include <memory>
#include <string>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "crypto/CryptoProvider.hh"
#include "crypto/CryptographicAlgorithms.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace opencred
{
  class CredentialSignatureVerifier
  {
  public:
    CredentialSignatureVerifier(std::shared_ptr<crypto::CryptoProvider> crypto_provider, crypto::DigestAlgorithm digest_algorithm);

    /**
     * Verifies a base64 encoded signature over @p signed_data.
     *
     * Fails with CredentialErrc::SignatureMismatch when the signature does not
     * match, or with the underlying error when verification could not be
     * performed.
     */
    outcome::std_result<void> verify(const std::string &public_key_pem,
                                     const std::string &signed_data,
                                     const std::string &signature_value) const;

  private:
    std::shared_ptr<crypto::CryptoProvider> crypto_provider;
    crypto::DigestAlgorithm digest_algorithm;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:signature")};
  };
} // namespace opencred

#endif // OPENCRED_CREDENTIAL_SIGNATURE_VERIFIER_HH
