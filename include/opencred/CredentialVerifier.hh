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

#ifndef OPENCRED_CREDENTIAL_VERIFIER_HH
#define OPENCRED_CREDENTIAL_VERIFIER_HH

#include <memory>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "opencred/CredentialErrors.hh"
#include "opencred/VerificationResult.hh"
#include "opencred/VerifierOptions.hh"

namespace outcome = boost::outcome_v2;

namespace opencred
{
  /**
   * @brief Verifies signed linked-data credentials.
   *
   * A verifier holds only immutable configuration. Concurrent verifications
   * on the same instance are independent.
   */
  class CredentialVerifier
  {
  public:
    CredentialVerifier() = default;
    virtual ~CredentialVerifier() = default;

    /**
     * @brief Creates a verifier.
     *
     * @param options Collaborators and settings.
     * @return The verifier, or CredentialErrc::InvalidConfiguration when a
     *         required collaborator is missing.
     */
    static outcome::std_result<std::shared_ptr<CredentialVerifier>> create(VerifierOptions options);

    /**
     * @brief Verifies a credential.
     *
     * Resolves the signer's public key and identity, rebuilds the signed data,
     * checks the signature and evaluates ownership, revocation and expiration.
     * Never throws: every failure is recorded in the returned result.
     *
     * @param credential The credential document, or a JSON string holding its URL.
     * @return The parameters used, the checks that were evaluated and the
     *         errors that were encountered.
     */
    virtual boost::asio::awaitable<VerificationResult> verify_credential(boost::json::value credential) = 0;
  };
} // namespace opencred

#endif // OPENCRED_CREDENTIAL_VERIFIER_HH
