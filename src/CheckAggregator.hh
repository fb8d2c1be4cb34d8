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

#ifndef OPENCRED_CHECK_AGGREGATOR_HH
#define OPENCRED_CHECK_AGGREGATOR_HH

#include <chrono>
#include <memory>
#include <optional>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "crypto/CryptoProvider.hh"
#include "crypto/CryptographicAlgorithms.hh"
#include "jsonld/JsonUtils.hh"
#include "opencred/VerificationResult.hh"
#include "utils/Logging.hh"
#include "utils/TimeSource.hh"

#include "CredentialSignatureVerifier.hh"

namespace opencred
{
  /**
   * Evaluates the checks of a signed credential from the assembled
   * parameters. Checks whose precondition was not reached are left unset.
   */
  class CheckAggregator
  {
  public:
    CheckAggregator(std::shared_ptr<crypto::CryptoProvider> crypto_provider,
                    crypto::DigestAlgorithm digest_algorithm,
                    std::shared_ptr<utils::TimeSource> time_source);

    void evaluate(ParameterBundle &params, CheckResults &tests, ErrorMap &errors) const;

  private:
    bool is_public_key_owner(const ParameterBundle &params) const;
    bool is_not_revoked(const ParameterBundle &params) const;
    bool verify_signature(ParameterBundle &params, ErrorMap &errors) const;
    bool is_not_expired(ParameterBundle &params) const;

    std::optional<std::chrono::sys_seconds> parse_expiration(const boost::json::value &expires) const;

  private:
    CredentialSignatureVerifier signature_verifier;
    std::shared_ptr<utils::TimeSource> time_source;
    jsonld::JsonUtils json_utils;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:checks")};
  };
} // namespace opencred

#endif // OPENCRED_CHECK_AGGREGATOR_HH
