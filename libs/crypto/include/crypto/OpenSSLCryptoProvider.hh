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

#ifndef OPENCRED_CRYPTO_OPENSSL_CRYPTO_PROVIDER_HH
#define OPENCRED_CRYPTO_OPENSSL_CRYPTO_PROVIDER_HH

#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

#include "crypto/CryptoProvider.hh"
#include "utils/Logging.hh"

namespace opencred::crypto
{
  class OpenSSLCryptoProvider : public CryptoProvider
  {
  public:
    OpenSSLCryptoProvider() = default;
    ~OpenSSLCryptoProvider() override = default;

    OpenSSLCryptoProvider(const OpenSSLCryptoProvider &) = delete;
    OpenSSLCryptoProvider &operator=(const OpenSSLCryptoProvider &) = delete;
    OpenSSLCryptoProvider(OpenSSLCryptoProvider &&) noexcept = delete;
    OpenSSLCryptoProvider &operator=(OpenSSLCryptoProvider &&) noexcept = delete;

    outcome::std_result<std::shared_ptr<PublicKey>> parse_public_key_pem(const std::string &pem) override;
    outcome::std_result<std::string> digest(DigestAlgorithm algorithm, std::string_view data) override;
    outcome::std_result<bool> verify(const PublicKey &key,
                                     DigestAlgorithm algorithm,
                                     const std::string &digest,
                                     const std::string &signature) override;

  private:
    std::shared_ptr<spdlog::logger> logger_{opencred::utils::Logging::create("opencred:crypto")};
  };
} // namespace opencred::crypto

#endif // OPENCRED_CRYPTO_OPENSSL_CRYPTO_PROVIDER_HH
