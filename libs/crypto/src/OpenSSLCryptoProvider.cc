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

#include "crypto/OpenSSLCryptoProvider.hh"

#include <array>
#include <openssl/evp.h>
#include <openssl/err.h>

#include "crypto/CryptoErrors.hh"

namespace opencred::crypto
{
  outcome::std_result<std::shared_ptr<PublicKey>> OpenSSLCryptoProvider::parse_public_key_pem(const std::string &pem)
  {
    auto key = PublicKey::from_pem(pem);
    if (!key)
      {
        logger_->error("Failed to parse PEM public key: {}", key.error().message());
        return key.error();
      }

    logger_->debug("Loaded {} public key ({} bits)", key.value().get_algorithm_name(), key.value().get_key_size_bits());
    return std::make_shared<PublicKey>(std::move(key.value()));
  }

  outcome::std_result<std::string> OpenSSLCryptoProvider::digest(DigestAlgorithm algorithm, std::string_view data)
  {
    const EVP_MD *md = to_evp_md(algorithm);
    if (md == nullptr)
      {
        logger_->error("Unsupported digest algorithm {}", digest_algorithm_to_string(algorithm));
        return CryptoErrc::UnsupportedAlgorithm;
      }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md_value{};
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md_value.data(), &md_len, md, nullptr) != 1)
      {
        logger_->error("Failed to compute {} digest: {}", digest_algorithm_to_string(algorithm), ERR_error_string(ERR_get_error(), nullptr));
        return CryptoErrc::SystemError;
      }

    return std::string(reinterpret_cast<const char *>(md_value.data()), md_len);
  }

  outcome::std_result<bool> OpenSSLCryptoProvider::verify(const PublicKey &key,
                                                          DigestAlgorithm algorithm,
                                                          const std::string &digest,
                                                          const std::string &signature)
  {
    if (signature.empty())
      {
        logger_->error("Cannot verify an empty signature");
        return CryptoErrc::InvalidSignature;
      }

    return key.verify_digest(digest, signature, algorithm);
  }

} // namespace opencred::crypto
