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

#ifndef OPENCRED_TEST_KEY_PAIR_HH
#define OPENCRED_TEST_KEY_PAIR_HH

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "utils/Base64.hh"

// RSA key pair generated at runtime for signing test credentials.
class TestKeyPair
{
public:
  explicit TestKeyPair(int bits = 2048)
    : key_(EVP_RSA_gen(bits), EVP_PKEY_free)
  {
    if (!key_)
      {
        throw std::runtime_error("failed to generate RSA key");
      }
  }

  static TestKeyPair &shared()
  {
    static TestKeyPair pair;
    return pair;
  }

  std::string public_key_pem() const
  {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1)
      {
        throw std::runtime_error("failed to write public key");
      }
    char *data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
  }

  // RSASSA-PKCS1-v1_5 with SHA-256, raw bytes.
  std::string sign(std::string_view data) const
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1)
      {
        throw std::runtime_error("failed to initialize signing");
      }

    size_t sig_len = 0;
    const auto *content = reinterpret_cast<const unsigned char *>(data.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, content, data.size()) != 1)
      {
        throw std::runtime_error("failed to size signature");
      }

    std::string signature(sig_len, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char *>(signature.data()), &sig_len, content, data.size()) != 1)
      {
        throw std::runtime_error("failed to sign");
      }
    signature.resize(sig_len);
    return signature;
  }

  std::string sign_base64(std::string_view data) const
  {
    return opencred::utils::Base64::encode(sign(data));
  }

private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

#endif // OPENCRED_TEST_KEY_PAIR_HH
