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

#include "crypto/PublicKey.hh"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/rsa.h>
#include <openssl/evp.h>
#include <openssl/err.h>

#include "crypto/CryptoErrors.hh"

namespace opencred::crypto
{
  const EVP_MD *to_evp_md(DigestAlgorithm digest_algorithm)
  {
    switch (digest_algorithm)
      {
      case DigestAlgorithm::SHA256:
        return EVP_sha256();
      case DigestAlgorithm::SHA384:
        return EVP_sha384();
      case DigestAlgorithm::SHA512:
        return EVP_sha512();
      case DigestAlgorithm::SHA1:
        return EVP_sha1();
      }
    return nullptr;
  }

  PublicKey::PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key)
    : evp_key_(std::move(evp_key))
  {
  }

  outcome::std_result<PublicKey> PublicKey::from_pem(const std::string &key_pem)
  {
    if (key_pem.empty())
      {
        return CryptoErrc::InvalidPublicKey;
      }

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(key_pem.data(), static_cast<int>(key_pem.size())), BIO_free);
    if (!bio)
      {
        return CryptoErrc::SystemError;
      }

    EVP_PKEY *key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    ERR_clear_error();
    if (key == nullptr)
      {
        return CryptoErrc::InvalidPublicKey;
      }

    return PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter>(key));
  }

  EVP_PKEY *PublicKey::get() const
  {
    return evp_key_.get();
  }

  KeyAlgorithm PublicKey::get_algorithm() const
  {
    if (!evp_key_)
      {
        return KeyAlgorithm::Unknown;
      }

    int key_type = EVP_PKEY_id(evp_key_.get());
    switch (key_type)
      {
      case EVP_PKEY_RSA:
        return KeyAlgorithm::RSA;
      case EVP_PKEY_EC:
        return KeyAlgorithm::ECDSA;
      case EVP_PKEY_ED25519:
      case EVP_PKEY_ED448:
        return KeyAlgorithm::EdDSA;
      default:
        return KeyAlgorithm::Unknown;
      }
  }

  int PublicKey::get_key_size_bits() const
  {
    if (!evp_key_)
      {
        return -1;
      }

    return EVP_PKEY_get_bits(evp_key_.get());
  }

  std::string PublicKey::get_algorithm_name() const
  {
    switch (get_algorithm())
      {
      case KeyAlgorithm::RSA:
        return "RSA";
      case KeyAlgorithm::ECDSA:
        return "ECDSA";
      case KeyAlgorithm::EdDSA:
        return "EdDSA";
      case KeyAlgorithm::Unknown:
      default:
        return "Unknown";
      }
  }

  outcome::std_result<bool> PublicKey::verify_digest(const std::string &digest,
                                                     const std::string &signature,
                                                     DigestAlgorithm digest_algorithm) const
  {
    if (!evp_key_)
      {
        logger_->error("Cannot verify signature: no public key loaded");
        return CryptoErrc::InvalidPublicKey;
      }

    if (get_algorithm() == KeyAlgorithm::EdDSA)
      {
        logger_->error("EdDSA keys cannot verify a precomputed digest");
        return CryptoErrc::UnsupportedAlgorithm;
      }

    const EVP_MD *md = to_evp_md(digest_algorithm);
    if (md == nullptr)
      {
        logger_->error("Unsupported digest algorithm");
        return CryptoErrc::UnsupportedAlgorithm;
      }

    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new(evp_key_.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx)
      {
        logger_->error("Failed to create EVP_PKEY_CTX");
        return CryptoErrc::SystemError;
      }

    if (EVP_PKEY_verify_init(ctx.get()) != 1)
      {
        logger_->error("Failed to initialize signature verification");
        return CryptoErrc::SystemError;
      }

    if (get_algorithm() == KeyAlgorithm::RSA && EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1)
      {
        logger_->error("Failed to select PKCS#1 v1.5 padding");
        return CryptoErrc::SystemError;
      }

    if (EVP_PKEY_CTX_set_signature_md(ctx.get(), md) != 1)
      {
        logger_->error("Failed to set signature digest");
        return CryptoErrc::SystemError;
      }

    const auto *sig_data = reinterpret_cast<const unsigned char *>(signature.data());
    const auto *digest_data = reinterpret_cast<const unsigned char *>(digest.data());
    int result = EVP_PKEY_verify(ctx.get(), sig_data, signature.size(), digest_data, digest.size());
    if (result == 1)
      {
        logger_->debug("Signature verification successful");
        return true;
      }

    unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (result == 0)
      {
        logger_->debug("Signature verification failed: signature does not match");
        return false;
      }

    logger_->error("Signature verification failed with error: {} {}", result, ERR_error_string(err, nullptr));
    return CryptoErrc::InvalidSignature;
  }

  outcome::std_result<bool> PublicKey::verify_signature(std::string_view data,
                                                        const std::string &signature,
                                                        DigestAlgorithm digest_algorithm) const
  {
    if (!evp_key_)
      {
        logger_->error("Cannot verify signature: no public key loaded");
        return CryptoErrc::InvalidPublicKey;
      }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
      {
        logger_->error("Failed to create EVP_MD_CTX");
        return CryptoErrc::SystemError;
      }

    const EVP_MD *md = get_algorithm() == KeyAlgorithm::EdDSA ? nullptr : to_evp_md(digest_algorithm);
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, evp_key_.get()) != 1)
      {
        logger_->error("Failed to initialize digest verification");
        return CryptoErrc::SystemError;
      }

    const auto *sig_data = reinterpret_cast<const unsigned char *>(signature.data());
    const auto *content_data = reinterpret_cast<const unsigned char *>(data.data());
    int result = EVP_DigestVerify(ctx.get(), sig_data, signature.size(), content_data, data.size());
    if (result == 1)
      {
        return true;
      }

    ERR_clear_error();
    if (result == 0)
      {
        logger_->debug("Signature verification failed: signature does not match");
        return false;
      }

    logger_->error("Signature verification failed with error: {}", result);
    return CryptoErrc::InvalidSignature;
  }

} // namespace opencred::crypto
