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

#ifndef OPENCRED_VERIFIER_OPTIONS_HH
#define OPENCRED_VERIFIER_OPTIONS_HH

#include <memory>
#include <string>

#include "crypto/CryptoProvider.hh"
#include "crypto/CryptographicAlgorithms.hh"
#include "jsonld/Compactor.hh"
#include "jsonld/DocumentLoader.hh"
#include "jsonld/Framer.hh"
#include "jsonld/Normalizer.hh"
#include "utils/TimeSource.hh"

namespace opencred
{
  /**
   * @brief Collaborators and settings of a CredentialVerifier.
   *
   * The document loader, framer, normalizer and compactor are required. The
   * crypto provider defaults to OpenSSL and the time source to the system
   * clock.
   */
  class VerifierOptions
  {
  public:
    static constexpr const char *DEFAULT_CREDENTIAL_CONTEXT = "https://w3id.org/credentials/v1";

    VerifierOptions() = default;

    void set_document_loader(std::shared_ptr<jsonld::DocumentLoader> document_loader);
    void set_framer(std::shared_ptr<jsonld::Framer> framer);
    void set_normalizer(std::shared_ptr<jsonld::Normalizer> normalizer);
    void set_compactor(std::shared_ptr<jsonld::Compactor> compactor);
    void set_crypto_provider(std::shared_ptr<crypto::CryptoProvider> crypto_provider);
    void set_time_source(std::shared_ptr<utils::TimeSource> time_source);

    /// Skip framing of documents that live under @p local_base_uri.
    void set_disable_local_framing(bool disable_local_framing);
    void set_local_base_uri(const std::string &local_base_uri);
    void set_credential_context(const std::string &credential_context);
    void set_digest_algorithm(crypto::DigestAlgorithm digest_algorithm);

    std::shared_ptr<jsonld::DocumentLoader> get_document_loader() const;
    std::shared_ptr<jsonld::Framer> get_framer() const;
    std::shared_ptr<jsonld::Normalizer> get_normalizer() const;
    std::shared_ptr<jsonld::Compactor> get_compactor() const;
    std::shared_ptr<crypto::CryptoProvider> get_crypto_provider() const;
    std::shared_ptr<utils::TimeSource> get_time_source() const;

    bool get_disable_local_framing() const;
    std::string get_local_base_uri() const;
    std::string get_credential_context() const;
    crypto::DigestAlgorithm get_digest_algorithm() const;

    /// True when the local framing fast path applies.
    bool is_local_framing_disabled() const;

  private:
    std::shared_ptr<jsonld::DocumentLoader> document_loader;
    std::shared_ptr<jsonld::Framer> framer;
    std::shared_ptr<jsonld::Normalizer> normalizer;
    std::shared_ptr<jsonld::Compactor> compactor;
    std::shared_ptr<crypto::CryptoProvider> crypto_provider;
    std::shared_ptr<utils::TimeSource> time_source;
    bool disable_local_framing{false};
    std::string local_base_uri;
    std::string credential_context{DEFAULT_CREDENTIAL_CONTEXT};
    crypto::DigestAlgorithm digest_algorithm{crypto::DigestAlgorithm::SHA256};
  };
} // namespace opencred

#endif // OPENCRED_VERIFIER_OPTIONS_HH
