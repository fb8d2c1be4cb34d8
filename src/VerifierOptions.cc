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

#include "opencred/VerifierOptions.hh"

#include <utility>

using namespace opencred;

void
VerifierOptions::set_document_loader(std::shared_ptr<jsonld::DocumentLoader> document_loader)
{
  this->document_loader = std::move(document_loader);
}

void
VerifierOptions::set_framer(std::shared_ptr<jsonld::Framer> framer)
{
  this->framer = std::move(framer);
}

void
VerifierOptions::set_normalizer(std::shared_ptr<jsonld::Normalizer> normalizer)
{
  this->normalizer = std::move(normalizer);
}

void
VerifierOptions::set_compactor(std::shared_ptr<jsonld::Compactor> compactor)
{
  this->compactor = std::move(compactor);
}

void
VerifierOptions::set_crypto_provider(std::shared_ptr<crypto::CryptoProvider> crypto_provider)
{
  this->crypto_provider = std::move(crypto_provider);
}

void
VerifierOptions::set_time_source(std::shared_ptr<utils::TimeSource> time_source)
{
  this->time_source = std::move(time_source);
}

void
VerifierOptions::set_disable_local_framing(bool disable_local_framing)
{
  this->disable_local_framing = disable_local_framing;
}

void
VerifierOptions::set_local_base_uri(const std::string &local_base_uri)
{
  this->local_base_uri = local_base_uri;
}

void
VerifierOptions::set_credential_context(const std::string &credential_context)
{
  this->credential_context = credential_context;
}

void
VerifierOptions::set_digest_algorithm(crypto::DigestAlgorithm digest_algorithm)
{
  this->digest_algorithm = digest_algorithm;
}

std::shared_ptr<jsonld::DocumentLoader>
VerifierOptions::get_document_loader() const
{
  return document_loader;
}

std::shared_ptr<jsonld::Framer>
VerifierOptions::get_framer() const
{
  return framer;
}

std::shared_ptr<jsonld::Normalizer>
VerifierOptions::get_normalizer() const
{
  return normalizer;
}

std::shared_ptr<jsonld::Compactor>
VerifierOptions::get_compactor() const
{
  return compactor;
}

std::shared_ptr<crypto::CryptoProvider>
VerifierOptions::get_crypto_provider() const
{
  return crypto_provider;
}

std::shared_ptr<utils::TimeSource>
VerifierOptions::get_time_source() const
{
  return time_source;
}

bool
VerifierOptions::get_disable_local_framing() const
{
  return disable_local_framing;
}

std::string
VerifierOptions::get_local_base_uri() const
{
  return local_base_uri;
}

std::string
VerifierOptions::get_credential_context() const
{
  return credential_context;
}

crypto::DigestAlgorithm
VerifierOptions::get_digest_algorithm() const
{
  return digest_algorithm;
}

bool
VerifierOptions::is_local_framing_disabled() const
{
  return disable_local_framing && !local_base_uri.empty();
}
