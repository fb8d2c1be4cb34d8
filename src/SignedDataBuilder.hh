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

#ifndef OPENCRED_SIGNED_DATA_BUILDER_HH
#define OPENCRED_SIGNED_DATA_BUILDER_HH

#include <optional>
#include <string>

#include "jsonld/Normalizer.hh"
#include "opencred/VerificationResult.hh"

namespace opencred
{
  class SignedDataBuilder
  {
  public:
    static constexpr const char *CREATED_HEADER = "http://purl.org/dc/elements/1.1/created";
    static constexpr const char *DOMAIN_HEADER = "https://w3id.org/security#domain";
    static constexpr const char *NONCE_HEADER = "https://w3id.org/security#nonce";

    static jsonld::NormalizationAlgorithm normalization_algorithm(SignatureType type);

    // Returns the string that was signed, or nothing for unknown signature types.
    static std::optional<std::string> build(const Signature &signature, const std::string &normalized);

  private:
    static std::string build_graph_signature_2012(const Signature &signature, const std::string &normalized);
    static std::string build_linked_data_signature_2015(const Signature &signature, const std::string &normalized);
  };
} // namespace opencred

#endif // OPENCRED_SIGNED_DATA_BUILDER_HH
