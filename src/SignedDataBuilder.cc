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

#include "SignedDataBuilder.hh"

#include <array>
#include <utility>

using namespace opencred;

jsonld::NormalizationAlgorithm
SignedDataBuilder::normalization_algorithm(SignatureType type)
{
  switch (type)
    {
    case SignatureType::GraphSignature2012:
      return jsonld::NormalizationAlgorithm::URGNA2012;
    case SignatureType::LinkedDataSignature2015:
      return jsonld::NormalizationAlgorithm::URDNA2015;
    case SignatureType::Unknown:
      break;
    }
  return jsonld::NormalizationAlgorithm::Default;
}

std::optional<std::string>
SignedDataBuilder::build(const Signature &signature, const std::string &normalized)
{
  switch (signature.signature_type)
    {
    case SignatureType::GraphSignature2012:
      return build_graph_signature_2012(signature, normalized);
    case SignatureType::LinkedDataSignature2015:
      return build_linked_data_signature_2015(signature, normalized);
    case SignatureType::Unknown:
      break;
    }
  return {};
}

std::string
SignedDataBuilder::build_graph_signature_2012(const Signature &signature, const std::string &normalized)
{
  std::string data;
  if (signature.nonce)
    {
      data += *signature.nonce;
    }
  data += signature.created.value_or("");
  data += normalized;
  return data;
}

std::string
SignedDataBuilder::build_linked_data_signature_2015(const Signature &signature, const std::string &normalized)
{
  // Lexicographical header order.
  const std::array<std::pair<const char *, const std::optional<std::string> &>, 3> headers{{
    {CREATED_HEADER, signature.created},
    {DOMAIN_HEADER, signature.domain},
    {NONCE_HEADER, signature.nonce},
  }};

  std::string data;
  for (const auto &[uri, value]: headers)
    {
      if (value)
        {
          data += uri;
          data += ": ";
          data += *value;
          data += "\n";
        }
    }
  data += normalized;
  return data;
}
