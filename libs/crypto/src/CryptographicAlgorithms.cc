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

#include "crypto/CryptographicAlgorithms.hh"

#include <algorithm>
#include <cctype>

#include "crypto/CryptoErrors.hh"

namespace opencred::crypto
{
  outcome::std_result<DigestAlgorithm> digest_algorithm_from_string(const std::string &algorithm_name)
  {
    std::string name = algorithm_name;
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::erase(name, '-');

    if (name == "sha1")
      {
        return DigestAlgorithm::SHA1;
      }
    if (name == "sha256")
      {
        return DigestAlgorithm::SHA256;
      }
    if (name == "sha384")
      {
        return DigestAlgorithm::SHA384;
      }
    if (name == "sha512")
      {
        return DigestAlgorithm::SHA512;
      }
    return CryptoErrc::UnsupportedAlgorithm;
  }

  std::string digest_algorithm_to_string(DigestAlgorithm algorithm)
  {
    switch (algorithm)
      {
      case DigestAlgorithm::SHA1:
        return "sha1";
      case DigestAlgorithm::SHA256:
        return "sha256";
      case DigestAlgorithm::SHA384:
        return "sha384";
      case DigestAlgorithm::SHA512:
        return "sha512";
      }
    return "unknown";
  }

} // namespace opencred::crypto
