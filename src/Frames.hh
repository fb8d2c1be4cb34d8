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

#ifndef OPENCRED_FRAMES_HH
#define OPENCRED_FRAMES_HH

#include <string>
#include <vector>

#include <boost/json.hpp>

namespace opencred::frames
{
  constexpr const char *OPENBADGES_CONTEXT = "https://w3id.org/openbadges/v1";

  // Credential with its signature embedded.
  boost::json::object signed_object(const std::string &context);

  // Public key with its owner as a reference.
  boost::json::object public_key(const std::string &context);

  // Identity with its public keys as references.
  boost::json::object identity(const std::string &context);

  // Identity frames tried in order when framing a key owner.
  std::vector<boost::json::object> identity_candidates(const std::string &context);
} // namespace opencred::frames

#endif // OPENCRED_FRAMES_HH
