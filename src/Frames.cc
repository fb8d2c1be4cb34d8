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

#include "Frames.hh"

#include <utility>

namespace opencred::frames
{
  boost::json::object signed_object(const std::string &context)
  {
    boost::json::object frame;
    frame["@context"] = context;
    frame["signature"] = boost::json::object{{"@embed", true}};
    return frame;
  }

  boost::json::object public_key(const std::string &context)
  {
    boost::json::object frame;
    frame["@context"] = context;
    frame["type"] = "CryptographicKey";
    frame["owner"] = boost::json::object{{"@embed", false}};
    frame["publicKeyPem"] = boost::json::object{};
    return frame;
  }

  boost::json::object identity(const std::string &context)
  {
    boost::json::object frame;
    frame["@context"] = context;
    frame["type"] = "Identity";
    boost::json::object public_key;
    public_key["@embed"] = false;
    public_key["@default"] = boost::json::array{};
    frame["publicKey"] = std::move(public_key);
    return frame;
  }

  std::vector<boost::json::object> identity_candidates(const std::string &context)
  {
    return {identity(context), identity(OPENBADGES_CONTEXT)};
  }
} // namespace opencred::frames
