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

#ifndef OPENCRED_JSONLD_DOCUMENT_LOADER_HH
#define OPENCRED_JSONLD_DOCUMENT_LOADER_HH

#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace opencred::jsonld
{
  /**
   * @brief A document retrieved by a DocumentLoader.
   *
   * The document is either already parsed, or a JSON string holding the raw
   * body that still needs to be parsed by the caller.
   */
  struct RemoteDocument
  {
    std::string document_url;
    boost::json::value document;
  };

  class DocumentLoader
  {
  public:
    virtual ~DocumentLoader() = default;

    virtual boost::asio::awaitable<outcome::std_result<RemoteDocument>> load(std::string url) = 0;
  };
} // namespace opencred::jsonld

#endif // OPENCRED_JSONLD_DOCUMENT_LOADER_HH
