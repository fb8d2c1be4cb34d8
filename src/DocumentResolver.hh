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

#ifndef OPENCRED_DOCUMENT_RESOLVER_HH
#define OPENCRED_DOCUMENT_RESOLVER_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "jsonld/DocumentLoader.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace opencred
{
  class DocumentResolver
  {
  public:
    explicit DocumentResolver(std::shared_ptr<jsonld::DocumentLoader> loader);

    // Resolves an inline document or a URL. Inline documents are returned unchanged.
    boost::asio::awaitable<outcome::std_result<boost::json::value>> resolve(const boost::json::value &ref) const;

    boost::asio::awaitable<outcome::std_result<boost::json::value>> load(const std::string &url) const;

  private:
    outcome::std_result<boost::json::value> parse(const std::string &url, const boost::json::string &body) const;

  private:
    std::shared_ptr<jsonld::DocumentLoader> loader;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:resolver")};
  };
} // namespace opencred

#endif // OPENCRED_DOCUMENT_RESOLVER_HH
