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

#ifndef OPENCRED_JSONLD_HTTP_DOCUMENT_LOADER_HH
#define OPENCRED_JSONLD_HTTP_DOCUMENT_LOADER_HH

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "utils/Logging.hh"

#include "jsonld/DocumentLoader.hh"

namespace opencred::jsonld
{
  // Loads documents over HTTP(S). The body is returned unparsed.
  class HttpDocumentLoader : public DocumentLoader
  {
  public:
    explicit HttpDocumentLoader(std::shared_ptr<opencred::http::HttpClient> http);

    boost::asio::awaitable<outcome::std_result<RemoteDocument>> load(std::string url) override;

  private:
    std::shared_ptr<opencred::http::HttpClient> http;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:jsonld:loader")};
  };
} // namespace opencred::jsonld

#endif // OPENCRED_JSONLD_HTTP_DOCUMENT_LOADER_HH
