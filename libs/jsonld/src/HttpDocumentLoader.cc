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

#include "jsonld/HttpDocumentLoader.hh"

#include <utility>

#include "http/HttpClientErrors.hh"
#include "jsonld/JsonLdErrors.hh"

using namespace opencred::jsonld;

HttpDocumentLoader::HttpDocumentLoader(std::shared_ptr<opencred::http::HttpClient> http)
  : http(std::move(http))
{
}

boost::asio::awaitable<outcome::std_result<RemoteDocument>>
HttpDocumentLoader::load(std::string url)
{
  logger->debug("loading {}", url);

  auto rc = co_await http->get(url);
  if (!rc)
    {
      logger->error("failed to load {} ({})", url, rc.error().message());
      if (rc.error() == opencred::http::HttpClientErrc::InsecureURL)
        {
          co_return JsonLdErrc::InsecureUrl;
        }
      co_return JsonLdErrc::LoadingDocumentFailed;
    }

  auto [status, body] = rc.value();
  if (status != 200)
    {
      logger->error("failed to load {} (HTTP status {})", url, status);
      co_return JsonLdErrc::LoadingDocumentFailed;
    }

  if (body.empty())
    {
      logger->error("failed to load {} (empty document)", url);
      co_return JsonLdErrc::InvalidDocument;
    }

  co_return RemoteDocument{url, boost::json::value(body)};
}
