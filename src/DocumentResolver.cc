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

#include "DocumentResolver.hh"

#include <utility>

#include "opencred/CredentialErrors.hh"

using namespace opencred;

DocumentResolver::DocumentResolver(std::shared_ptr<jsonld::DocumentLoader> loader)
  : loader(std::move(loader))
{
}

boost::asio::awaitable<outcome::std_result<boost::json::value>>
DocumentResolver::resolve(const boost::json::value &ref) const
{
  if (ref.is_string())
    {
      co_return co_await load(std::string(ref.as_string()));
    }

  if (ref.is_object() || ref.is_array())
    {
      co_return ref;
    }

  logger->error("cannot resolve document of kind {}", boost::json::to_string(ref.kind()));
  co_return CredentialErrc::ResolutionFailed;
}

boost::asio::awaitable<outcome::std_result<boost::json::value>>
DocumentResolver::load(const std::string &url) const
{
  if (url.empty())
    {
      logger->error("cannot load document without URL");
      co_return CredentialErrc::ResolutionFailed;
    }

  auto rc = co_await loader->load(url);
  if (!rc)
    {
      logger->error("failed to load document {} ({})", url, rc.error().message());
      co_return CredentialErrc::ResolutionFailed;
    }

  auto &document = rc.value().document;
  if (document.is_string())
    {
      co_return parse(url, document.as_string());
    }
  co_return std::move(document);
}

outcome::std_result<boost::json::value>
DocumentResolver::parse(const std::string &url, const boost::json::string &body) const
{
  boost::system::error_code ec;
  auto document = boost::json::parse(body, ec);
  if (ec)
    {
      logger->error("failed to parse document {} ({})", url, ec.message());
      return CredentialErrc::ResolutionFailed;
    }
  return document;
}
