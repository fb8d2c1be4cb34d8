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

#ifndef OPENCRED_HTTP_HTTPCLIENT_HH
#define OPENCRED_HTTP_HTTPCLIENT_HH

#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/Options.hh"
#include "http/HttpClientErrors.hh"

namespace outcome = boost::outcome_v2;

namespace opencred::http
{
  using Response = std::pair<int, std::string>;

  class HttpClient
  {
  public:
    virtual ~HttpClient() = default;

    virtual Options &options() = 0;

    // Performs a GET request, following redirects. Non-2xx statuses are
    // returned as a response, not as an error.
    virtual boost::asio::awaitable<outcome::std_result<Response>> get(std::string url) = 0;
  };

  class BeastHttpClient : public HttpClient
  {
  public:
    BeastHttpClient() = default;

    Options &options() override
    {
      return options_;
    }

    boost::asio::awaitable<outcome::std_result<Response>> get(std::string url) override;

  private:
    Options options_;
  };
} // namespace opencred::http

#endif // OPENCRED_HTTP_HTTPCLIENT_HH
