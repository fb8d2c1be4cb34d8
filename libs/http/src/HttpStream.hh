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

#ifndef OPENCRED_HTTP_HTTPSTREAM_HH
#define OPENCRED_HTTP_HTTPSTREAM_HH

#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/url.hpp>
#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

#include "http/Options.hh"
#include "http/HttpClientErrors.hh"

namespace outcome = boost::outcome_v2;

namespace opencred::http
{
  class HttpStream
  {
  public:
    using request_t = boost::beast::http::request<boost::beast::http::string_body>;
    using response_t = boost::beast::http::response<boost::beast::http::string_body>;
    using secure_stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    using plain_stream_t = boost::beast::tcp_stream;

    explicit HttpStream(opencred::http::Options options);

    boost::asio::awaitable<outcome::std_result<response_t>> execute(std::string url);

  private:
    bool is_redirect(boost::beast::http::status code) const;
    bool is_tls_connection() const;

    outcome::std_result<void> init_certificates();
    outcome::std_result<boost::urls::url> parse_url(const std::string &u);

    bool connect_required() const;
    boost::asio::awaitable<outcome::std_result<void>> connect();
    boost::asio::awaitable<outcome::std_result<void>> encrypt_connection();

    request_t create_request();
    outcome::std_result<bool> handle_redirect(const response_t &response);

    boost::asio::awaitable<outcome::std_result<response_t>> send_receive_request();
    template<typename StreamType>
    boost::asio::awaitable<outcome::std_result<response_t>> send_receive_request(StreamType stream);

    boost::asio::awaitable<void> shutdown();
    template<typename StreamType>
    boost::asio::awaitable<void> shutdown_impl(StreamType stream);

  private:
    static constexpr std::size_t MAX_BODY_SIZE = 4 * 1024 * 1024;

    opencred::http::Options options;
    boost::asio::ssl::context ctx{boost::asio::ssl::context::tlsv12_client};
    std::shared_ptr<plain_stream_t> plain_stream;
    std::shared_ptr<secure_stream_t> secure_stream;
    int redirect_count{0};
    boost::urls::url requested_url;
    std::optional<boost::urls::url> connected_url;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:http:stream")};
  };
} // namespace opencred::http

#endif // OPENCRED_HTTP_HTTPSTREAM_HH
