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

#include "HttpStream.hh"

#include <exception>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <boost/beast/version.hpp>

#include "http/HttpClientErrors.hh"

using namespace opencred::http;

HttpStream::HttpStream(Options options_)
  : options(std::move(options_))
{
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(boost::asio::ssl::verify_peer);
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::execute(std::string url_str)
{
  auto url_rc = parse_url(url_str);
  if (!url_rc)
    {
      co_return url_rc.as_failure();
    }
  requested_url = url_rc.value();

  auto cert_rc = init_certificates();
  if (!cert_rc)
    {
      co_return cert_rc.as_failure();
    }

  outcome::std_result<HttpStream::response_t> response_rc = outcome::success();
  while (true)
    {
      if (connect_required())
        {
          if (connected_url)
            {
              co_await shutdown();
            }

          auto rc = co_await connect();
          if (!rc)
            {
              co_return rc.as_failure();
            }

          if (is_tls_connection())
            {
              rc = co_await encrypt_connection();
              if (!rc)
                {
                  co_return rc.as_failure();
                }
            }
        }

      response_rc = co_await send_receive_request();
      if (!response_rc)
        {
          co_return response_rc.as_failure();
        }

      auto redirect_rc = handle_redirect(response_rc.value());
      if (!redirect_rc)
        {
          co_return redirect_rc.as_failure();
        }

      if (!redirect_rc.value())
        {
          break;
        }
      logger->info("redirecting to {}", requested_url.c_str());
    }

  co_await shutdown();
  co_return response_rc;
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::send_receive_request()
{
  if (is_tls_connection())
    {
      co_return co_await send_receive_request(secure_stream);
    }
  co_return co_await send_receive_request(plain_stream);
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::send_receive_request(StreamType stream)
{
  auto request = create_request();
  boost::system::error_code ec;

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_write(*stream, request, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send HTTP request to '{}' ({})", connected_url->host(), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  boost::beast::flat_buffer buffer;
  boost::beast::http::response_parser<boost::beast::http::string_body> parser;
  parser.body_limit(MAX_BODY_SIZE);

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_read(*stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to read HTTP response from {} ({})", connected_url->host(), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  logger->debug("resp HTTP/{} {}", parser.get().version(), parser.get().result_int());
  for (auto const &field: parser.get())
    {
      logger->debug("resp {}: {}", field.name_string(), field.value());
    }

  co_return parser.release();
}

outcome::std_result<boost::urls::url>
HttpStream::parse_url(const std::string &u)
{
  auto url_rc = boost::urls::parse_uri(u);

  if (!url_rc)
    {
      logger->error("malformed URL '{}' ({})", u, url_rc.error());
      return HttpClientErrc::MalformedURL;
    }
  boost::urls::url url = url_rc.value();

  if (url.scheme() != "https" && url.scheme() != "http")
    {
      logger->error("unsupported scheme in URL '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  if (url.host().empty())
    {
      logger->error("no host in URL '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  if (options.get_secure_only() && url.scheme() != "https")
    {
      logger->error("refusing insecure URL '{}'", u);
      return HttpClientErrc::InsecureURL;
    }

  if (url.port().empty())
    {
      url.set_port(url.scheme() == "https" ? "443" : "80");
    }

  logger->debug("parsed URL {}", url.c_str());
  return url;
}

bool
HttpStream::connect_required() const
{
  return !connected_url || requested_url.host() != connected_url->host() || requested_url.port() != connected_url->port()
         || requested_url.scheme() != connected_url->scheme();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::connect()
{
  auto url = requested_url;
  connected_url.reset();

  auto executor = co_await boost::asio::this_coro::executor;
  plain_stream = std::make_shared<plain_stream_t>(executor);
  secure_stream.reset();

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(url.host(),
                                                 url.port(),
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec)
    {
      logger->error("failed to resolve hostname '{}' ({})", url.host(), ec.message());
      co_return HttpClientErrc::NameResolutionFailed;
    }

  boost::beast::get_lowest_layer(*plain_stream).expires_after(options.get_timeout());
  co_await boost::beast::get_lowest_layer(*plain_stream)
    .async_connect(results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to connect to '{}:{}' ({})", url.host(), url.port(), ec.message());
      co_return HttpClientErrc::ConnectionRefused;
    }
  connected_url = url;
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::encrypt_connection()
{
  secure_stream = std::make_shared<secure_stream_t>(plain_stream->release_socket(), ctx);
  plain_stream.reset();

  std::string host = connected_url->host();
  if (!SSL_set_tlsext_host_name(secure_stream->native_handle(), host.c_str()))
    {
      logger->error("failed to set TLS hostname");
      co_return HttpClientErrc::InternalError;
    }
  secure_stream->set_verify_callback(boost::asio::ssl::host_name_verification(host));

  boost::system::error_code ec;

  boost::beast::get_lowest_layer(*secure_stream).expires_after(options.get_timeout());
  co_await secure_stream->async_handshake(boost::asio::ssl::stream_base::client,
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to perform TLS handshake with '{}' ({})", host, ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  co_return outcome::success();
}

HttpStream::request_t
HttpStream::create_request()
{
  std::string target = requested_url.encoded_resource();
  if (target.empty())
    {
      target = "/";
    }

  constexpr auto http_version = 11;
  request_t req;
  req.method(boost::beast::http::verb::get);
  req.target(target);
  req.version(http_version);
  req.keep_alive(true);
  req.set(boost::beast::http::field::host, requested_url.host());
  req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(boost::beast::http::field::accept, options.get_accept());
  req.prepare_payload();

  logger->debug("req HTTP/{} {}", req.version(), req.target());
  return req;
}

outcome::std_result<bool>
HttpStream::handle_redirect(const response_t &response)
{
  if (!is_redirect(response.result()) || !options.get_follow_redirects())
    {
      return false;
    }

  redirect_count++;
  if (redirect_count > options.get_max_redirects())
    {
      logger->error("too many redirects");
      return HttpClientErrc::TooManyRedirects;
    }

  std::string location{response.base()[boost::beast::http::field::location]};
  if (location.empty())
    {
      logger->error("no Location header in redirect response from {}", connected_url->host());
      return HttpClientErrc::InvalidRedirect;
    }

  auto ref_rc = boost::urls::parse_uri_reference(location);
  if (!ref_rc)
    {
      logger->error("malformed redirect URL '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }

  boost::urls::url target;
  auto resolve_rc = boost::urls::resolve(requested_url, ref_rc.value(), target);
  if (!resolve_rc)
    {
      logger->error("cannot resolve redirect URL '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }

  auto url_rc = parse_url(std::string(target.buffer()));
  if (!url_rc)
    {
      if (url_rc.error() == HttpClientErrc::InsecureURL)
        {
          return url_rc.as_failure();
        }
      return HttpClientErrc::InvalidRedirect;
    }

  requested_url = std::move(url_rc.value());
  return true;
}

template<>
boost::asio::awaitable<void>
HttpStream::shutdown_impl<std::shared_ptr<HttpStream::secure_stream_t>>(std::shared_ptr<secure_stream_t> stream)
{
  boost::system::error_code ec;
  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await stream->async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated)
    {
      logger->debug("TLS shutdown failed ({})", ec.message());
    }
  boost::beast::get_lowest_layer(*stream).close();
}

template<>
boost::asio::awaitable<void>
HttpStream::shutdown_impl<std::shared_ptr<HttpStream::plain_stream_t>>(std::shared_ptr<plain_stream_t> stream)
{
  boost::system::error_code ec;
  stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream->socket().close(ec);
  co_return;
}

boost::asio::awaitable<void>
HttpStream::shutdown()
{
  if (secure_stream)
    {
      co_await shutdown_impl(secure_stream);
    }
  else if (plain_stream)
    {
      co_await shutdown_impl(plain_stream);
    }
  connected_url.reset();
}

outcome::std_result<void>
HttpStream::init_certificates()
{
  for (const auto &cert: options.get_ca_certs())
    {
      boost::system::error_code ec;
      ctx.add_certificate_authority(boost::asio::buffer(cert.data(), cert.size()), ec);
      if (ec)
        {
          logger->error("add_certificate_authority failed ({})", ec.message());
          return HttpClientErrc::InvalidCertificate;
        }
    }
  return outcome::success();
}

bool
HttpStream::is_redirect(boost::beast::http::status code) const
{
  return code == boost::beast::http::status::moved_permanently || code == boost::beast::http::status::found
         || code == boost::beast::http::status::see_other || code == boost::beast::http::status::temporary_redirect
         || code == boost::beast::http::status::permanent_redirect;
}

bool
HttpStream::is_tls_connection() const
{
  return connected_url && connected_url->scheme() == "https";
}
