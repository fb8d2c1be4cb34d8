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

#ifndef OPENCRED_HTTP_TEST_SERVER_HH
#define OPENCRED_HTTP_TEST_SERVER_HH

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

namespace opencred::http::test
{
  // Plain HTTP server on the loopback interface serving canned documents.
  class TestServer
  {
  public:
    explicit TestServer(unsigned short port = 1337)
      : port(port)
    {
    }

    ~TestServer()
    {
      stop();
    }

    TestServer(const TestServer &) = delete;
    TestServer &operator=(const TestServer &) = delete;
    TestServer(TestServer &&) = delete;
    TestServer &operator=(TestServer &&) = delete;

    void add(const std::string &target, const std::string &body, const std::string &content_type = "application/ld+json")
    {
      documents[target] = std::make_pair(body, content_type);
    }

    void add_redirect(const std::string &from, const std::string &to)
    {
      redirects[from] = to;
    }

    void run()
    {
      boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address("127.0.0.1"), port};
      acceptor = std::make_unique<boost::asio::ip::tcp::acceptor>(ioc);
      acceptor->open(endpoint.protocol());
      acceptor->set_option(boost::asio::socket_base::reuse_address(true));
      acceptor->bind(endpoint);
      acceptor->listen(boost::asio::socket_base::max_listen_connections);

      boost::asio::co_spawn(ioc, do_listen(), boost::asio::detached);
      worker = std::thread([this] { ioc.run(); });
    }

    void stop()
    {
      if (worker.joinable())
        {
          ioc.stop();
          worker.join();
        }
    }

    std::string url(const std::string &target) const
    {
      return "http://127.0.0.1:" + std::to_string(port) + target;
    }

  private:
    boost::asio::awaitable<void> do_listen()
    {
      for (;;)
        {
          boost::system::error_code ec;
          auto socket = co_await acceptor->async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec)
            {
              logger->error("accept failed ({})", ec.message());
              co_return;
            }
          boost::asio::co_spawn(ioc, session(std::move(socket)), boost::asio::detached);
        }
    }

    boost::asio::awaitable<void> session(boost::asio::ip::tcp::socket socket)
    {
      boost::beast::tcp_stream stream(std::move(socket));
      boost::beast::flat_buffer buffer;
      boost::system::error_code ec;

      for (;;)
        {
          boost::beast::http::request<boost::beast::http::string_body> req;
          co_await boost::beast::http::async_read(stream, buffer, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec)
            {
              break;
            }

          std::string target{req.target()};
          logger->debug("handle request: {}", target);

          boost::beast::http::response<boost::beast::http::string_body> res;
          res.version(req.version());
          res.keep_alive(req.keep_alive());
          res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);

          if (auto it = redirects.find(target); it != redirects.end())
            {
              res.result(boost::beast::http::status::found);
              res.set(boost::beast::http::field::location, it->second);
            }
          else if (auto it = documents.find(target); it != documents.end())
            {
              res.result(boost::beast::http::status::ok);
              res.set(boost::beast::http::field::content_type, it->second.second);
              res.body() = it->second.first;
            }
          else
            {
              res.result(boost::beast::http::status::not_found);
              res.set(boost::beast::http::field::content_type, "text/html");
              res.body() = "The resource '" + target + "' was not found.";
            }
          res.prepare_payload();

          co_await boost::beast::http::async_write(stream, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec || !req.keep_alive())
            {
              break;
            }
        }

      stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

  private:
    unsigned short port;
    std::map<std::string, std::pair<std::string, std::string>> documents;
    std::map<std::string, std::string> redirects;
    boost::asio::io_context ioc{1};
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor;
    std::thread worker;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("test:server")};
  };
} // namespace opencred::http::test

#endif // OPENCRED_HTTP_TEST_SERVER_HH
