// Copyright (C) 2022 Rob Caelers <rob.caelers@gmail.com>
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

#ifndef NET_HTTP_TEST_SERVER_HH
#define NET_HTTP_TEST_SERVER_HH

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

// Plain HTTP server on 127.0.0.1 serving canned documents and redirects.
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

  void add(const std::string &target, const std::string &body)
  {
    documents[target] = body;
  }

  void add_redirect(const std::string &from, const std::string &to)
  {
    redirects[from] = to;
  }

  void add_delay(const std::string &target, std::chrono::milliseconds delay)
  {
    delays[target] = delay;
  }

  void run()
  {
    acceptor.open(boost::asio::ip::tcp::v4());
    acceptor.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor.bind({boost::asio::ip::make_address("127.0.0.1"), port});
    acceptor.listen();

    boost::asio::co_spawn(ioc, accept_loop(), boost::asio::detached);
    server_thread = std::thread([this]() { ioc.run(); });
  }

  void stop()
  {
    if (server_thread.joinable())
      {
        ioc.stop();
        server_thread.join();
      }
  }

private:
  boost::asio::awaitable<void> accept_loop()
  {
    while (acceptor.is_open())
      {
        boost::system::error_code ec;
        auto socket = co_await acceptor.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
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

    while (true)
      {
        boost::system::error_code ec;
        boost::beast::http::request<boost::beast::http::string_body> req;
        co_await boost::beast::http::async_read(stream, buffer, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
          {
            break;
          }

        std::string target{req.target()};
        logger->debug("handle request: {}", target);

        if (auto it = delays.find(target); it != delays.end())
          {
            boost::asio::steady_timer timer(ioc, it->second);
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          }

        boost::beast::http::response<boost::beast::http::string_body> res{boost::beast::http::status::ok, req.version()};
        res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
        res.keep_alive(req.keep_alive());

        if (target == "/echo-headers")
          {
            std::string body;
            for (const auto &field: req)
              {
                body += std::string(field.name_string()) + ": " + std::string(field.value()) + "\n";
              }
            res.body() = body;
          }
        else if (auto doc = documents.find(target); doc != documents.end())
          {
            res.set(boost::beast::http::field::content_type, "application/json");
            res.body() = doc->second;
          }
        else if (auto redirect = redirects.find(target); redirect != redirects.end())
          {
            res.result(boost::beast::http::status::found);
            res.set(boost::beast::http::field::location, redirect->second);
          }
        else
          {
            res.result(boost::beast::http::status::not_found);
            res.body() = "The resource '" + target + "' was not found.";
          }
        res.prepare_payload();

        co_await boost::beast::http::async_write(stream, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !req.keep_alive())
          {
            break;
          }
      }

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  }

private:
  unsigned short port;
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::acceptor acceptor{ioc};
  std::thread server_thread;
  std::map<std::string, std::string> documents;
  std::map<std::string, std::string> redirects;
  std::map<std::string, std::chrono::milliseconds> delays;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("test:server")};
};

#endif // NET_HTTP_TEST_SERVER_HH
