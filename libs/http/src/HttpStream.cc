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

#include "HttpStream.hh"

#include <system_error>
#include <utility>

#include <boost/url/parse.hpp>
#include <boost/beast/version.hpp>

#include "http/HttpClientErrors.hh"

using namespace trustgate::http;

HttpStream::HttpStream(Options options_)
  : options(std::move(options_))
{
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(boost::asio::ssl::verify_peer);
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::execute(std::string url_str, Headers request_headers)
{
  auto url_rc = parse_url(url_str);
  if (!url_rc)
    {
      co_return url_rc.as_failure();
    }
  requested_url = url_rc.value();
  headers = std::move(request_headers);

  outcome::std_result<void> rc = outcome::success();
  outcome::std_result<HttpStream::response_t> response_rc = outcome::success();
  while (true)
    {
      if (connect_required())
        {
          if (connected_url)
            {
              co_await shutdown();
            }

          rc = co_await connect();
          if (!rc)
            {
              co_return rc.as_failure();
            }

          if (is_tls_connection())
            {
              rc = co_await encrypt_connection(*connected_url);
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
      logger->debug("following redirect to {}", requested_url.c_str());
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

  auto request_rc = co_await send_request(stream, request);
  if (!request_rc)
    {
      co_return request_rc.as_failure();
    }

  co_return co_await receive_response_body(stream);
}

outcome::std_result<boost::urls::url>
HttpStream::parse_url(const std::string &u)
{
  auto url_rc = boost::urls::parse_uri(u);

  if (!url_rc)
    {
      logger->error("malformed URL '{}' ({})", u, url_rc.error().message());
      return HttpClientErrc::MalformedURL;
    }
  boost::urls::url url = url_rc.value();

  if (url.scheme() != "https" && url.scheme() != "http")
    {
      logger->error("unsupported URL scheme in '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  if (url.host().empty())
    {
      logger->error("no host in URL '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  if (url.port().empty())
    {
      url.set_port(url.scheme() == "https" ? "443" : "80");
    }

  logger->debug("parsed URL {}", url.c_str());
  return url;
}

bool
HttpStream::connect_required()
{
  return !connected_url || requested_url.host() != connected_url->host() || requested_url.port() != connected_url->port()
         || requested_url.scheme() != connected_url->scheme();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::connect()
{
  connected_url.reset();

  auto executor = co_await boost::asio::this_coro::executor;
  plain_stream = std::make_shared<plain_stream_t>(executor);

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(requested_url.host(),
                                                 requested_url.port(),
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec)
    {
      logger->error("failed to resolve hostname '{}' ({})", requested_url.host(), ec.message());
      co_return HttpClientErrc::NameResolutionFailed;
    }

  plain_stream->expires_after(options.get_timeout());
  co_await plain_stream->async_connect(results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to connect to '{}:{}' ({})", requested_url.host(), requested_url.port(), ec.message());
      co_return map_error(ec, HttpClientErrc::ConnectionRefused);
    }
  connected_url = requested_url;
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::encrypt_connection(boost::urls::url url)
{
  secure_stream = std::make_shared<secure_stream_t>(std::move(*plain_stream), ctx);

  std::string host(url.host());
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
      co_return map_error(ec, HttpClientErrc::CommunicationError);
    }

  co_return outcome::success();
}

HttpStream::request_t
HttpStream::create_request()
{
  constexpr auto http_version = 11;
  request_t req;
  req.method(boost::beast::http::verb::get);
  req.target(requested_url.encoded_resource());
  req.version(http_version);
  req.set(boost::beast::http::field::host, requested_url.host());
  req.set(boost::beast::http::field::user_agent, options.get_user_agent());
  for (const auto &[name, value]: headers)
    {
      req.set(name, value);
    }
  req.prepare_payload();

  logger->debug("req HTTP/{} {}", req.version(), std::string(req.target()));
  return req;
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<void>>
HttpStream::send_request(StreamType stream, request_t request)
{
  boost::system::error_code ec;

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_write(*stream, request, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send HTTP request to '{}' ({})", connected_url->host(), ec.message());
      co_return map_error(ec, HttpClientErrc::CommunicationError);
    }

  co_return outcome::success();
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::receive_response_body(StreamType stream)
{
  boost::system::error_code ec;
  boost::beast::flat_buffer buffer;
  boost::beast::http::response_parser<boost::beast::http::string_body> parser;
  parser.body_limit(max_body_size);

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_read(*stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to read HTTP response from {} ({})", connected_url->host(), ec.message());
      co_return map_error(ec, HttpClientErrc::CommunicationError);
    }

  logger->debug("resp HTTP/{} {}", parser.get().version(), parser.get().result_int());
  co_return parser.release();
}

outcome::std_result<bool>
HttpStream::handle_redirect(const response_t &response)
{
  if (!is_redirect(response.result()))
    {
      redirect_count = 0;
      return false;
    }

  if (!options.get_follow_redirects())
    {
      return false;
    }

  redirect_count++;
  if (redirect_count > options.get_max_redirects())
    {
      logger->error("too many redirects");
      return HttpClientErrc::TooManyRedirects;
    }

  std::string redirect_url{response.base()[boost::beast::http::field::location]};
  if (redirect_url.empty())
    {
      logger->error("no Location header in redirect response from {}", connected_url->host());
      return HttpClientErrc::InvalidRedirect;
    }

  if (redirect_url[0] == '/')
    {
      auto query_pos = redirect_url.find('?');
      requested_url.set_encoded_path(redirect_url.substr(0, query_pos));
      if (query_pos != std::string::npos)
        {
          requested_url.set_encoded_query(redirect_url.substr(query_pos + 1));
        }
      else
        {
          requested_url.remove_query();
        }
    }
  else
    {
      auto url_rc = parse_url(redirect_url);
      if (!url_rc)
        {
          logger->error("malformed redirect URL '{}'", redirect_url);
          return HttpClientErrc::InvalidRedirect;
        }
      requested_url = std::move(url_rc.value());
    }
  return true;
}

template<>
boost::asio::awaitable<void>
HttpStream::shutdown_impl<std::shared_ptr<HttpStream::secure_stream_t>>(std::shared_ptr<secure_stream_t> stream)
{
  boost::system::error_code ec;
  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await stream->async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec && ec != boost::asio::ssl::error::stream_truncated && ec != boost::asio::error::eof)
    {
      logger->debug("TLS shutdown failed ({})", ec.message());
    }
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
  if (is_tls_connection() && secure_stream)
    {
      co_await shutdown_impl(secure_stream);
    }
  else if (plain_stream)
    {
      co_await shutdown_impl(plain_stream);
    }
  connected_url.reset();
  secure_stream.reset();
  plain_stream.reset();
}

std::error_code
HttpStream::map_error(const boost::system::error_code &ec, HttpClientErrc fallback) const
{
  if (ec == boost::beast::error::timeout)
    {
      return HttpClientErrc::Timeout;
    }
  return fallback;
}

bool
HttpStream::is_redirect(boost::beast::http::status code)
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

bool
HttpStream::is_tls_requested() const
{
  return requested_url.scheme() == "https";
}
