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

#ifndef NET_HTTP_STREAM_HH
#define NET_HTTP_STREAM_HH

#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/outcome/std_result.hpp>
#include <boost/url/url.hpp>

#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "http/Options.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustgate::http
{
  class HttpStream
  {
  public:
    using request_t = boost::beast::http::request<boost::beast::http::string_body>;
    using response_t = boost::beast::http::response<boost::beast::http::string_body>;
    using plain_stream_t = boost::beast::tcp_stream;
    using secure_stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    explicit HttpStream(Options options);

    boost::asio::awaitable<outcome::std_result<response_t>> execute(std::string url, Headers headers);

  private:
    outcome::std_result<boost::urls::url> parse_url(const std::string &u);

    bool connect_required();
    boost::asio::awaitable<outcome::std_result<void>> connect();
    boost::asio::awaitable<outcome::std_result<void>> encrypt_connection(boost::urls::url url);
    boost::asio::awaitable<outcome::std_result<response_t>> send_receive_request();

    template<typename StreamType>
    boost::asio::awaitable<outcome::std_result<response_t>> send_receive_request(StreamType stream);

    request_t create_request();

    template<typename StreamType>
    boost::asio::awaitable<outcome::std_result<void>> send_request(StreamType stream, request_t request);

    template<typename StreamType>
    boost::asio::awaitable<outcome::std_result<response_t>> receive_response_body(StreamType stream);

    outcome::std_result<bool> handle_redirect(const response_t &response);

    template<typename StreamType>
    boost::asio::awaitable<void> shutdown_impl(StreamType stream);
    boost::asio::awaitable<void> shutdown();

    std::error_code map_error(const boost::system::error_code &ec, HttpClientErrc fallback) const;

    static bool is_redirect(boost::beast::http::status code);
    bool is_tls_connection() const;
    bool is_tls_requested() const;

  private:
    static constexpr std::size_t max_body_size = 8 * 1024 * 1024;

    Options options;
    Headers headers;
    boost::asio::ssl::context ctx{boost::asio::ssl::context::tls_client};
    std::shared_ptr<plain_stream_t> plain_stream;
    std::shared_ptr<secure_stream_t> secure_stream;
    boost::urls::url requested_url;
    std::optional<boost::urls::url> connected_url;
    int redirect_count{0};
    std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:http:stream")};
  };
} // namespace trustgate::http

#endif // NET_HTTP_STREAM_HH
