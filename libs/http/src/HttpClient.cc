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

#include "http/HttpClient.hh"

#include <memory>
#include <optional>
#include <utility>

#include "http/HttpClientErrors.hh"
#include "HttpStream.hh"

using namespace trustgate::http;

namespace
{
  struct PendingRequest
  {
    explicit PendingRequest(boost::asio::any_io_executor executor)
      : deadline(executor)
    {
    }

    boost::asio::steady_timer deadline;
    boost::asio::cancellation_signal cancel;
    std::optional<outcome::std_result<Response>> result;
  };
} // namespace

boost::asio::awaitable<outcome::std_result<Response>>
HttpClient::get(std::string url, Headers headers)
{
  // The timeout bounds the whole request, including name resolution and
  // redirects. The request keeps its own state so that it can finish in the
  // background once the deadline has passed.
  auto executor = co_await boost::asio::this_coro::executor;
  auto pending = std::make_shared<PendingRequest>(executor);
  auto stream = std::make_shared<HttpStream>(options_);
  pending->deadline.expires_after(options_.get_timeout());

  boost::asio::co_spawn(
    executor,
    [pending, stream, url, headers = std::move(headers), log = logger]() mutable -> boost::asio::awaitable<void> {
      try
        {
          auto rc = co_await stream->execute(url, std::move(headers));
          if (rc)
            {
              pending->result.emplace(std::make_pair(rc.value().result_int(), rc.value().body()));
            }
          else
            {
              pending->result.emplace(rc.as_failure());
            }
        }
      catch (boost::system::system_error &e)
        {
          log->debug("request to {} aborted ({})", url, e.what());
          pending->result.emplace(std::make_error_code(std::errc::operation_canceled));
        }
      pending->deadline.cancel();
    },
    boost::asio::bind_cancellation_slot(pending->cancel.slot(), boost::asio::detached));

  boost::system::error_code ec;
  co_await pending->deadline.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (pending->result)
    {
      co_return std::move(*pending->result);
    }

  pending->cancel.emit(boost::asio::cancellation_type::terminal);

  auto cancelled = (co_await boost::asio::this_coro::cancellation_state).cancelled() != boost::asio::cancellation_type::none;
  if (cancelled)
    {
      logger->info("request to {} cancelled", url);
      co_return std::make_error_code(std::errc::operation_canceled);
    }

  logger->info("request to {} timed out after {}s", url, options_.get_timeout().count());
  co_return HttpClientErrc::Timeout;
}
