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

#include "ProcessToolRunner.hh"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/process.hpp>
#include <fmt/format.h>

#include "ToolErrors.hh"

namespace
{
  constexpr auto exit_poll_interval = std::chrono::milliseconds(50);
} // namespace

ProcessToolRunner::ProcessToolRunner(boost::asio::io_context &ioc)
  : ioc(ioc)
{
}

boost::asio::awaitable<outcome::std_result<ToolOutput>>
ProcessToolRunner::run(std::string tool, std::vector<std::string> args, std::chrono::seconds timeout)
{
  std::string exe = tool;
  if (tool.find('/') == std::string::npos)
    {
      exe = boost::process::search_path(tool).string();
    }

  std::error_code exists_ec;
  if (exe.empty() || !std::filesystem::exists(exe, exists_ec))
    {
      logger->info("{} not found", tool);
      co_return ToolErrc::NotFound;
    }

  boost::process::async_pipe out(ioc);
  boost::process::child child;

  try
    {
      std::error_code ec;
      child = boost::process::child(boost::process::exe = exe,
                                    boost::process::args = args,
                                    boost::process::std_out > out,
                                    boost::process::std_err > boost::process::null,
                                    boost::process::std_in < boost::process::null,
                                    ec);
      if (ec)
        {
          logger->error("failed to launch {} ({})", exe, ec.message());
          co_return ToolErrc::LaunchFailed;
        }
    }
  catch (std::exception &e)
    {
      logger->error("failed to launch {} ({})", exe, e.what());
      co_return ToolErrc::LaunchFailed;
    }

  logger->debug("running {} {}", exe, fmt::join(args, " "));

  std::string output;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  boost::asio::steady_timer timer(ioc, deadline);

  auto [order, read_ec, read_size, timer_ec] =
    co_await boost::asio::experimental::make_parallel_group(
      boost::asio::async_read(out, boost::asio::dynamic_buffer(output), boost::asio::deferred),
      timer.async_wait(boost::asio::deferred))
      .async_wait(boost::asio::experimental::wait_for_one(), boost::asio::use_awaitable);

  auto cancellation_state = co_await boost::asio::this_coro::cancellation_state;
  auto is_cancelled = [&]() { return cancellation_state.cancelled() != boost::asio::cancellation_type::none; };

  auto stop = [&](bool cancelled) -> std::error_code {
    std::error_code ec;
    child.terminate(ec);
    if (ec)
      {
        logger->warn("failed to terminate {} ({})", exe, ec.message());
      }
    if (cancelled)
      {
        logger->info("{} cancelled", tool);
        return std::make_error_code(std::errc::operation_canceled);
      }
    logger->info("{} timed out after {}s", tool, timeout.count());
    return ToolErrc::Timeout;
  };

  auto cancelled = is_cancelled();
  if (order[0] == 1 || cancelled)
    {
      co_return stop(cancelled);
    }

  if (read_ec && read_ec != boost::asio::error::eof)
    {
      logger->error("failed to read output of {} ({})", tool, read_ec.message());
    }

  // Closing stdout does not mean the tool has exited.
  std::error_code ec;
  while (child.running(ec))
    {
      if (std::chrono::steady_clock::now() >= deadline)
        {
          co_return stop(false);
        }

      auto remaining = deadline - std::chrono::steady_clock::now();
      boost::asio::steady_timer poll(ioc, std::min<std::chrono::steady_clock::duration>(exit_poll_interval, remaining));
      boost::system::error_code poll_ec;
      co_await poll.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, poll_ec));
      if (is_cancelled())
        {
          co_return stop(true);
        }
    }
  if (ec)
    {
      logger->error("failed to wait for {} ({})", tool, ec.message());
      co_return ToolErrc::Failed;
    }

  logger->debug("{} exited with {} ({} bytes of output)", tool, child.exit_code(), output.size());
  co_return ToolOutput{child.exit_code(), std::move(output)};
}
