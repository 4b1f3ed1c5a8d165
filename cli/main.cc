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

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/ReportFormatter.hh"
#include "trustgate/TrustGate.hh"
#include "trustgate/TrustGateErrors.hh"
#include "utils/Logging.hh"

#include "Settings.hh"
#include "SettingsStorage.hh"

namespace po = boost::program_options;

namespace
{
  void usage(std::ostream &os, const po::options_description &options)
  {
    os << "Usage: trustgate [options] <image-reference>\n\n"
       << "Scores a container image and recommends an admission decision.\n"
       << "Exit codes: 0 auto-approve, 1 needs human review, 2 auto-reject, 3 error.\n\n"
       << options << "\n";
  }

  outcome::std_result<void> apply_overrides(MemorySettingsStorage &storage, const std::vector<std::string> &overrides)
  {
    for (const auto &item: overrides)
      {
        auto pos = item.find('=');
        if (pos == std::string::npos || pos == 0)
          {
            spdlog::error("invalid setting '{}', expected <name>=<value>", item);
            return trustgate::TrustGateErrc::InvalidArgument;
          }
        storage.set_value(item.substr(0, pos), item.substr(pos + 1));
      }
    return outcome::success();
  }
} // namespace

int
main(int argc, char **argv)
{
  bool json = false;
  std::string image;
  std::string config_file;
  std::string log_level;
  std::vector<std::string> extra_registries;
  std::vector<std::string> extra_namespaces;
  std::vector<std::string> overrides;

  po::options_description options("Options");
  options.add_options()
    ("help,h", "show this help")
    ("json", po::bool_switch(&json), "write the report as JSON")
    ("config,c", po::value<std::string>(&config_file), "JSON configuration file")
    ("log-level,l", po::value<std::string>(&log_level), "trace, debug, info, warn, error or off")
    ("trusted-registry", po::value<std::vector<std::string>>(&extra_registries)->composing(), "additional trusted registry")
    ("trusted-namespace", po::value<std::vector<std::string>>(&extra_namespaces)->composing(), "additional trusted vendor namespace")
    ("set", po::value<std::vector<std::string>>(&overrides)->composing(), "override a setting, as <name>=<value>");

  po::options_description hidden;
  hidden.add_options()("image", po::value<std::string>(&image));

  po::options_description all;
  all.add(options).add(hidden);

  po::positional_options_description positional;
  positional.add("image", 1);

  po::variables_map vm;
  try
    {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
      po::notify(vm);
    }
  catch (const po::error &e)
    {
      std::cerr << "trustgate: " << e.what() << "\n\n";
      usage(std::cerr, options);
      return trustgate::failure_exit_code;
    }

  if (vm.count("help") != 0U)
    {
      usage(std::cout, options);
      return 0;
    }

  std::optional<spdlog::level::level_enum> level;
  if (!log_level.empty())
    {
      level = trustgate::utils::Logging::parse_level(log_level);
      if (!level)
        {
          std::cerr << "trustgate: unknown log level '" << log_level << "'\n\n";
          usage(std::cerr, options);
          return trustgate::failure_exit_code;
        }
    }
  trustgate::utils::Logging::init_console(json ? spdlog::level::warn : spdlog::level::info, level);
  auto logger = trustgate::utils::Logging::create("trustgate:main");

  if (image.empty())
    {
      usage(std::cerr, options);
      return trustgate::failure_exit_code;
    }

  auto cli_storage = std::make_shared<MemorySettingsStorage>();
  if (!apply_overrides(*cli_storage, overrides))
    {
      return trustgate::failure_exit_code;
    }

  std::vector<std::shared_ptr<SettingsStorage>> storages{cli_storage, std::make_shared<EnvironmentSettingsStorage>()};
  if (!config_file.empty())
    {
      auto rc = JsonSettingsStorage::load(config_file);
      if (!rc)
        {
          logger->error("failed to load configuration {} ({})", config_file, rc.error());
          return trustgate::failure_exit_code;
        }
      storages.push_back(rc.value());
    }

  auto config_rc = Settings(storages).load();
  if (!config_rc)
    {
      logger->error("invalid configuration ({})", config_rc.error());
      return trustgate::failure_exit_code;
    }
  auto config = config_rc.value();
  config.trusted_registries.insert(extra_registries.begin(), extra_registries.end());
  config.trusted_namespaces.insert(extra_namespaces.begin(), extra_namespaces.end());

  boost::asio::io_context ioc;
  auto gate = trustgate::TrustGate::create(ioc, config);

  boost::asio::cancellation_signal cancel;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (!ec)
      {
        logger->warn("received signal {}, cancelling evaluation", signo);
        cancel.emit(boost::asio::cancellation_type::terminal);
      }
  });

  int exit_code = trustgate::failure_exit_code;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> {
      auto rc = co_await gate->evaluate(image);
      signals.cancel();

      if (!rc)
        {
          logger->error("evaluation of {} failed ({})", image, rc.error());
          co_return;
        }

      const auto &report = rc.value();
      std::cout << (json ? trustgate::format_json(report) : trustgate::format_text(report)) << std::flush;
      exit_code = trustgate::exit_code(report.decision);
    },
    boost::asio::bind_cancellation_slot(cancel.slot(), [&](std::exception_ptr ex) {
      if (ex)
        {
          try
            {
              std::rethrow_exception(ex);
            }
          catch (const std::exception &e)
            {
              logger->error("evaluation aborted ({})", e.what());
            }
        }
    }));

  ioc.run();
  return exit_code;
}
