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

#include "SettingsStorage.hh"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/outcome/try.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/TrustGateErrors.hh"
#include "utils/Logging.hh"

namespace
{
  std::shared_ptr<spdlog::logger> logger()
  {
    static auto settings_logger = trustgate::utils::Logging::create("trustgate:settings");
    return settings_logger;
  }

  outcome::std_result<std::optional<SettingValue>> lookup(const std::map<std::string, SettingValue> &store,
                                                          const std::string &name,
                                                          SettingType type)
  {
    auto it = store.find(name);
    if (it == store.end())
      {
        return std::optional<SettingValue>{};
      }

    if (SettingValueToType(it->second) != type)
      {
        logger()->error("setting '{}' has the wrong type", name);
        return trustgate::TrustGateErrc::InvalidConfiguration;
      }
    return std::optional<SettingValue>{it->second};
  }

  std::optional<SettingValue> from_json(const boost::json::value &value)
  {
    switch (value.kind())
      {
      case boost::json::kind::int64:
        return value.get_int64();
      case boost::json::kind::uint64:
        return static_cast<std::int64_t>(value.get_uint64());
      case boost::json::kind::string:
        return std::string(value.get_string());
      case boost::json::kind::array:
        {
          std::vector<std::string> list;
          for (const auto &item: value.get_array())
            {
              if (!item.is_string())
                {
                  return {};
                }
              list.emplace_back(item.get_string());
            }
          return list;
        }
      default:
        return {};
      }
  }
} // namespace

outcome::std_result<std::optional<SettingValue>>
MemorySettingsStorage::get_value(const std::string &name, SettingType type) const
{
  auto it = store.find(name);
  if (it == store.end())
    {
      return std::optional<SettingValue>{};
    }

  BOOST_OUTCOME_TRY(auto value, parse_setting(name, it->second, type));
  return std::optional<SettingValue>{std::move(value)};
}

void
MemorySettingsStorage::set_value(const std::string &name, const std::string &value)
{
  store[name] = value;
}

EnvironmentSettingsStorage::EnvironmentSettingsStorage(std::string prefix)
  : prefix(std::move(prefix))
{
}

outcome::std_result<std::optional<SettingValue>>
EnvironmentSettingsStorage::get_value(const std::string &name, SettingType type) const
{
  auto variable = prefix + boost::algorithm::to_upper_copy(name);
  const char *value = std::getenv(variable.c_str());
  if (value == nullptr)
    {
      return std::optional<SettingValue>{};
    }

  BOOST_OUTCOME_TRY(auto setting, parse_setting(variable, value, type));
  return std::optional<SettingValue>{std::move(setting)};
}

outcome::std_result<SettingValue>
parse_setting(const std::string &name, const std::string &value, SettingType type)
{
  switch (type)
    {
    case SettingType::Int64:
      {
        std::int64_t number = 0;
        if (boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(value), number))
          {
            return SettingValue{number};
          }
        break;
      }

    case SettingType::String:
      return SettingValue{value};

    case SettingType::StringList:
      {
        std::vector<std::string> items;
        boost::algorithm::split(items, value, boost::is_any_of(","));
        std::vector<std::string> list;
        for (auto &item: items)
          {
            boost::algorithm::trim(item);
            if (!item.empty())
              {
                list.push_back(item);
              }
          }
        return SettingValue{list};
      }
    }

  logger()->error("invalid value '{}' for {}", value, name);
  return trustgate::TrustGateErrc::InvalidConfiguration;
}

outcome::std_result<std::shared_ptr<JsonSettingsStorage>>
JsonSettingsStorage::load(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file)
    {
      logger()->error("cannot open configuration file {}", filename);
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

outcome::std_result<std::shared_ptr<JsonSettingsStorage>>
JsonSettingsStorage::parse(const std::string &content)
{
  boost::system::error_code ec;
  auto doc = boost::json::parse(content, ec);
  if (ec || !doc.is_object())
    {
      logger()->error("configuration is not a JSON object ({})", ec.message());
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  auto storage = std::make_shared<JsonSettingsStorage>();
  for (const auto &member: doc.as_object())
    {
      auto value = from_json(member.value());
      if (!value)
        {
          logger()->error("unsupported value for setting '{}'", std::string(member.key()));
          return trustgate::TrustGateErrc::InvalidConfiguration;
        }
      storage->store[std::string(member.key())] = *value;
    }
  return storage;
}

outcome::std_result<std::optional<SettingValue>>
JsonSettingsStorage::get_value(const std::string &name, SettingType type) const
{
  return lookup(store, name, type);
}
