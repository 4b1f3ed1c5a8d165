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

#ifndef SETTINGS_STORAGE_HH
#define SETTINGS_STORAGE_HH

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

enum class SettingType
{
  Int64,
  String,
  StringList,
};

using SettingValue = std::variant<std::int64_t, std::string, std::vector<std::string>>;

constexpr SettingType
SettingValueToType(const SettingValue &value)
{
  return std::visit(
    [](auto &&arg) {
      using T = std::decay_t<decltype(arg)>;

      if constexpr (std::is_same_v<std::int64_t, T>)
        {
          return SettingType::Int64;
        }
      else if constexpr (std::is_same_v<std::string, T>)
        {
          return SettingType::String;
        }
      else
        {
          return SettingType::StringList;
        }
    },
    value);
}

// Converts the textual form of a setting. Lists are comma separated items.
outcome::std_result<SettingValue> parse_setting(const std::string &name, const std::string &value, SettingType type);

class SettingsStorage
{
public:
  virtual ~SettingsStorage() = default;

  // Empty when the setting is not defined in this storage; an error when it
  // is defined but cannot be converted to `type`.
  virtual outcome::std_result<std::optional<SettingValue>> get_value(const std::string &name, SettingType type) const = 0;
};

// Settings held in textual form in memory, used for command line overrides.
class MemorySettingsStorage : public SettingsStorage
{
public:
  outcome::std_result<std::optional<SettingValue>> get_value(const std::string &name, SettingType type) const override;
  void set_value(const std::string &name, const std::string &value);

private:
  std::map<std::string, std::string> store;
};

// Settings from `<prefix><NAME>` environment variables. Lists are comma separated.
class EnvironmentSettingsStorage : public SettingsStorage
{
public:
  explicit EnvironmentSettingsStorage(std::string prefix = "TRUSTGATE_");

  outcome::std_result<std::optional<SettingValue>> get_value(const std::string &name, SettingType type) const override;

private:
  std::string prefix;
};

// Settings from the top-level members of a JSON configuration document.
class JsonSettingsStorage : public SettingsStorage
{
public:
  static outcome::std_result<std::shared_ptr<JsonSettingsStorage>> load(const std::string &filename);
  static outcome::std_result<std::shared_ptr<JsonSettingsStorage>> parse(const std::string &content);

  outcome::std_result<std::optional<SettingValue>> get_value(const std::string &name, SettingType type) const override;

private:
  std::map<std::string, SettingValue> store;
};

#endif // SETTINGS_STORAGE_HH
