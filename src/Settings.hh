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

#ifndef SETTINGS_HH
#define SETTINGS_HH

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "trustgate/EvaluationConfig.hh"
#include "utils/Logging.hh"

#include "SettingsStorage.hh"

namespace outcome = boost::outcome_v2;

namespace settings
{
  constexpr const char *trusted_registries = "trusted_registries";
  constexpr const char *trusted_namespaces = "trusted_namespaces";
  constexpr const char *curated_registries = "curated_registries";
  constexpr const char *recency_threshold_days = "recency_threshold_days";
  constexpr const char *stale_threshold_days = "stale_threshold_days";
  constexpr const char *auto_approve_threshold = "auto_approve_threshold";
  constexpr const char *human_review_threshold = "human_review_threshold";
  constexpr const char *inspect_timeout = "inspect_timeout";
  constexpr const char *scan_timeout = "scan_timeout";
  constexpr const char *signature_timeout = "signature_timeout";
  constexpr const char *http_timeout = "http_timeout";
  constexpr const char *evaluation_deadline = "evaluation_deadline";
  constexpr const char *skopeo_command = "skopeo_command";
  constexpr const char *trivy_command = "trivy_command";
  constexpr const char *cosign_command = "cosign_command";
  constexpr const char *github_token = "github_token";
} // namespace settings

class Settings
{
public:
  // Storages are consulted in order; the first one defining a setting wins.
  explicit Settings(std::vector<std::shared_ptr<SettingsStorage>> storages);

  outcome::std_result<trustgate::EvaluationConfig> load() const;

  static outcome::std_result<void> validate(const trustgate::EvaluationConfig &config);

private:
  outcome::std_result<std::optional<SettingValue>> get_value(const std::string &name, SettingType type) const;

  outcome::std_result<void> load_int(const char *name, std::int64_t &value) const;
  outcome::std_result<void> load_string(const char *name, std::string &value) const;
  outcome::std_result<void> load_list(const char *name, std::set<std::string> &value) const;

  template<typename Duration>
  outcome::std_result<void> load_duration(const char *name, Duration &value) const
  {
    std::int64_t count = value.count();
    auto rc = load_int(name, count);
    if (rc)
      {
        value = Duration(count);
      }
    return rc;
  }

private:
  std::vector<std::shared_ptr<SettingsStorage>> storages;
  std::shared_ptr<spdlog::logger> logger{trustgate::utils::Logging::create("trustgate:settings")};
};

#endif // SETTINGS_HH
