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

#include "Settings.hh"

#include <utility>

#include <boost/outcome/try.hpp>

#include "trustgate/Report.hh"
#include "trustgate/TrustGateErrors.hh"

Settings::Settings(std::vector<std::shared_ptr<SettingsStorage>> storages)
  : storages(std::move(storages))
{
}

outcome::std_result<trustgate::EvaluationConfig>
Settings::load() const
{
  auto config = trustgate::EvaluationConfig::defaults();

  std::int64_t auto_approve = config.thresholds.auto_approve;
  std::int64_t human_review = config.thresholds.human_review;

  BOOST_OUTCOME_TRY(load_list(settings::trusted_registries, config.trusted_registries));
  BOOST_OUTCOME_TRY(load_list(settings::trusted_namespaces, config.trusted_namespaces));
  BOOST_OUTCOME_TRY(load_list(settings::curated_registries, config.curated_registries));
  BOOST_OUTCOME_TRY(load_duration(settings::recency_threshold_days, config.recency_threshold));
  BOOST_OUTCOME_TRY(load_duration(settings::stale_threshold_days, config.stale_threshold));
  BOOST_OUTCOME_TRY(load_int(settings::auto_approve_threshold, auto_approve));
  BOOST_OUTCOME_TRY(load_int(settings::human_review_threshold, human_review));
  BOOST_OUTCOME_TRY(load_duration(settings::inspect_timeout, config.inspect_timeout));
  BOOST_OUTCOME_TRY(load_duration(settings::scan_timeout, config.scan_timeout));
  BOOST_OUTCOME_TRY(load_duration(settings::signature_timeout, config.signature_timeout));
  BOOST_OUTCOME_TRY(load_duration(settings::http_timeout, config.http_timeout));
  BOOST_OUTCOME_TRY(load_duration(settings::evaluation_deadline, config.evaluation_deadline));
  BOOST_OUTCOME_TRY(load_string(settings::skopeo_command, config.skopeo_command));
  BOOST_OUTCOME_TRY(load_string(settings::trivy_command, config.trivy_command));
  BOOST_OUTCOME_TRY(load_string(settings::cosign_command, config.cosign_command));
  BOOST_OUTCOME_TRY(load_string(settings::github_token, config.github_token));

  if (auto_approve < 0 || auto_approve > trustgate::max_score || human_review < 0 || human_review > trustgate::max_score)
    {
      logger->error("thresholds must be between 0 and {}", trustgate::max_score);
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }
  config.thresholds.auto_approve = static_cast<int>(auto_approve);
  config.thresholds.human_review = static_cast<int>(human_review);

  BOOST_OUTCOME_TRY(validate(config));
  return config;
}

outcome::std_result<void>
Settings::validate(const trustgate::EvaluationConfig &config)
{
  auto logger = trustgate::utils::Logging::create("trustgate:settings");

  const auto &thresholds = config.thresholds;
  if (thresholds.auto_approve < 0 || thresholds.auto_approve > trustgate::max_score || thresholds.human_review < 0
      || thresholds.human_review > trustgate::max_score)
    {
      logger->error("thresholds must be between 0 and {}", trustgate::max_score);
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  if (thresholds.auto_approve <= thresholds.human_review)
    {
      logger->error("auto-approve threshold ({}) must be above the human review threshold ({})",
                    thresholds.auto_approve,
                    thresholds.human_review);
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  if (config.recency_threshold.count() < 0 || config.stale_threshold < config.recency_threshold)
    {
      logger->error("stale threshold must not be below the recency threshold");
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  for (auto timeout: {config.inspect_timeout, config.scan_timeout, config.signature_timeout, config.http_timeout, config.evaluation_deadline})
    {
      if (timeout.count() <= 0)
        {
          logger->error("timeouts must be positive");
          return trustgate::TrustGateErrc::InvalidConfiguration;
        }
    }

  if (config.skopeo_command.empty() || config.trivy_command.empty() || config.cosign_command.empty())
    {
      logger->error("tool commands must not be empty");
      return trustgate::TrustGateErrc::InvalidConfiguration;
    }

  return outcome::success();
}

outcome::std_result<std::optional<SettingValue>>
Settings::get_value(const std::string &name, SettingType type) const
{
  for (const auto &storage: storages)
    {
      auto rc = storage->get_value(name, type);
      if (!rc || rc.value())
        {
          return rc;
        }
    }
  return std::optional<SettingValue>{};
}

outcome::std_result<void>
Settings::load_int(const char *name, std::int64_t &value) const
{
  BOOST_OUTCOME_TRY(auto v, get_value(name, SettingType::Int64));
  if (v)
    {
      value = std::get<std::int64_t>(*v);
    }
  return outcome::success();
}

outcome::std_result<void>
Settings::load_string(const char *name, std::string &value) const
{
  BOOST_OUTCOME_TRY(auto v, get_value(name, SettingType::String));
  if (v)
    {
      value = std::get<std::string>(*v);
    }
  return outcome::success();
}

outcome::std_result<void>
Settings::load_list(const char *name, std::set<std::string> &value) const
{
  BOOST_OUTCOME_TRY(auto v, get_value(name, SettingType::StringList));
  if (v)
    {
      const auto &list = std::get<std::vector<std::string>>(*v);
      value = std::set<std::string>(list.begin(), list.end());
      logger->debug("{}: {} entries", name, value.size());
    }
  return outcome::success();
}
