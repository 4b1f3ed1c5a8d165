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

#ifndef TRUSTGATE_EVALUATION_CONFIG_HH
#define TRUSTGATE_EVALUATION_CONFIG_HH

#include <chrono>
#include <set>
#include <string>

namespace trustgate
{
  struct DecisionThresholds
  {
    int auto_approve{80};
    int human_review{50};
  };

  struct EvaluationConfig
  {
    std::set<std::string> trusted_registries;
    std::set<std::string> trusted_namespaces;
    std::set<std::string> curated_registries;

    std::chrono::days recency_threshold{90};
    std::chrono::days stale_threshold{365};
    DecisionThresholds thresholds;

    std::chrono::seconds inspect_timeout{60};
    std::chrono::seconds scan_timeout{300};
    std::chrono::seconds signature_timeout{60};
    std::chrono::seconds http_timeout{30};
    std::chrono::seconds evaluation_deadline{600};

    std::string skopeo_command{"skopeo"};
    std::string trivy_command{"trivy"};
    std::string cosign_command{"cosign"};

    std::string github_token;

    // Built-in trust lists and thresholds.
    static EvaluationConfig defaults();
  };
} // namespace trustgate

#endif // TRUSTGATE_EVALUATION_CONFIG_HH
