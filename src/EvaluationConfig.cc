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

#include "trustgate/EvaluationConfig.hh"

using namespace trustgate;

EvaluationConfig
EvaluationConfig::defaults()
{
  EvaluationConfig config;

  config.trusted_registries = {"registry.access.redhat.com", "registry.redhat.io"};
  config.curated_registries = {"registry.access.redhat.com", "registry.redhat.io"};
  config.trusted_namespaces = {
    // Red Hat ecosystem
    "redhat",
    "rhdh-community",
    "fedora",
    "openshift",
    "ubi",
    // Vendor images
    "hashicorp",
    "bitnami",
    "bitnamilegacy",
    // CNCF projects
    "kyverno",
    "argoproj",
    "prometheus",
    "jetstack",
    "fluxcd",
    "envoyproxy",
    // Observability
    "grafana",
    "aquasecurity",
    // Networking
    "calico",
    "cilium",
  };

  return config;
}
