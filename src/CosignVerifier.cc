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

#include "CosignVerifier.hh"

#include <utility>

#include "ToolErrors.hh"

CosignVerifier::CosignVerifier(std::shared_ptr<ToolRunner> runner, std::string command, std::chrono::seconds timeout)
  : runner(std::move(runner))
  , command(std::move(command))
  , timeout(timeout)
{
}

boost::asio::awaitable<trustgate::SignatureStatus>
CosignVerifier::verify(const trustgate::ImageReference &image)
{
  // Any identity from any OIDC issuer is accepted; only the presence of a
  // valid Sigstore signature is checked.
  auto rc = co_await runner->run(command,
                                 {"verify",
                                  image.reference,
                                  "--certificate-identity-regexp=.*",
                                  "--certificate-oidc-issuer-regexp=.*"},
                                 timeout);
  if (!rc)
    {
      logger->info("cosign unavailable for {} ({})", image.reference, rc.error());
      co_return trustgate::SignatureStatus::Unavailable;
    }

  if (rc.value().exit_code != 0)
    {
      logger->info("no valid signature for {} (exit {})", image.reference, rc.value().exit_code);
      co_return trustgate::SignatureStatus::NotVerified;
    }

  co_return trustgate::SignatureStatus::Verified;
}
