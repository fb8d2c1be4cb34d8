// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
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

#ifndef OPENCRED_VERIFICATION_PIPELINE_HH
#define OPENCRED_VERIFICATION_PIPELINE_HH

#include <memory>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "opencred/CredentialVerifier.hh"
#include "opencred/VerifierOptions.hh"
#include "utils/Logging.hh"

#include "CheckAggregator.hh"
#include "DocumentResolver.hh"
#include "FrameExtractor.hh"
#include "ParameterAssembler.hh"
#include "ResultFinalizer.hh"

namespace opencred
{
  class VerificationPipeline : public CredentialVerifier
  {
  public:
    explicit VerificationPipeline(const VerifierOptions &options);

    boost::asio::awaitable<VerificationResult> verify_credential(boost::json::value credential) override;

  private:
    boost::asio::awaitable<void> run(boost::json::value credential, VerificationResult &result) const;

  private:
    std::shared_ptr<DocumentResolver> resolver;
    std::shared_ptr<FrameExtractor> extractor;
    ParameterAssembler assembler;
    CheckAggregator aggregator;
    ResultFinalizer finalizer;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:verifier")};
  };
} // namespace opencred

#endif // OPENCRED_VERIFICATION_PIPELINE_HH
