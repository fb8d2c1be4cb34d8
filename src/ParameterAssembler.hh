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

#ifndef OPENCRED_PARAMETER_ASSEMBLER_HH
#define OPENCRED_PARAMETER_ASSEMBLER_HH

#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "jsonld/JsonUtils.hh"
#include "jsonld/Normalizer.hh"
#include "opencred/VerificationResult.hh"
#include "utils/Logging.hh"

#include "DocumentResolver.hh"
#include "FrameExtractor.hh"

namespace opencred
{
  /**
   * Gathers the parameters needed to verify a credential: the claims, the
   * signature, the signer's public key and identity, and the normalized claims.
   *
   * Failure to frame the credential or to normalize the claims ends assembly.
   * Failure to obtain the public key or its owner is recorded and assembly
   * continues.
   */
  class ParameterAssembler
  {
  public:
    ParameterAssembler(std::shared_ptr<DocumentResolver> resolver,
                       std::shared_ptr<FrameExtractor> extractor,
                       std::shared_ptr<jsonld::Normalizer> normalizer,
                       std::string context);

    boost::asio::awaitable<void> assemble(boost::json::value credential, ParameterBundle &params, ErrorMap &errors) const;

  private:
    boost::asio::awaitable<bool> extract_data(boost::json::value credential, ParameterBundle &params, ErrorMap &errors) const;
    boost::asio::awaitable<void> fetch_public_key(ParameterBundle &params, ErrorMap &errors) const;
    boost::asio::awaitable<void> fetch_identity(ParameterBundle &params, ErrorMap &errors) const;
    boost::asio::awaitable<void> normalize(ParameterBundle &params, ErrorMap &errors) const;

    std::optional<Signature> parse_signature(const boost::json::value &value) const;
    std::optional<std::string> parse_signature_field(const boost::json::object &signature, std::string_view key) const;
    void record(ErrorMap &errors, ErrorStage stage, std::error_code ec, const std::string &what) const;
    void record_framing(ErrorMap &errors, ErrorStage stage, std::error_code ec, const std::string &what) const;

  private:
    std::shared_ptr<DocumentResolver> resolver;
    std::shared_ptr<FrameExtractor> extractor;
    std::shared_ptr<jsonld::Normalizer> normalizer;
    std::string context;
    jsonld::JsonUtils json_utils;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:assembler")};
  };
} // namespace opencred

#endif // OPENCRED_PARAMETER_ASSEMBLER_HH
