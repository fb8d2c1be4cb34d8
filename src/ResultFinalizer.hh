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

#ifndef OPENCRED_RESULT_FINALIZER_HH
#define OPENCRED_RESULT_FINALIZER_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "jsonld/Compactor.hh"
#include "opencred/VerificationResult.hh"
#include "utils/Logging.hh"

namespace opencred
{
  class ResultFinalizer
  {
  public:
    ResultFinalizer(std::shared_ptr<jsonld::Compactor> compactor, std::string context);

    // Compacts the claims into params.verified_data. Does not change any check.
    boost::asio::awaitable<void> finalize(ParameterBundle &params, ErrorMap &errors) const;

  private:
    std::shared_ptr<jsonld::Compactor> compactor;
    std::string context;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:finalizer")};
  };
} // namespace opencred

#endif // OPENCRED_RESULT_FINALIZER_HH
