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

#include "ResultFinalizer.hh"

#include <exception>
#include <utility>

#include <fmt/format.h>

#include "opencred/CredentialErrors.hh"

using namespace opencred;

ResultFinalizer::ResultFinalizer(std::shared_ptr<jsonld::Compactor> compactor, std::string context)
  : compactor(std::move(compactor))
  , context(std::move(context))
{
}

boost::asio::awaitable<void>
ResultFinalizer::finalize(ParameterBundle &params, ErrorMap &errors) const
{
  if (!params.data)
    {
      co_return;
    }

  try
    {
      auto rc = co_await compactor->compact(*params.data, boost::json::value(context));
      if (!rc)
        {
          logger->error("compaction failed ({})", rc.error().message());
          errors.set(ErrorStage::Compact,
                     {CredentialErrc::CompactionFailed, fmt::format("unable to compact credential ({})", rc.error().message())});
          co_return;
        }
      params.verified_data = std::move(rc.value());
    }
  catch (std::exception &e)
    {
      logger->error("exception while compacting credential: {}", e.what());
      errors.set(ErrorStage::Compact, {CredentialErrc::CompactionFailed, e.what()});
    }
}
