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

#ifndef OPENCRED_FRAME_EXTRACTOR_HH
#define OPENCRED_FRAME_EXTRACTOR_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "jsonld/Framer.hh"
#include "jsonld/JsonUtils.hh"
#include "utils/Logging.hh"

#include "DocumentResolver.hh"

namespace outcome = boost::outcome_v2;

namespace opencred
{
  class FrameExtractor
  {
  public:
    FrameExtractor(std::shared_ptr<jsonld::Framer> framer,
                   std::shared_ptr<DocumentResolver> resolver,
                   bool local_framing_disabled,
                   std::string local_base_uri);

    // Returns the first object of the input matching the frame, with the
    // frame's context as its "@context". An empty match is
    // JsonLdErrc::NoMatchingFrame, framer errors are returned unchanged.
    boost::asio::awaitable<outcome::std_result<boost::json::object>> extract(boost::json::value input,
                                                                             boost::json::object frame) const;

  private:
    bool is_local(const std::string &uri) const;
    outcome::std_result<boost::json::object> first_match(boost::json::value framed, const boost::json::value &context) const;

  private:
    std::shared_ptr<jsonld::Framer> framer;
    std::shared_ptr<DocumentResolver> resolver;
    bool local_framing_disabled{false};
    std::string local_base_uri;
    jsonld::JsonUtils json_utils;
    std::shared_ptr<spdlog::logger> logger{opencred::utils::Logging::create("opencred:framing")};
  };
} // namespace opencred

#endif // OPENCRED_FRAME_EXTRACTOR_HH
