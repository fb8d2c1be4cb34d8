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

#include "FrameExtractor.hh"

#include <utility>

#include "jsonld/JsonLdErrors.hh"
#include "opencred/CredentialErrors.hh"

using namespace opencred;

FrameExtractor::FrameExtractor(std::shared_ptr<jsonld::Framer> framer,
                               std::shared_ptr<DocumentResolver> resolver,
                               bool local_framing_disabled,
                               std::string local_base_uri)
  : framer(std::move(framer))
  , resolver(std::move(resolver))
  , local_framing_disabled(local_framing_disabled)
  , local_base_uri(std::move(local_base_uri))
{
}

boost::asio::awaitable<outcome::std_result<boost::json::object>>
FrameExtractor::extract(boost::json::value input, boost::json::object frame) const
{
  if (local_framing_disabled)
    {
      if (input.is_string() && is_local(std::string(input.as_string())))
        {
          logger->debug("skip framing of local document {}", input.as_string());
          auto rc = co_await resolver->resolve(input);
          if (!rc)
            {
              co_return rc.as_failure();
            }
          if (!rc.value().is_object())
            {
              logger->error("local document {} is not an object", input.as_string());
              co_return CredentialErrc::ResolutionFailed;
            }
          co_return std::move(rc.value().as_object());
        }

      auto id = json_utils.extract_string(input, "id");
      if (input.is_object() && id && is_local(*id))
        {
          logger->debug("skip framing of local object {}", *id);
          co_return input.as_object();
        }
    }

  if (input.is_string())
    {
      auto rc = co_await resolver->resolve(input);
      if (!rc)
        {
          co_return rc.as_failure();
        }
      input = std::move(rc.value());
    }

  boost::json::value context = frame["@context"];
  boost::json::object null_base;
  null_base["@base"] = nullptr;
  boost::json::array frame_context;
  frame_context.push_back(context);
  frame_context.push_back(std::move(null_base));
  frame["@context"] = std::move(frame_context);

  auto framed = co_await framer->frame(std::move(input), std::move(frame));
  if (!framed)
    {
      logger->error("framing failed ({})", framed.error().message());
      co_return framed.as_failure();
    }

  co_return first_match(std::move(framed.value()), context);
}

outcome::std_result<boost::json::object>
FrameExtractor::first_match(boost::json::value framed, const boost::json::value &context) const
{
  if (!framed.is_object())
    {
      logger->error("framed output is not an object");
      return jsonld::JsonLdErrc::InvalidDocument;
    }

  auto &framed_obj = framed.as_object();
  boost::json::object match;

  if (auto *graph = framed_obj.if_contains("@graph"))
    {
      if (!graph->is_array() || graph->as_array().empty() || !graph->as_array().front().is_object())
        {
          logger->error("no matching object found for frame");
          return jsonld::JsonLdErrc::NoMatchingFrame;
        }
      match = std::move(graph->as_array().front().as_object());
    }
  else
    {
      // A single match may be returned without a "@graph" wrapper.
      framed_obj.erase("@context");
      if (framed_obj.empty())
        {
          logger->error("no matching object found for frame");
          return jsonld::JsonLdErrc::NoMatchingFrame;
        }
      match = std::move(framed_obj);
    }

  match["@context"] = context;
  return match;
}

bool
FrameExtractor::is_local(const std::string &uri) const
{
  return uri.starts_with(local_base_uri);
}
