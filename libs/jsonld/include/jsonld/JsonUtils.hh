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

#ifndef OPENCRED_JSONLD_JSON_UTILS_HH
#define OPENCRED_JSONLD_JSON_UTILS_HH

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

namespace opencred::jsonld
{
  class JsonUtils
  {
  public:
    JsonUtils() = default;

    // All values of a property. A missing or null property yields no values,
    // an array yields its elements, anything else yields itself.
    std::vector<boost::json::value> get_values(const boost::json::value &json_val, std::string_view key) const;

    // Node identifier of a value: the string itself, or the "id"/"@id" of an object.
    std::optional<std::string> node_id(const boost::json::value &json_val) const;

    std::optional<std::string> extract_string(const boost::json::value &json_val, std::string_view key) const;
    bool has_property(const boost::json::value &json_val, std::string_view key) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{opencred::utils::Logging::create("opencred:jsonld:json")};
  };

} // namespace opencred::jsonld

#endif // OPENCRED_JSONLD_JSON_UTILS_HH
