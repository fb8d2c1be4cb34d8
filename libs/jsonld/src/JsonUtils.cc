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

#include "jsonld/JsonUtils.hh"

namespace opencred::jsonld
{
  std::vector<boost::json::value> JsonUtils::get_values(const boost::json::value &json_val, std::string_view key) const
  {
    std::vector<boost::json::value> values;
    if (!json_val.is_object())
      {
        return values;
      }

    const auto *value = json_val.as_object().if_contains(key);
    if (value == nullptr || value->is_null())
      {
        return values;
      }

    if (value->is_array())
      {
        const auto &arr = value->as_array();
        values.assign(arr.begin(), arr.end());
      }
    else
      {
        values.push_back(*value);
      }
    return values;
  }

  std::optional<std::string> JsonUtils::node_id(const boost::json::value &json_val) const
  {
    if (json_val.is_string())
      {
        return std::string(json_val.as_string());
      }

    if (auto id = extract_string(json_val, "id"))
      {
        return id;
      }
    return extract_string(json_val, "@id");
  }

  std::optional<std::string> JsonUtils::extract_string(const boost::json::value &json_val, std::string_view key) const
  {
    if (!json_val.is_object())
      {
        return {};
      }

    const auto *value = json_val.as_object().if_contains(key);
    if (value == nullptr)
      {
        return {};
      }
    if (!value->is_string())
      {
        logger_->debug("property '{}' is not a string", key);
        return {};
      }
    return std::string(value->as_string());
  }

  bool JsonUtils::has_property(const boost::json::value &json_val, std::string_view key) const
  {
    return json_val.is_object() && json_val.as_object().contains(key);
  }

} // namespace opencred::jsonld
