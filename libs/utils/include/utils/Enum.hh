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

#ifndef OPENCRED_UTILS_ENUM_HH
#define OPENCRED_UTILS_ENUM_HH

#include <type_traits>
#include <utility>
#include <array>
#include <algorithm>
#include <string>
#include <string_view>

#include <iostream>

namespace opencred::utils
{
  template<typename Enum>
  constexpr auto underlying_cast(Enum e) noexcept
  {
    return static_cast<std::underlying_type_t<Enum>>(e);
  }

  template<typename Enum>
  struct enum_traits
  {
  };

  template<typename Enum, typename = std::void_t<>>
  struct enum_has_names : std::false_type
  {
  };

  template<typename Enum>
  struct enum_has_names<Enum, std::void_t<decltype(enum_traits<Enum>::names)>> : std::true_type
  {
  };

  template<typename Enum>
  constexpr inline bool enum_has_names_v = enum_has_names<Enum>::value;

  template<typename Enum, typename = std::void_t<>>
  struct enum_has_invalid : std::false_type
  {
  };

  template<typename Enum>
  struct enum_has_invalid<Enum, std::void_t<decltype(enum_traits<Enum>::invalid)>> : std::true_type
  {
  };

  template<typename Enum>
  constexpr inline bool enum_has_invalid_v = enum_has_invalid<Enum>::value;

  template<typename Enum>
  requires enum_has_invalid_v<Enum>
  Enum enum_from_string(std::string_view key)
  {
    const auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(begin(names), end(names), [&key](const auto &v) { return v.first == key; });
    if (it == std::end(names))
      {
        return enum_traits<Enum>::invalid;
      }
    return it->second;
  }

  template<typename Enum>
  std::string_view enum_to_string(Enum e)
  {
    const auto &names = enum_traits<Enum>::names;
    const auto it = std::find_if(begin(names), end(names), [&e](const auto &v) { return v.second == e; });
    if (it == std::end(names))
      {
        return {};
      }
    return it->first;
  }
} // namespace opencred::utils

template<typename Enum>
requires opencred::utils::enum_has_names_v<Enum>
std::ostream &
operator<<(std::ostream &stream, const Enum e)
{
  stream << opencred::utils::enum_to_string(e);
  return stream;
}

#endif // OPENCRED_UTILS_ENUM_HH
