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

#ifndef OPENCRED_JSONLD_NORMALIZER_HH
#define OPENCRED_JSONLD_NORMALIZER_HH

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "utils/Enum.hh"

namespace outcome = boost::outcome_v2;

namespace opencred::jsonld
{
  enum class NormalizationAlgorithm
  {
    Default,
    URGNA2012,
    URDNA2015,
  };

  struct NormalizeOptions
  {
    NormalizationAlgorithm algorithm{NormalizationAlgorithm::Default};
    std::string format{"application/nquads"};
  };

  class Normalizer
  {
  public:
    virtual ~Normalizer() = default;

    virtual boost::asio::awaitable<outcome::std_result<std::string>> normalize(boost::json::value input,
                                                                                NormalizeOptions options) = 0;
  };
} // namespace opencred::jsonld

template<>
struct opencred::utils::enum_traits<opencred::jsonld::NormalizationAlgorithm>
{
  static constexpr auto min = opencred::jsonld::NormalizationAlgorithm::Default;
  static constexpr auto max = opencred::jsonld::NormalizationAlgorithm::URDNA2015;
  static constexpr auto linear = true;

  static constexpr std::array<std::pair<std::string_view, opencred::jsonld::NormalizationAlgorithm>, 3> names{
    {{"default", opencred::jsonld::NormalizationAlgorithm::Default},
     {"URGNA2012", opencred::jsonld::NormalizationAlgorithm::URGNA2012},
     {"URDNA2015", opencred::jsonld::NormalizationAlgorithm::URDNA2015}}};
};

#endif // OPENCRED_JSONLD_NORMALIZER_HH
