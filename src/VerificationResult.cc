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

#include "opencred/VerificationResult.hh"

#include <algorithm>

#include <boost/date_time/posix_time/posix_time.hpp>

using namespace opencred;

void
CheckResults::set(CheckName name, bool value)
{
  auto it = std::find_if(checks.begin(), checks.end(), [name](const auto &c) { return c.first >= name; });
  if (it != checks.end() && it->first == name)
    {
      it->second = value;
      return;
    }
  checks.emplace(it, name, value);
}

std::optional<bool>
CheckResults::get(CheckName name) const
{
  auto it = std::find_if(checks.begin(), checks.end(), [name](const auto &c) { return c.first == name; });
  if (it == checks.end())
    {
      return {};
    }
  return it->second;
}

bool
CheckResults::contains(CheckName name) const
{
  return get(name).has_value();
}

bool
CheckResults::empty() const
{
  return checks.empty();
}

std::size_t
CheckResults::size() const
{
  return checks.size();
}

const std::vector<CheckResults::entry_t> &
CheckResults::entries() const
{
  return checks;
}

bool
CheckResults::verified() const
{
  return get(CheckName::Signed).value_or(false)
         && std::all_of(checks.begin(), checks.end(), [](const auto &c) { return c.second; });
}

void
ErrorMap::set(ErrorStage stage, VerificationError error)
{
  auto it = std::find_if(errors.begin(), errors.end(), [stage](const auto &e) { return e.first >= stage; });
  if (it != errors.end() && it->first == stage)
    {
      it->second = std::move(error);
      return;
    }
  errors.emplace(it, stage, std::move(error));
}

const VerificationError *
ErrorMap::find(ErrorStage stage) const
{
  auto it = std::find_if(errors.begin(), errors.end(), [stage](const auto &e) { return e.first == stage; });
  if (it == errors.end())
    {
      return nullptr;
    }
  return &it->second;
}

bool
ErrorMap::contains(ErrorStage stage) const
{
  return find(stage) != nullptr;
}

bool
ErrorMap::empty() const
{
  return errors.empty();
}

std::size_t
ErrorMap::size() const
{
  return errors.size();
}

const std::vector<ErrorMap::entry_t> &
ErrorMap::entries() const
{
  return errors;
}

SignatureType
opencred::signature_type_from_string(std::string_view type)
{
  return utils::enum_from_string<SignatureType>(type);
}

namespace
{
  std::string to_iso_string(std::chrono::sys_seconds tp)
  {
    boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
    auto pt = epoch + boost::posix_time::seconds(tp.time_since_epoch().count());
    return boost::posix_time::to_iso_extended_string(pt) + "Z";
  }

  boost::json::value signature_to_json(const Signature &signature)
  {
    boost::json::object obj;
    obj["type"] = signature.type;
    obj["creator"] = signature.creator;
    if (signature.created)
      {
        obj["created"] = *signature.created;
      }
    if (signature.nonce)
      {
        obj["nonce"] = *signature.nonce;
      }
    if (signature.domain)
      {
        obj["domain"] = *signature.domain;
      }
    obj["signatureValue"] = signature.signature_value;
    return obj;
  }
} // namespace

boost::json::value
opencred::to_json(const VerificationResult &result)
{
  const auto &params = result.params;

  boost::json::object params_json;
  if (params.data)
    {
      params_json["data"] = *params.data;
    }
  if (params.signature)
    {
      params_json["signature"] = signature_to_json(*params.signature);
    }
  if (params.public_key)
    {
      params_json["publicKey"] = *params.public_key;
    }
  if (params.identity)
    {
      params_json["identity"] = *params.identity;
    }
  if (params.normalized)
    {
      params_json["normalized"] = *params.normalized;
    }
  if (params.signed_data)
    {
      params_json["signedData"] = *params.signed_data;
    }
  params_json["hasExpiration"] = params.has_expiration;
  if (params.expiration)
    {
      params_json["expiration"] = to_iso_string(*params.expiration);
    }
  if (params.verified_data)
    {
      params_json["verifiedData"] = *params.verified_data;
    }

  boost::json::object tests_json;
  for (const auto &[name, value]: result.tests.entries())
    {
      tests_json[utils::enum_to_string(name)] = value;
    }
  tests_json["verified"] = result.verified();

  boost::json::object errors_json;
  for (const auto &[stage, error]: result.errors.entries())
    {
      boost::json::object error_json;
      error_json["code"] = error.code.value();
      error_json["category"] = error.code.category().name();
      error_json["message"] = error.message;
      errors_json[utils::enum_to_string(stage)] = std::move(error_json);
    }

  boost::json::object result_json;
  result_json["params"] = std::move(params_json);
  result_json["tests"] = std::move(tests_json);
  result_json["errors"] = std::move(errors_json);
  return result_json;
}
