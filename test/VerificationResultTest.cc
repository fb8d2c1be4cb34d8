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

#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "opencred/CredentialErrors.hh"
#include "opencred/VerificationResult.hh"
#include "utils/DateUtils.hh"

using namespace opencred;

TEST(CheckResults, empty)
{
  CheckResults tests;
  EXPECT_TRUE(tests.empty());
  EXPECT_FALSE(tests.get(CheckName::Signed).has_value());
  EXPECT_FALSE(tests.verified());
}

TEST(CheckResults, kept_in_check_order)
{
  CheckResults tests;
  tests.set(CheckName::NotExpired, true);
  tests.set(CheckName::Signed, true);
  tests.set(CheckName::PublicKeyOwner, false);

  ASSERT_EQ(tests.size(), 3);
  EXPECT_EQ(tests.entries()[0].first, CheckName::Signed);
  EXPECT_EQ(tests.entries()[1].first, CheckName::PublicKeyOwner);
  EXPECT_EQ(tests.entries()[2].first, CheckName::NotExpired);
}

TEST(CheckResults, set_replaces)
{
  CheckResults tests;
  tests.set(CheckName::NotExpired, true);
  tests.set(CheckName::NotExpired, false);
  EXPECT_EQ(tests.size(), 1);
  EXPECT_EQ(tests.get(CheckName::NotExpired), false);
}

TEST(CheckResults, absent_is_not_false)
{
  CheckResults tests;
  tests.set(CheckName::Signed, true);
  tests.set(CheckName::KnownSignatureType, false);

  EXPECT_TRUE(tests.contains(CheckName::KnownSignatureType));
  EXPECT_FALSE(tests.contains(CheckName::SignatureVerified));
  EXPECT_EQ(tests.get(CheckName::KnownSignatureType), false);
}

TEST(CheckResults, verified_requires_signed)
{
  CheckResults tests;
  tests.set(CheckName::NotExpired, true);
  EXPECT_FALSE(tests.verified());

  tests.set(CheckName::Signed, false);
  EXPECT_FALSE(tests.verified());

  tests.set(CheckName::Signed, true);
  EXPECT_TRUE(tests.verified());
}

TEST(CheckResults, verified_fails_on_any_false_check)
{
  CheckResults tests;
  tests.set(CheckName::Signed, true);
  tests.set(CheckName::PublicKeyAccessible, true);
  tests.set(CheckName::PublicKeyOwner, true);
  tests.set(CheckName::KnownSignatureType, true);
  tests.set(CheckName::SignatureVerified, true);
  tests.set(CheckName::NotExpired, true);
  EXPECT_TRUE(tests.verified());

  tests.set(CheckName::PublicKeyNotRevoked, false);
  EXPECT_FALSE(tests.verified());
}

TEST(ErrorMap, set_and_find)
{
  ErrorMap errors;
  EXPECT_TRUE(errors.empty());
  EXPECT_EQ(errors.find(ErrorStage::Signature), nullptr);

  errors.set(ErrorStage::Signature, {CredentialErrc::SignatureMismatch, "signature value incorrect"});
  errors.set(ErrorStage::PublicKey, {CredentialErrc::ResolutionFailed, "first"});
  errors.set(ErrorStage::PublicKey, {CredentialErrc::FramingFailed, "second"});

  ASSERT_EQ(errors.size(), 2);
  EXPECT_EQ(errors.entries()[0].first, ErrorStage::PublicKey);
  EXPECT_EQ(errors.entries()[1].first, ErrorStage::Signature);

  const auto *error = errors.find(ErrorStage::PublicKey);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, CredentialErrc::FramingFailed);
  EXPECT_EQ(error->message, "second");
  EXPECT_TRUE(errors.contains(ErrorStage::Signature));
  EXPECT_FALSE(errors.contains(ErrorStage::Compact));
}

TEST(SignatureType, from_string)
{
  EXPECT_EQ(signature_type_from_string("GraphSignature2012"), SignatureType::GraphSignature2012);
  EXPECT_EQ(signature_type_from_string("LinkedDataSignature2015"), SignatureType::LinkedDataSignature2015);
  EXPECT_EQ(signature_type_from_string("RsaSignature2018"), SignatureType::Unknown);
  EXPECT_EQ(signature_type_from_string(""), SignatureType::Unknown);
}

TEST(VerificationResult, to_json)
{
  VerificationResult result;
  result.params.data = boost::json::parse(R"({"name": "Passport"})").as_object();
  Signature signature;
  signature.type = "GraphSignature2012";
  signature.signature_type = SignatureType::GraphSignature2012;
  signature.creator = "https://example.com/keys/1";
  signature.created = "2015-01-01T00:00:00Z";
  signature.signature_value = "c2ln";
  result.params.signature = signature;
  result.params.has_expiration = true;
  result.params.expiration = utils::DateUtils::parse_time_point("2016-01-01T00:00:00Z");

  result.tests.set(CheckName::Signed, true);
  result.tests.set(CheckName::SignatureVerified, false);
  result.errors.set(ErrorStage::Signature, {CredentialErrc::SignatureMismatch, "signature value incorrect"});

  auto json = to_json(result);
  const auto &params = json.at("params");
  EXPECT_EQ(params.at("data").at("name"), "Passport");
  EXPECT_EQ(params.at("signature").at("creator"), "https://example.com/keys/1");
  EXPECT_EQ(params.at("signature").at("created"), "2015-01-01T00:00:00Z");
  EXPECT_FALSE(params.at("signature").as_object().contains("nonce"));
  EXPECT_EQ(params.at("hasExpiration"), true);
  EXPECT_EQ(params.at("expiration"), "2016-01-01T00:00:00Z");
  EXPECT_FALSE(params.as_object().contains("publicKey"));

  const auto &tests = json.at("tests");
  EXPECT_EQ(tests.at("signed"), true);
  EXPECT_EQ(tests.at("signatureVerified"), false);
  EXPECT_EQ(tests.at("verified"), false);
  EXPECT_FALSE(tests.as_object().contains("notExpired"));

  const auto &error = json.at("errors").at("signature");
  EXPECT_EQ(error.at("category"), "opencred");
  EXPECT_EQ(error.at("message"), "signature value incorrect");
  EXPECT_EQ(error.at("code").to_number<int>(), static_cast<int>(CredentialErrc::SignatureMismatch));
}
