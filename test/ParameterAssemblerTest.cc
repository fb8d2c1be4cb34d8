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
#include <gmock/gmock.h>

#include <memory>
#include <stdexcept>

#include <boost/json.hpp>

#include "jsonld/JsonLdErrors.hh"
#include "opencred/CredentialErrors.hh"

#include "DocumentResolver.hh"
#include "FrameExtractor.hh"
#include "ParameterAssembler.hh"

#include "Coro.hh"
#include "CredentialFixture.hh"
#include "Fakes.hh"
#include "Mocks.hh"

using namespace opencred;
using ::testing::_;
using ::testing::InvokeWithoutArgs;

class ParameterAssemblerTest : public ::testing::Test
{
protected:
  void assemble(const boost::json::value &credential, std::shared_ptr<jsonld::Normalizer> with_normalizer = nullptr)
  {
    auto resolver = std::make_shared<DocumentResolver>(loader);
    auto extractor = std::make_shared<FrameExtractor>(framing ? framing : framer, resolver, false, "");
    ParameterAssembler assembler(resolver, extractor, with_normalizer ? with_normalizer : normalizer, CredentialFixture::CONTEXT);
    run_sync(assembler.assemble(credential, params, errors));
  }

  CredentialFixture fixture;
  std::shared_ptr<FakeDocumentLoader> loader = std::make_shared<FakeDocumentLoader>();
  std::shared_ptr<FakeFramer> framer = std::make_shared<FakeFramer>();
  std::shared_ptr<FakeNormalizer> normalizer = std::make_shared<FakeNormalizer>();
  std::shared_ptr<jsonld::Framer> framing;
  ParameterBundle params;
  ErrorMap errors;
};

TEST_F(ParameterAssemblerTest, all_parameters)
{
  fixture.publish(*loader);
  assemble(fixture.signed_credential());

  EXPECT_TRUE(errors.empty());
  ASSERT_TRUE(params.data.has_value());
  EXPECT_FALSE(params.data->contains("signature"));
  EXPECT_EQ(params.data->at("name"), "Passport");

  ASSERT_TRUE(params.signature.has_value());
  EXPECT_EQ(params.signature->signature_type, SignatureType::GraphSignature2012);
  EXPECT_EQ(params.signature->creator, CredentialFixture::KEY_URL);
  EXPECT_EQ(params.signature->created.value_or(""), fixture.created);
  EXPECT_FALSE(params.signature->nonce.has_value());

  ASSERT_TRUE(params.public_key.has_value());
  EXPECT_EQ(params.public_key->at("id"), CredentialFixture::KEY_URL);
  ASSERT_TRUE(params.identity.has_value());
  EXPECT_EQ(params.identity->at("id"), CredentialFixture::OWNER_URL);

  EXPECT_EQ(params.normalized.value_or(""), fixture.normalized());
  ASSERT_EQ(normalizer->requested.size(), 1);
  EXPECT_EQ(normalizer->requested[0].algorithm, jsonld::NormalizationAlgorithm::URGNA2012);
  EXPECT_EQ(normalizer->requested[0].format, "application/nquads");
}

TEST_F(ParameterAssemblerTest, credential_url)
{
  fixture.publish(*loader);
  loader->add(CredentialFixture::CREDENTIAL_URL, fixture.signed_credential());
  assemble(boost::json::value(CredentialFixture::CREDENTIAL_URL));

  EXPECT_TRUE(errors.empty());
  EXPECT_TRUE(params.signature.has_value());
  EXPECT_EQ(loader->load_count(CredentialFixture::CREDENTIAL_URL), 1);
}

TEST_F(ParameterAssemblerTest, unsigned_credential)
{
  fixture.publish(*loader);
  assemble(fixture.credential);

  EXPECT_TRUE(errors.empty());
  EXPECT_TRUE(params.data.has_value());
  EXPECT_FALSE(params.signature.has_value());
  EXPECT_FALSE(params.public_key.has_value());
  EXPECT_FALSE(params.normalized.has_value());
  EXPECT_EQ(loader->load_count(CredentialFixture::KEY_URL), 0);
}

TEST_F(ParameterAssemblerTest, credential_not_found)
{
  assemble(boost::json::value(CredentialFixture::CREDENTIAL_URL));

  ASSERT_TRUE(errors.contains(ErrorStage::Data));
  EXPECT_EQ(errors.find(ErrorStage::Data)->code, CredentialErrc::ResolutionFailed);
  EXPECT_EQ(errors.size(), 1);
  EXPECT_FALSE(params.data.has_value());
  EXPECT_FALSE(params.signature.has_value());
}

TEST_F(ParameterAssemblerTest, credential_not_framed)
{
  auto credential = fixture.signed_credential();
  credential["@context"] = "https://unknown.example.com/context";
  assemble(credential);

  ASSERT_TRUE(errors.contains(ErrorStage::Data));
  EXPECT_EQ(errors.find(ErrorStage::Data)->code, CredentialErrc::FramingFailed);
  EXPECT_THAT(errors.find(ErrorStage::Data)->message, ::testing::HasSubstr("no matching object found for frame"));
  EXPECT_FALSE(params.signature.has_value());
  EXPECT_TRUE(normalizer->requested.empty());
}

TEST_F(ParameterAssemblerTest, public_key_not_found)
{
  loader->add(CredentialFixture::OWNER_URL, fixture.identity);
  assemble(fixture.signed_credential());

  ASSERT_TRUE(errors.contains(ErrorStage::PublicKey));
  EXPECT_EQ(errors.find(ErrorStage::PublicKey)->code, CredentialErrc::ResolutionFailed);
  EXPECT_FALSE(errors.contains(ErrorStage::PublicKeyOwner));
  EXPECT_FALSE(params.public_key.has_value());
  EXPECT_FALSE(params.identity.has_value());
  EXPECT_EQ(loader->load_count(CredentialFixture::OWNER_URL), 0);
  EXPECT_TRUE(params.normalized.has_value());
}

TEST_F(ParameterAssemblerTest, public_key_not_framed)
{
  auto key = fixture.public_key;
  key["type"] = "Identity";
  loader->add(CredentialFixture::KEY_URL, key);
  assemble(fixture.signed_credential());

  ASSERT_TRUE(errors.contains(ErrorStage::PublicKey));
  EXPECT_EQ(errors.find(ErrorStage::PublicKey)->code, CredentialErrc::FramingFailed);
  EXPECT_THAT(errors.find(ErrorStage::PublicKey)->message, ::testing::HasSubstr("no matching object found for frame"));
  EXPECT_TRUE(params.normalized.has_value());
}

TEST_F(ParameterAssemblerTest, missing_creator)
{
  auto credential = fixture.signed_credential();
  credential["signature"].as_object().erase("creator");
  assemble(credential);

  ASSERT_TRUE(errors.contains(ErrorStage::PublicKey));
  EXPECT_EQ(errors.find(ErrorStage::PublicKey)->code, CredentialErrc::InvalidCredential);
  EXPECT_TRUE(params.signature.has_value());
}

TEST_F(ParameterAssemblerTest, identity_not_found)
{
  loader->add(CredentialFixture::KEY_URL, fixture.public_key);
  assemble(fixture.signed_credential());

  EXPECT_TRUE(params.public_key.has_value());
  EXPECT_FALSE(params.identity.has_value());
  ASSERT_TRUE(errors.contains(ErrorStage::PublicKeyOwner));
  EXPECT_EQ(errors.find(ErrorStage::PublicKeyOwner)->code, CredentialErrc::ResolutionFailed);
  EXPECT_TRUE(params.normalized.has_value());
}

TEST_F(ParameterAssemblerTest, identity_without_owner)
{
  auto key = fixture.public_key;
  key.erase("owner");
  loader->add(CredentialFixture::KEY_URL, key);
  assemble(fixture.signed_credential());

  ASSERT_TRUE(errors.contains(ErrorStage::PublicKeyOwner));
  EXPECT_EQ(errors.find(ErrorStage::PublicKeyOwner)->code, CredentialErrc::InvalidCredential);
}

TEST_F(ParameterAssemblerTest, badge_identity)
{
  auto identity = fixture.identity;
  identity["@context"] = CredentialFixture::BADGE_CONTEXT;
  loader->add(CredentialFixture::KEY_URL, fixture.public_key);
  loader->add(CredentialFixture::OWNER_URL, identity);
  assemble(fixture.signed_credential());

  EXPECT_FALSE(errors.contains(ErrorStage::PublicKeyOwner));
  ASSERT_TRUE(params.identity.has_value());
  EXPECT_EQ(params.identity->at("@context"), CredentialFixture::BADGE_CONTEXT);
  EXPECT_EQ(loader->load_count(CredentialFixture::OWNER_URL), 1);
}

TEST_F(ParameterAssemblerTest, identity_not_framed)
{
  auto identity = fixture.identity;
  identity["type"] = "Organization";
  loader->add(CredentialFixture::KEY_URL, fixture.public_key);
  loader->add(CredentialFixture::OWNER_URL, identity);
  assemble(fixture.signed_credential());

  ASSERT_TRUE(errors.contains(ErrorStage::PublicKeyOwner));
  const auto *error = errors.find(ErrorStage::PublicKeyOwner);
  EXPECT_EQ(error->code, CredentialErrc::FramingFailed);
  EXPECT_THAT(error->message, ::testing::HasSubstr(CredentialFixture::CONTEXT));
  EXPECT_THAT(error->message, ::testing::HasSubstr(CredentialFixture::BADGE_CONTEXT));
}

TEST_F(ParameterAssemblerTest, identity_framer_errors_reported_per_frame)
{
  auto mock = std::make_shared<FramerMock>();
  framing = mock;
  loader->add(CredentialFixture::KEY_URL, fixture.public_key);
  loader->add(CredentialFixture::OWNER_URL, fixture.identity);

  auto delegate = [this](boost::json::value input, boost::json::object frame) {
    return framer->frame(std::move(input), std::move(frame));
  };
  EXPECT_CALL(*mock, frame(_, _))
    .WillOnce(delegate)
    .WillOnce(delegate)
    .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<boost::json::value>> {
      co_return jsonld::JsonLdErrc::NotSupported;
    }))
    .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<boost::json::value>> {
      co_return jsonld::JsonLdErrc::LoadingDocumentFailed;
    }));
  assemble(fixture.signed_credential());

  EXPECT_TRUE(params.public_key.has_value());
  EXPECT_FALSE(params.identity.has_value());
  ASSERT_TRUE(errors.contains(ErrorStage::PublicKeyOwner));
  const auto *error = errors.find(ErrorStage::PublicKeyOwner);
  EXPECT_EQ(error->code, CredentialErrc::FramingFailed);
  EXPECT_THAT(error->message, ::testing::HasSubstr("operation not supported"));
  EXPECT_THAT(error->message, ::testing::HasSubstr("loading document failed"));
}

TEST_F(ParameterAssemblerTest, signature_fields)
{
  fixture.publish(*loader);
  auto credential = fixture.signed_credential("LinkedDataSignature2015");
  auto &signature = credential["signature"].as_object();
  signature["nonce"] = 1234;
  signature["domain"] = nullptr;
  boost::json::object created;
  created["@value"] = "2016-01-01T00:00:00Z";
  created["@type"] = "xsd:dateTime";
  signature["created"] = std::move(created);
  assemble(credential);

  ASSERT_TRUE(params.signature.has_value());
  EXPECT_EQ(params.signature->signature_type, SignatureType::LinkedDataSignature2015);
  EXPECT_EQ(params.signature->nonce.value_or(""), "1234");
  EXPECT_FALSE(params.signature->domain.has_value());
  EXPECT_EQ(params.signature->created.value_or(""), "2016-01-01T00:00:00Z");
  ASSERT_EQ(normalizer->requested.size(), 1);
  EXPECT_EQ(normalizer->requested[0].algorithm, jsonld::NormalizationAlgorithm::URDNA2015);
}

TEST_F(ParameterAssemblerTest, unknown_signature_type)
{
  fixture.publish(*loader);
  assemble(fixture.signed_credential("RsaSignature2018"));

  ASSERT_TRUE(params.signature.has_value());
  EXPECT_EQ(params.signature->signature_type, SignatureType::Unknown);
  EXPECT_EQ(params.signature->type, "RsaSignature2018");
  ASSERT_EQ(normalizer->requested.size(), 1);
  EXPECT_EQ(normalizer->requested[0].algorithm, jsonld::NormalizationAlgorithm::Default);
}

TEST_F(ParameterAssemblerTest, signature_not_an_object)
{
  fixture.publish(*loader);
  auto credential = fixture.credential;
  credential["signature"] = "c2lnbmF0dXJl";
  assemble(credential);

  EXPECT_TRUE(params.data.has_value());
  EXPECT_FALSE(params.data->contains("signature"));
  EXPECT_FALSE(params.signature.has_value());
  EXPECT_EQ(loader->load_count(CredentialFixture::KEY_URL), 0);
}

TEST_F(ParameterAssemblerTest, normalization_failure)
{
  fixture.publish(*loader);
  auto failing = std::make_shared<NormalizerMock>();
  EXPECT_CALL(*failing, normalize(_, _))
    .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<std::string>> {
      co_return jsonld::JsonLdErrc::NotSupported;
    }));
  assemble(fixture.signed_credential(), failing);

  ASSERT_TRUE(errors.contains(ErrorStage::Normalization));
  EXPECT_EQ(errors.find(ErrorStage::Normalization)->code, CredentialErrc::NormalizationFailed);
  EXPECT_FALSE(params.normalized.has_value());
  EXPECT_TRUE(params.public_key.has_value());
}

TEST_F(ParameterAssemblerTest, normalization_exception)
{
  fixture.publish(*loader);
  auto failing = std::make_shared<NormalizerMock>();
  EXPECT_CALL(*failing, normalize(_, _))
    .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<std::string>> {
      throw std::runtime_error("normalizer crashed");
      co_return std::string{};
    }));
  assemble(fixture.signed_credential(), failing);

  ASSERT_TRUE(errors.contains(ErrorStage::Normalization));
  EXPECT_EQ(errors.find(ErrorStage::Normalization)->message, "normalizer crashed");
}
