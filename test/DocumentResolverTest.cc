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

#include <boost/json.hpp>

#include "jsonld/JsonLdErrors.hh"
#include "opencred/CredentialErrors.hh"

#include "DocumentResolver.hh"

#include "Coro.hh"
#include "Fakes.hh"
#include "Mocks.hh"

using namespace opencred;
using ::testing::_;
using ::testing::InvokeWithoutArgs;

class DocumentResolverTest : public ::testing::Test
{
protected:
  std::shared_ptr<FakeDocumentLoader> loader = std::make_shared<FakeDocumentLoader>();
  DocumentResolver resolver{loader};
};

TEST_F(DocumentResolverTest, inline_document)
{
  auto document = boost::json::parse(R"({"id": "https://example.com/1"})");
  auto rc = run_sync(resolver.resolve(document));
  ASSERT_FALSE(rc.has_error());
  EXPECT_EQ(rc.value(), document);
  EXPECT_EQ(loader->load_count("https://example.com/1"), 0);
}

TEST_F(DocumentResolverTest, url)
{
  loader->add("https://example.com/1", boost::json::parse(R"({"id": "https://example.com/1"})"));

  auto rc = run_sync(resolver.resolve(boost::json::value("https://example.com/1")));
  ASSERT_FALSE(rc.has_error());
  EXPECT_EQ(rc.value().at("id"), "https://example.com/1");
  EXPECT_EQ(loader->load_count("https://example.com/1"), 1);
}

TEST_F(DocumentResolverTest, parsed_body)
{
  auto mock = std::make_shared<DocumentLoaderMock>();
  DocumentResolver mock_resolver(mock);

  EXPECT_CALL(*mock, load(_))
    .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<jsonld::RemoteDocument>> {
      co_return jsonld::RemoteDocument{"https://example.com/1", boost::json::parse(R"({"name": "parsed"})")};
    }));

  auto rc = run_sync(mock_resolver.load("https://example.com/1"));
  ASSERT_FALSE(rc.has_error());
  EXPECT_EQ(rc.value().at("name"), "parsed");
}

TEST_F(DocumentResolverTest, not_found)
{
  auto rc = run_sync(resolver.resolve(boost::json::value("https://example.com/missing")));
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), CredentialErrc::ResolutionFailed);
}

TEST_F(DocumentResolverTest, invalid_json)
{
  loader->add_raw("https://example.com/broken", "{\"id\": ");

  auto rc = run_sync(resolver.load("https://example.com/broken"));
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), CredentialErrc::ResolutionFailed);
}

TEST_F(DocumentResolverTest, empty_url)
{
  auto rc = run_sync(resolver.load(""));
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), CredentialErrc::ResolutionFailed);
}

TEST_F(DocumentResolverTest, unsupported_reference)
{
  auto rc = run_sync(resolver.resolve(boost::json::value(42)));
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), CredentialErrc::ResolutionFailed);
}
