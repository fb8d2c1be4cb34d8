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

#ifndef OPENCRED_MOCKS_HH
#define OPENCRED_MOCKS_HH

#include "gmock/gmock.h"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "crypto/CryptoProvider.hh"
#include "jsonld/Compactor.hh"
#include "jsonld/DocumentLoader.hh"
#include "jsonld/Framer.hh"
#include "jsonld/Normalizer.hh"
#include "utils/TimeSource.hh"

class DocumentLoaderMock : public opencred::jsonld::DocumentLoader
{
public:
  MOCK_METHOD(boost::asio::awaitable<outcome::std_result<opencred::jsonld::RemoteDocument>>, load, (std::string url), (override));
};

class FramerMock : public opencred::jsonld::Framer
{
public:
  MOCK_METHOD(boost::asio::awaitable<outcome::std_result<boost::json::value>>,
              frame,
              (boost::json::value input, boost::json::object frame),
              (override));
};

class NormalizerMock : public opencred::jsonld::Normalizer
{
public:
  MOCK_METHOD(boost::asio::awaitable<outcome::std_result<std::string>>,
              normalize,
              (boost::json::value input, opencred::jsonld::NormalizeOptions options),
              (override));
};

class CompactorMock : public opencred::jsonld::Compactor
{
public:
  MOCK_METHOD(boost::asio::awaitable<outcome::std_result<boost::json::value>>,
              compact,
              (boost::json::value input, boost::json::value context),
              (override));
};

class CryptoProviderMock : public opencred::crypto::CryptoProvider
{
public:
  MOCK_METHOD(outcome::std_result<std::shared_ptr<opencred::crypto::PublicKey>>, parse_public_key_pem, (const std::string &pem), (override));
  MOCK_METHOD(outcome::std_result<std::string>,
              digest,
              (opencred::crypto::DigestAlgorithm algorithm, std::string_view data),
              (override));
  MOCK_METHOD(outcome::std_result<bool>,
              verify,
              (const opencred::crypto::PublicKey &key,
               opencred::crypto::DigestAlgorithm algorithm,
               const std::string &digest,
               const std::string &signature),
              (override));
};

class TimeSourceMock : public opencred::utils::TimeSource
{
public:
  MOCK_METHOD(std::chrono::system_clock::time_point, now, (), (const, override));
};

#endif // OPENCRED_MOCKS_HH
