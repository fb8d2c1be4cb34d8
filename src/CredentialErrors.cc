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

#include "opencred/CredentialErrors.hh"

using namespace opencred;

namespace
{
  class CredentialErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "opencred";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<CredentialErrc>(ev))
        {
        case CredentialErrc::Success:
          return "success";
        case CredentialErrc::ResolutionFailed:
          return "failed to resolve document";
        case CredentialErrc::FramingFailed:
          return "no matching object found for frame";
        case CredentialErrc::NormalizationFailed:
          return "failed to normalize document";
        case CredentialErrc::SignatureMismatch:
          return "signature value incorrect";
        case CredentialErrc::SignatureVerificationFailed:
          return "failed to verify signature";
        case CredentialErrc::CompactionFailed:
          return "failed to compact document";
        case CredentialErrc::InvalidConfiguration:
          return "invalid configuration";
        case CredentialErrc::InvalidCredential:
          return "invalid credential";
        case CredentialErrc::InternalError:
          return "internal error";
        }
      return "(unknown)";
    }
  };

  const CredentialErrorCategory globalCredentialErrorCategory{};
} // namespace

std::error_code
opencred::make_error_code(CredentialErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalCredentialErrorCategory};
}
