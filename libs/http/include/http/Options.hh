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

#ifndef OPENCRED_HTTP_OPTIONS_HH
#define OPENCRED_HTTP_OPTIONS_HH

#include <chrono>
#include <list>
#include <string>

namespace opencred::http
{
  class Options
  {
  public:
    Options() = default;

    void add_ca_cert(const std::string &cert);
    void set_follow_redirects(bool follow_redirects);
    void set_max_redirects(int max_redirects);
    void set_timeout(std::chrono::seconds timeout);
    void set_secure_only(bool secure_only);
    void set_accept(const std::string &accept);

    std::list<std::string> get_ca_certs() const;
    bool get_follow_redirects() const;
    int get_max_redirects() const;
    std::chrono::seconds get_timeout() const;
    bool get_secure_only() const;
    std::string get_accept() const;

  private:
    std::list<std::string> ca_certs;
    bool follow_redirects = true;
    int max_redirects = 5;
    bool secure_only = true;
    std::string accept = "application/ld+json, application/json";
    std::chrono::seconds timeout = std::chrono::seconds(30);
  };
} // namespace opencred::http

#endif // OPENCRED_HTTP_OPTIONS_HH
