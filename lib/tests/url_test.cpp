/* MIT License
 *
 * Copyright (c) 2024 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <url.hpp>

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace vnr;  // NOLINT

TEST(url_test, parse_basic) {
  std::error_code ec;
  const auto u = parse_url(
    "https://nodejs.org/dist/v20.0.0/node-v20.0.0-darwin-arm64.tar.gz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(u.scheme, "https");
  EXPECT_EQ(u.host, "nodejs.org");
  EXPECT_EQ(u.port, "443");
  EXPECT_EQ(u.target, "/dist/v20.0.0/node-v20.0.0-darwin-arm64.tar.gz");
  EXPECT_TRUE(u.is_https());
  EXPECT_TRUE(u.is_default_port());
  EXPECT_EQ(u.host_field(), "nodejs.org");
  EXPECT_EQ(u.origin(), "https://nodejs.org:443");
}

TEST(url_test, parse_upper_case_scheme_and_port) {
  std::error_code ec;
  const auto u = parse_url("HTTP://Example.COM:8080/a/b?x=1/2#frag", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(u.scheme, "http");
  EXPECT_EQ(u.host, "example.com");
  EXPECT_EQ(u.port, "8080");
  EXPECT_EQ(u.target, "/a/b?x=1/2");
  EXPECT_EQ(u.path(), "/a/b");
  EXPECT_EQ(u.host_field(), "example.com:8080");
  EXPECT_EQ(u.str(), "http://example.com:8080/a/b?x=1/2");
}

TEST(url_test, parse_host_only) {
  std::error_code ec;
  const auto u = parse_url("http://example.com", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(u.target, "/");
  EXPECT_EQ(u.port, "80");

  const auto q = parse_url("http://example.com?a=b", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(q.target, "/?a=b");
}

TEST(url_test, parse_ipv6_literal) {
  std::error_code ec;
  const auto u = parse_url("http://[::1]:8000/x.tgz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(u.host, "[::1]");
  EXPECT_EQ(u.resolver_host(), "::1");
  EXPECT_EQ(u.port, "8000");
  EXPECT_EQ(u.host_field(), "[::1]:8000");
}

TEST(url_test, parse_errors) {
  std::error_code ec;
  [[maybe_unused]] auto u = parse_url("", ec);
  EXPECT_EQ(ec, url_error_code::empty);

  u = parse_url("example.com/file", ec);
  EXPECT_EQ(ec, url_error_code::missing_scheme);

  u = parse_url("ftp://example.com/file", ec);
  EXPECT_EQ(ec, url_error_code::unsupported_scheme);

  u = parse_url("http:///file", ec);
  EXPECT_EQ(ec, url_error_code::missing_host);

  u = parse_url("http://example.com:/file", ec);
  EXPECT_EQ(ec, url_error_code::invalid_port);

  u = parse_url("http://example.com:http/file", ec);
  EXPECT_EQ(ec, url_error_code::invalid_port);

  u = parse_url("http://example.com:65536/file", ec);
  EXPECT_EQ(ec, url_error_code::invalid_port);
}

TEST(url_test, resolve_references) {
  std::error_code ec;
  const auto base = parse_url("https://example.com/dist/v1/file.tar.gz", ec);
  ASSERT_FALSE(ec);

  auto r = base.resolve("https://mirror.example.org/x/file.tar.gz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://mirror.example.org/x/file.tar.gz");

  r = base.resolve("//cdn.example.net/file.tar.gz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://cdn.example.net/file.tar.gz");

  r = base.resolve("/other/file.tar.gz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://example.com/other/file.tar.gz");

  r = base.resolve("../v2/file.tar.gz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://example.com/dist/v2/file.tar.gz");

  r = base.resolve("./new.tar.gz?sig=abc", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://example.com/dist/v1/new.tar.gz?sig=abc");

  r = base.resolve("dl?mirror=http://x/y", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://example.com/dist/v1/dl?mirror=http://x/y");

  r = base.resolve("/get?u=https://cdn.example.net/f.tgz", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(r.str(), "https://example.com/get?u=https://cdn.example.net/f.tgz");

  r = base.resolve("", ec);
  EXPECT_EQ(ec, url_error_code::empty);
}

TEST(url_test, file_name_from_url) {
  std::error_code ec;
  auto u = parse_url("https://nodejs.org/dist/v20.0.0/node.tar.gz?x=a/b", ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(file_name_from_url(u, ec), "node.tar.gz");
  EXPECT_FALSE(ec);

  u = parse_url("https://nodejs.org/dist/", ec);
  ASSERT_FALSE(ec);
  [[maybe_unused]] const auto name = file_name_from_url(u, ec);
  EXPECT_EQ(ec, url_error_code::no_file_name);
}

TEST(url_test, tarball_names) {
  EXPECT_TRUE(is_gzip_tarball_name("node-v20.0.0.tar.gz"));
  EXPECT_TRUE(is_gzip_tarball_name("x.tgz"));
  EXPECT_FALSE(is_gzip_tarball_name(".tar.gz"));
  EXPECT_FALSE(is_gzip_tarball_name("file.gz"));
  EXPECT_FALSE(is_gzip_tarball_name("file.zip"));
  EXPECT_EQ(extraction_dir_name("node-v20.0.0.tar.gz"), "node-v20.0.0");
  EXPECT_EQ(extraction_dir_name("x.tgz"), "x");
  EXPECT_EQ(extraction_dir_name("file.zip"), "file.zip");
}
