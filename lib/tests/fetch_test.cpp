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

#include <fetch.hpp>

#include <http_error_code.hpp>
#include <url.hpp>
#include <zlib_adapter.hpp>

#include "local_http_server.hpp"
#include "unit_test_utils.hpp"

#include <boost/beast/http/status.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

using namespace vnr;  // NOLINT

namespace fs = std::filesystem;

class fetch_mock : public testing::Test {
protected:
  auto
  SetUp() -> void override {
    outdir = generate_unique_dir_name();
    std::error_code ec;
    fs::create_directories(outdir, ec);
    ASSERT_FALSE(ec);

    contents = std::string(100000, 'v');
    const auto tarball = gzip_compress(tar_builder{}
                                         .add_dir("node-v1/")
                                         .add_dir("node-v1/bin/")
                                         .add_file("node-v1/bin/node", contents,
                                                   0755)
                                         .add_symlink("node-v1/bin/npm", "node")
                                         .finish());
    tarball_size = std::size(tarball);
    // four headers, the padded file data and two zero blocks
    uncompressed_size = 512 * 4 + std::size(contents);
    uncompressed_size += (512 - std::size(contents) % 512) % 512 + 1024;
    server.route("/dist/node-v1.tar.gz", [tarball](const auto &req) {
      return local_http_server::file_response(req, tarball);
    });
  }

  auto
  TearDown() -> void override {
    std::error_code ec;
    remove_directories(outdir, ec);
    EXPECT_FALSE(ec);
  }

  [[nodiscard]] auto
  request(const std::string &target) const -> fetch_request {
    return {server.url(target), outdir, config, true};
  }

public:
  local_http_server server;
  http_config config;
  std::string outdir;
  std::string contents;
  std::uint64_t tarball_size{};
  std::uint64_t uncompressed_size{};
};

TEST_F(fetch_mock, download_and_extract) {
  const auto [result, ec] = fetch(request("/dist/node-v1.tar.gz"));
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(result.status, 200u);
  EXPECT_EQ(result.output_file, fs::path(outdir) / "node-v1.tar.gz");
  EXPECT_EQ(result.extraction_dir, fs::path(outdir) / "node-v1");
  EXPECT_EQ(result.content_length, tarball_size);
  EXPECT_EQ(result.bytes_downloaded, tarball_size);
  EXPECT_EQ(fs::file_size(result.output_file), tarball_size);
  EXPECT_TRUE(result.accepts_ranges);
  ASSERT_TRUE(result.isize.has_value());
  EXPECT_EQ(*result.isize, uncompressed_size);
  EXPECT_EQ(result.bytes_uncompressed, uncompressed_size);
  EXPECT_EQ(result.n_entries, 4u);
  EXPECT_EQ(result.n_files, 1u);
  EXPECT_EQ(result.n_dirs, 2u);
  EXPECT_EQ(result.n_links, 1u);
  EXPECT_EQ(read_file(outdir + "/node-v1/node-v1/bin/node"), contents);
  EXPECT_TRUE(fs::is_symlink(outdir + "/node-v1/node-v1/bin/npm"));
  EXPECT_EQ(server.n_range_requests.load(), 1u);
  EXPECT_FALSE(result.summary().empty());
}

TEST_F(fetch_mock, no_extract) {
  auto req = request("/dist/node-v1.tar.gz");
  req.extract = false;
  const auto [result, ec] = fetch(req);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_TRUE(result.extraction_dir.empty());
  EXPECT_FALSE(fs::exists(fs::path(outdir) / "node-v1"));
  EXPECT_EQ(fs::file_size(result.output_file), tarball_size);
  ASSERT_TRUE(result.isize.has_value());
  EXPECT_EQ(*result.isize, uncompressed_size);
}

TEST_F(fetch_mock, through_redirect) {
  server.route("/latest.tar.gz", [](const auto &req) {
    return local_http_server::redirect(req, "/dist/node-v1.tar.gz");
  });
  const auto [result, ec] = fetch(request("/latest.tar.gz"));
  ASSERT_FALSE(ec) << ec.message();
  // the file is named from the requested url
  EXPECT_EQ(result.output_file, fs::path(outdir) / "latest.tar.gz");
  EXPECT_EQ(result.effective_url, server.url("/dist/node-v1.tar.gz"));
  EXPECT_EQ(std::size(result.redirects), 1u);
  EXPECT_EQ(read_file(outdir + "/latest/node-v1/bin/node"), contents);
}

TEST_F(fetch_mock, plain_file) {
  server.route("/notes.txt", [](const auto &req) {
    return local_http_server::file_response(req, "release notes\n");
  });
  const auto [result, ec] = fetch(request("/notes.txt"));
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(read_file(outdir + "/notes.txt"), "release notes\n");
  EXPECT_FALSE(result.isize.has_value());
  EXPECT_EQ(server.n_range_requests.load(), 0u);
}

TEST_F(fetch_mock, destination_not_a_directory) {
  auto req = request("/dist/node-v1.tar.gz");
  req.outdir = outdir + "/does-not-exist";
  const auto [result, ec] = fetch(req);
  EXPECT_EQ(ec, fetch_error_code::not_a_directory);
  EXPECT_EQ(server.n_requests.load(), 0u);
}

TEST_F(fetch_mock, bad_status) {
  const auto [result, ec] = fetch(request("/dist/missing.tar.gz"));
  EXPECT_EQ(ec, http_error_code::bad_status);
  EXPECT_EQ(result.status, 404u);
}

TEST_F(fetch_mock, missing_content_length) {
  server.route("/chunked.bin", [](const local_http_server::request_type &req) {
    local_http_server::response_type res{boost::beast::http::status::ok,
                                         req.version()};
    res.chunked(true);
    res.body() = "some bytes";
    return res;
  });
  const auto [result, ec] = fetch(request("/chunked.bin"));
  EXPECT_EQ(ec, http_error_code::missing_content_length);
}

TEST_F(fetch_mock, body_shorter_than_content_length) {
  server.raw_route("/short.bin", "HTTP/1.1 200 OK\r\n"
                                 "Content-Length: 1000\r\n"
                                 "\r\n"
                                 "only a few bytes");
  const auto [result, ec] = fetch(request("/short.bin"));
  EXPECT_TRUE(ec == http_error_code::reading_body_failed ||
              ec == fetch_error_code::truncated_body)
    << ec.message();
  EXPECT_LT(result.bytes_downloaded, 1000u);
}

TEST_F(fetch_mock, corrupt_tarball) {
  server.route("/bad.tar.gz", [](const auto &req) {
    return local_http_server::file_response(req, "this is not gzip data at all");
  });
  const auto [result, ec] = fetch(request("/bad.tar.gz"));
  EXPECT_EQ(ec, zlib_adapter_error_code::z_data_error);
}

TEST_F(fetch_mock, range_ignored_isize_unknown) {
  const auto tarball = gzip_compress(
    tar_builder{}.add_file("pkg/file.txt", contents).finish());
  // always the full body with status 200, whatever the Range header says
  server.route("/norange.tar.gz", [tarball](const auto &req) {
    local_http_server::response_type res{boost::beast::http::status::ok,
                                         req.version()};
    res.body() = tarball;
    res.prepare_payload();
    return res;
  });
  const auto [result, ec] = fetch(request("/norange.tar.gz"));
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_FALSE(result.accepts_ranges);
  EXPECT_FALSE(result.isize.has_value());
  EXPECT_EQ(server.n_range_requests.load(), 1u);
  EXPECT_EQ(read_file(outdir + "/norange/pkg/file.txt"), contents);
}

TEST_F(fetch_mock, interrupted_by_signal) {
  server.route("/hang.tar.gz", [](const auto &req) {
    std::raise(SIGINT);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return local_http_server::file_response(req, "too late");
  });
  const auto [result, ec] = fetch(request("/hang.tar.gz"));
  EXPECT_EQ(ec, http_error_code::interrupted);
  EXPECT_EQ(result.status, 0u);
}

TEST(fetch_test, output_file_path) {
  fetch_request req;
  req.url = "https://example.com/dist/v1/pkg.tar.gz";
  req.outdir = fs::temp_directory_path().string();
  std::error_code ec;
  const auto p = output_file_path(req, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(p, fs::temp_directory_path() / "pkg.tar.gz");

  req.url = "https://example.com/dist/";
  [[maybe_unused]] const auto none = output_file_path(req, ec);
  EXPECT_EQ(ec, url_error_code::no_file_name);

  req.url = "not a url";
  [[maybe_unused]] const auto bad = output_file_path(req, ec);
  EXPECT_TRUE(ec);
}
