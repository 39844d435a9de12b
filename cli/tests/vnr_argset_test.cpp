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

#include "vnr_argset.hpp"

#include <fetch.hpp>
#include <http_session.hpp>
#include <logger.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace vnr;  // NOLINT

static constexpr auto usage = "Usage: vnr [options] <url> <destination>";
static constexpr auto about = "vnr: trace a download";
static constexpr auto description = "";

[[nodiscard]] static auto
parse_args(vnr_argset &args,
           const std::vector<const char *> &argv) -> std::error_code {
  return args.parse(static_cast<int>(std::size(argv)), argv.data(), usage,
                    about, description);
}

TEST(vnr_argset_test, positionals_and_defaults) {
  vnr_argset args;
  const auto ec =
    parse_args(args, {"vnr", "https://nodejs.org/x.tar.gz", "/tmp"});
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(args.url, "https://nodejs.org/x.tar.gz");
  EXPECT_EQ(args.destination, "/tmp");
  EXPECT_EQ(args.connect_timeout, 10u);
  EXPECT_EQ(args.read_timeout, 30u);
  EXPECT_EQ(args.max_redirects, 5u);
  EXPECT_EQ(args.ip_version, ip_version_t::any);
  EXPECT_EQ(args.tls_version, tls_version_t::any);
  EXPECT_EQ(args.log_level, log_level_t::debug);
  EXPECT_FALSE(args.insecure);
  EXPECT_FALSE(args.no_reuse);
  EXPECT_FALSE(args.no_extract);
  EXPECT_TRUE(args.user_agent.starts_with("vnr/"));
}

TEST(vnr_argset_test, options_map_to_request) {
  vnr_argset args;
  const auto ec = parse_args(
    args, {"vnr", "--connect-timeout", "3", "--read-timeout", "7",
           "--max-redirects", "2", "--ip-version", "v4", "--tls-version",
           "1.3", "-k", "--no-reuse", "--no-extract", "-v", "warning",
           "http://example.com/f.tgz", "out"});
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(args.log_level, log_level_t::warning);
  const auto req = args.to_fetch_request();
  EXPECT_EQ(req.url, "http://example.com/f.tgz");
  EXPECT_EQ(req.outdir, "out");
  EXPECT_EQ(req.config.connect_timeout.count(), 3000);
  EXPECT_EQ(req.config.read_timeout.count(), 7000);
  EXPECT_EQ(req.config.max_redirects, 2u);
  EXPECT_EQ(req.config.ip_version, ip_version_t::v4);
  EXPECT_EQ(req.config.tls_version, tls_version_t::tls1_3);
  EXPECT_TRUE(req.config.insecure);
  EXPECT_FALSE(req.config.reuse_connections);
  EXPECT_FALSE(req.extract);
}

TEST(vnr_argset_test, missing_destination) {
  vnr_argset args;
  const auto ec = parse_args(args, {"vnr", "https://nodejs.org/"});
  EXPECT_EQ(ec, argument_error_code::failure);
}

TEST(vnr_argset_test, bad_enum_value) {
  vnr_argset args;
  const auto ec = parse_args(
    args, {"vnr", "--ip-version", "v5", "http://a.b/c.tgz", "."});
  EXPECT_EQ(ec, argument_error_code::failure);
}

TEST(vnr_argset_test, help_and_no_args) {
  vnr_argset args;
  EXPECT_EQ(parse_args(args, {"vnr", "--help"}),
            argument_error_code::help_requested);
  EXPECT_EQ(parse_args(args, {"vnr", "--version"}),
            argument_error_code::help_requested);
  EXPECT_EQ(parse_args(args, {"vnr"}), argument_error_code::failure);
}

TEST(vnr_argset_test, config_file) {
  const auto config_file =
    std::filesystem::temp_directory_path() / "vnr_argset_test.conf";
  {
    std::ofstream out(config_file);
    out << "max-redirects = 9\n"
        << "user-agent = custom-agent\n"
        << "read-timeout = 12\n";
  }
  vnr_argset args;
  const auto ec =
    parse_args(args, {"vnr", "-c", config_file.c_str(), "--read-timeout", "4",
                      "http://example.com/f.tgz", "."});
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(args.max_redirects, 9u);
  EXPECT_EQ(args.user_agent, "custom-agent");
  // the command line takes precedence
  EXPECT_EQ(args.read_timeout, 4u);
  std::error_code rm_ec;
  std::filesystem::remove(config_file, rm_ec);
  EXPECT_FALSE(rm_ec);
}

TEST(vnr_argset_test, missing_config_file) {
  vnr_argset args;
  const auto ec = parse_args(args, {"vnr", "-c", "/no/such/vnr.conf",
                                    "http://example.com/f.tgz", "."});
  EXPECT_EQ(ec, argument_error_code::failure);
}
