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

#ifndef CLI_VNR_ARGSET_HPP_
#define CLI_VNR_ARGSET_HPP_

#include "arguments.hpp"

#include "fetch.hpp"
#include "http_session.hpp"
#include "logger.hpp"

#include <config.h>  // for VERSION

#include <boost/program_options.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>  // for std::getenv
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

struct vnr_argset : argset_base<vnr_argset> {
  static constexpr auto config_dirname_default = ".config/vnr";
  static constexpr auto config_filename_default = "vnr.conf";

  [[nodiscard]] static auto
  get_default_config_dir_impl() -> std::string {
    auto env_home = std::getenv("HOME");
    if (!env_home)
      return {};
    std::error_code error;
    const auto env_home_path = std::filesystem::absolute(env_home, error);
    if (error)
      return {};
    return (env_home_path / config_dirname_default).string();
  }

  [[nodiscard]] static auto
  get_default_config_file_impl() -> std::string {
    const auto config_dir = get_default_config_dir();
    if (config_dir.empty())
      return {};
    return (std::filesystem::path{config_dir} / config_filename_default)
      .string();
  }

  static constexpr auto connect_timeout_default{10};  // seconds
  static constexpr auto read_timeout_default{30};     // seconds
  static constexpr auto max_redirects_default{5};
  static constexpr auto ip_version_default{vnr::ip_version_t::any};
  static constexpr auto tls_version_default{vnr::tls_version_t::any};
  static constexpr auto log_level_default{vnr::log_level_t::debug};

  std::string url{};
  std::string destination{};
  std::uint32_t connect_timeout{};
  std::uint32_t read_timeout{};
  std::uint32_t max_redirects{};
  std::string user_agent{};
  vnr::ip_version_t ip_version{};
  vnr::tls_version_t tls_version{};
  std::string ca_file{};
  bool insecure{};
  bool no_reuse{};
  bool no_extract{};
  std::string log_file{};
  vnr::log_level_t log_level{};

  auto
  log_options_impl() const {
    vnr::log_args<vnr::log_level_t::info>(
      std::vector<std::tuple<std::string, std::string>>{
        // clang-format off
        {"url", url},
        {"destination", destination},
        {"config_file", config_file},
        {"connect_timeout", fmt::format("{}s", connect_timeout)},
        {"read_timeout", fmt::format("{}s", read_timeout)},
        {"max_redirects", fmt::format("{}", max_redirects)},
        {"user_agent", user_agent},
        {"ip_version", fmt::format("{}", ip_version)},
        {"tls_version", fmt::format("{}", tls_version)},
        {"ca_file", ca_file},
        {"insecure", fmt::format("{}", insecure)},
        {"no_reuse", fmt::format("{}", no_reuse)},
        {"no_extract", fmt::format("{}", no_extract)},
        {"log_file", log_file},
        {"log_level", fmt::format("{}", log_level)},
        // clang-format on
      });
  }

  [[nodiscard]] auto
  set_cli_only_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Command line options");
    opts.add_options()
      // clang-format off
      ("help,h", "print this message and exit")
      ("version", "print the version and exit")
      ("config-file,c",
       value(&config_file)->default_value(get_default_config_file(), ""),
       "use specified config file")
      // clang-format on
      ;
    return opts;
  }

  [[nodiscard]] auto
  set_common_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Command line or config file");
    opts.add_options()
      // clang-format off
      ("connect-timeout",
       value(&connect_timeout)->default_value(connect_timeout_default),
       "seconds allowed for each resolve, connect and handshake")
      ("read-timeout",
       value(&read_timeout)->default_value(read_timeout_default),
       "seconds of inactivity allowed while sending or receiving")
      ("max-redirects",
       value(&max_redirects)->default_value(max_redirects_default),
       "redirects to follow")
      ("user-agent",
       value(&user_agent)->default_value(std::string{"vnr/"} + VERSION),
       "user agent string")
      ("ip-version", value(&ip_version)->default_value(ip_version_default),
       "address family {any,v4,v6}")
      ("tls-version", value(&tls_version)->default_value(tls_version_default),
       "TLS version {any,1.2,1.3}")
      ("ca-file", value(&ca_file)->value_name("FILE"),
       "additional trusted certificates (PEM)")
      ("insecure,k", po::bool_switch(&insecure),
       "do not fail on certificate verification errors")
      ("no-reuse", po::bool_switch(&no_reuse),
       "open a new connection for each request")
      ("no-extract", po::bool_switch(&no_extract),
       "save the file without extracting a tarball")
      ("log-level,v", value(&log_level)->default_value(log_level_default),
       "log level {debug,info,warning,error,critical}")
      ("log-file,l", value(&log_file)->value_name("console"),
       "log file name")
      // clang-format on
      ;
    return opts;
  }

  [[nodiscard]] auto
  set_positional_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Positional");
    opts.add_options()
      // clang-format off
      ("url", value(&url)->required(), "url to download")
      ("destination", value(&destination)->required(),
       "existing directory for the downloaded file")
      // clang-format on
      ;
    return opts;
  }

  auto
  set_positional_impl(
    boost::program_options::positional_options_description &p) const {
    p.add("url", 1).add("destination", 1);
  }

  [[nodiscard]] auto
  to_fetch_request() const -> vnr::fetch_request {
    vnr::fetch_request r;
    r.url = url;
    r.outdir = destination;
    r.config.connect_timeout = std::chrono::seconds(connect_timeout);
    r.config.read_timeout = std::chrono::seconds(read_timeout);
    r.config.max_redirects = max_redirects;
    r.config.user_agent = user_agent;
    r.config.ip_version = ip_version;
    r.config.tls_version = tls_version;
    r.config.ca_file = ca_file;
    r.config.insecure = insecure;
    r.config.reuse_connections = !no_reuse;
    r.extract = !no_extract;
    return r;
  }
};

#endif  // CLI_VNR_ARGSET_HPP_
