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

#ifndef LIB_URL_HPP_
#define LIB_URL_HPP_

#include <fmt/core.h>
#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

enum class url_error_code : std::uint8_t {
  ok = 0,
  empty = 1,
  missing_scheme = 2,
  unsupported_scheme = 3,
  missing_host = 4,
  invalid_port = 5,
  no_file_name = 6,
};

template <>
struct std::is_error_code_enum<url_error_code> : public std::true_type {};

struct url_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "url";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "empty url"s;
    case 2: return "url has no scheme"s;
    case 3: return "unsupported url scheme (need http or https)"s;
    case 4: return "url has no host"s;
    case 5: return "invalid port in url"s;
    case 6: return "could not construct file name from url"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(url_error_code e) -> std::error_code {
  static auto category = url_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace vnr {

struct url {
  static constexpr auto http_default_port = "80";
  static constexpr auto https_default_port = "443";

  std::string scheme;  // http or https
  std::string host;    // IPv6 literals keep their brackets
  std::string port;
  std::string target{"/"};  // path and query

  [[nodiscard]] auto
  is_https() const -> bool {
    return scheme == "https";
  }

  [[nodiscard]] auto
  is_default_port() const -> bool {
    return port == (is_https() ? https_default_port : http_default_port);
  }

  /// Host name suitable for the resolver, without IPv6 brackets
  [[nodiscard]] auto
  resolver_host() const -> std::string;

  /// Value for the Host header field
  [[nodiscard]] auto
  host_field() const -> std::string;

  [[nodiscard]] auto
  origin() const -> std::string;

  /// Path component of the target, without the query
  [[nodiscard]] auto
  path() const -> std::string;

  [[nodiscard]] auto
  str() const -> std::string;

  /// Resolve a reference (e.g., the value of a Location header field)
  /// relative to this url
  [[nodiscard]] auto
  resolve(const std::string &reference, std::error_code &ec) const -> url;

  auto
  operator<=>(const url &) const = default;
};

[[nodiscard]] auto
parse_url(const std::string_view text, std::error_code &ec) -> url;

[[nodiscard]] auto
file_name_from_url(const url &u, std::error_code &ec) -> std::string;

[[nodiscard]] auto
is_gzip_tarball_name(const std::string_view file_name) -> bool;

[[nodiscard]] auto
extraction_dir_name(const std::string &file_name) -> std::string;

}  // namespace vnr

template <> struct fmt::formatter<vnr::url> : fmt::formatter<std::string> {
  auto
  format(const vnr::url &u, fmt::format_context &ctx) const {
    return fmt::formatter<std::string>::format(u.str(), ctx);
  }
};

#endif  // LIB_URL_HPP_
