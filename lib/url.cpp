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

#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace vnr {

using std::string_view_literals::operator""sv;

static constexpr auto scheme_sep = "://"sv;
static constexpr auto max_port = 65535u;

[[nodiscard]] static inline auto
to_lower(std::string s) -> std::string {
  std::ranges::for_each(s, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return s;
}

[[nodiscard]] static inline auto
trim(const std::string_view s) -> std::string_view {
  const auto is_space = [](const unsigned char c) { return std::isspace(c); };
  auto b = std::cbegin(s);
  auto e = std::cend(s);
  while (b != e && is_space(*b))
    ++b;
  while (e != b && is_space(*(e - 1)))
    --e;
  return std::string_view(b, e);
}

[[nodiscard]] static inline auto
valid_port(const std::string_view p) -> bool {
  if (p.empty() || !std::ranges::all_of(p, [](const unsigned char c) {
        return std::isdigit(c);
      }))
    return false;
  std::uint32_t value{};
  const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), value);
  return ec == std::errc{} && ptr == p.data() + p.size() && value > 0 &&
         value <= max_port;
}

// ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
[[nodiscard]] static inline auto
is_scheme(const std::string_view s) -> bool {
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front())))
    return false;
  return std::ranges::all_of(s, [](const unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
  });
}

// Remove "." and ".." segments from an absolute path
[[nodiscard]] static auto
remove_dot_segments(const std::string_view path) -> std::string {
  std::vector<std::string_view> segments;
  bool trailing_slash = false;
  std::size_t pos = 1;  // skip the leading slash
  while (pos <= std::size(path)) {
    const auto next = std::min(path.find('/', pos), std::size(path));
    const auto seg = path.substr(pos, next - pos);
    const bool is_last = next == std::size(path);
    if (seg == ".") {
      trailing_slash = is_last;
    }
    else if (seg == "..") {
      if (!segments.empty())
        segments.pop_back();
      trailing_slash = is_last;
    }
    else if (!seg.empty() || is_last) {
      segments.push_back(seg);
      trailing_slash = false;
    }
    pos = next + 1;
  }
  std::string r;
  for (const auto &seg : segments) {
    r += '/';
    r += seg;
  }
  if (r.empty() || trailing_slash)
    r += '/';
  return r;
}

auto
url::resolver_host() const -> std::string {
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    return host.substr(1, host.size() - 2);
  return host;
}

auto
url::host_field() const -> std::string {
  return is_default_port() ? host : host + ":" + port;
}

auto
url::origin() const -> std::string {
  return fmt::format("{}://{}:{}", scheme, host, port);
}

auto
url::path() const -> std::string {
  return target.substr(0, target.find('?'));
}

auto
url::str() const -> std::string {
  return fmt::format("{}://{}{}", scheme, host_field(), target);
}

auto
url::resolve(const std::string &reference, std::error_code &ec) const -> url {
  auto ref = trim(reference);
  if (ref.empty()) {
    ec = url_error_code::empty;
    return {};
  }
  ref = ref.substr(0, ref.find('#'));

  // absolute reference
  const auto sep = ref.find(scheme_sep);
  if (sep != std::string_view::npos && is_scheme(ref.substr(0, sep)))
    return parse_url(ref, ec);

  // network-path reference
  if (ref.starts_with("//"))
    return parse_url(scheme + ":" + std::string(ref), ec);

  url r{*this};
  if (ref.starts_with('/')) {
    const auto q = ref.find('?');
    const auto query = q == std::string_view::npos ? ""sv : ref.substr(q);
    r.target = remove_dot_segments(ref.substr(0, q)) + std::string(query);
  }
  else if (ref.starts_with('?')) {
    r.target = path() + std::string(ref);
  }
  else {
    const auto base = path();
    const auto dir = base.substr(0, base.rfind('/') + 1);
    const auto q = ref.find('?');
    const auto query = q == std::string_view::npos ? ""sv : ref.substr(q);
    r.target = remove_dot_segments(dir + std::string(ref.substr(0, q))) +
               std::string(query);
  }
  ec = url_error_code::ok;
  return r;
}

[[nodiscard]] auto
parse_url(const std::string_view text, std::error_code &ec) -> url {
  const auto s = trim(text);
  if (s.empty()) {
    ec = url_error_code::empty;
    return {};
  }

  const auto sep = s.find(scheme_sep);
  if (sep == std::string_view::npos || sep == 0) {
    ec = url_error_code::missing_scheme;
    return {};
  }

  url u;
  u.scheme = to_lower(std::string(s.substr(0, sep)));
  if (u.scheme != "http" && u.scheme != "https") {
    ec = url_error_code::unsupported_scheme;
    return {};
  }

  auto rest = s.substr(sep + std::size(scheme_sep));
  const auto authority_end = std::min(rest.find_first_of("/?#"), rest.size());
  auto authority = rest.substr(0, authority_end);
  rest = rest.substr(authority_end);

  // userinfo is dropped
  if (const auto at = authority.rfind('@'); at != std::string_view::npos)
    authority = authority.substr(at + 1);

  std::string_view port;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      ec = url_error_code::missing_host;
      return {};
    }
    u.host = std::string(authority.substr(0, close + 1));
    const auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (!after.starts_with(':') || !valid_port(after.substr(1))) {
        ec = url_error_code::invalid_port;
        return {};
      }
      port = after.substr(1);
    }
  }
  else {
    const auto colon = authority.rfind(':');
    u.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
      if (!valid_port(port)) {
        ec = url_error_code::invalid_port;
        return {};
      }
    }
  }
  if (u.host.empty() || u.host == "[]") {
    ec = url_error_code::missing_host;
    return {};
  }
  u.host = to_lower(u.host);
  u.port = port.empty()
             ? std::string(u.is_https() ? url::https_default_port
                                        : url::http_default_port)
             : std::string(port);

  rest = rest.substr(0, rest.find('#'));
  if (rest.empty() || rest.starts_with('?'))
    u.target = "/" + std::string(rest);
  else
    u.target = std::string(rest);

  ec = url_error_code::ok;
  return u;
}

[[nodiscard]] auto
file_name_from_url(const url &u, std::error_code &ec) -> std::string {
  const auto p = u.path();
  auto name = p.substr(p.rfind('/') + 1);
  if (name.empty() || name == "." || name == "..") {
    ec = url_error_code::no_file_name;
    return {};
  }
  ec = url_error_code::ok;
  return name;
}

[[nodiscard]] auto
is_gzip_tarball_name(const std::string_view file_name) -> bool {
  return (file_name.ends_with(".tar.gz") && file_name.size() > 7) ||
         (file_name.ends_with(".tgz") && file_name.size() > 4);
}

[[nodiscard]] auto
extraction_dir_name(const std::string &file_name) -> std::string {
  static constexpr auto tar_gz = ".tar.gz"sv;
  static constexpr auto tgz = ".tgz"sv;
  if (file_name.ends_with(tar_gz))
    return file_name.substr(0, file_name.size() - tar_gz.size());
  if (file_name.ends_with(tgz))
    return file_name.substr(0, file_name.size() - tgz.size());
  return file_name;
}

}  // namespace vnr
