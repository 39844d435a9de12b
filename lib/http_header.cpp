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

#include "http_header.hpp"

#include <boost/beast/http/message.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>

namespace vnr {

// trim from start (in place)
static inline auto
ltrim(std::string &s) {
  const auto no_space = [](const unsigned char c) { return !std::isspace(c); };
  const auto e = std::find_if(std::cbegin(s), std::cend(s), no_space);
  s.erase(std::cbegin(s), e);
}

// trim from end (in place)
static inline auto
rtrim(std::string &s) -> void {
  const auto no_space = [](const unsigned char c) { return !std::isspace(c); };
  const auto b = std::find_if(std::crbegin(s), std::crend(s), no_space);
  s.erase(b.base(), std::cend(s));
}

// trim from both ends (in place)
static inline auto
trim(std::string &s) -> void {
  rtrim(s);
  ltrim(s);
}

static inline auto
to_lower(std::string &s) -> void {
  std::ranges::for_each(s, [](auto &c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
}

// split a string at the first colon
static inline auto
split_http_field(const std::string &s) -> std::tuple<std::string, std::string> {
  const auto colon = s.find(':');
  if (colon == std::string::npos || colon == 0)
    return {{}, {}};
  auto field_name = s.substr(0, colon);
  auto field_value = s.substr(colon + 1);
  trim(field_name);
  trim(field_value);
  return {field_name, field_value};
}

static inline auto
is_status_line(const std::string &line) -> bool {
  using std::string_view_literals::operator""sv;
  constexpr auto http_tag = "HTTP/"sv;
  return line.starts_with(http_tag);
}

static inline auto
parse_status_line(const std::string &line, std::string &status_code) {
  constexpr auto status_code_size = 3u;
  std::istringstream iss(line);
  std::string version;
  std::string code;
  if ((iss >> version >> code) && std::size(code) == status_code_size &&
      std::ranges::all_of(code,
                          [](const unsigned char c) { return std::isdigit(c); }))
    status_code = code;
}

http_header::http_header(const std::string &header_block) {
  std::istringstream iss(header_block);
  std::string line;
  while (std::getline(iss, line)) {
    rtrim(line);
    if (line.empty())
      continue;
    if (is_status_line(line)) {
      status_line = line;
      parse_status_line(line, status_code);
      continue;
    }
    auto [field_name, field_value] = split_http_field(line);
    if (field_name.empty())
      continue;
    add_field(std::move(field_name), std::move(field_value));
  }
  if (!status_code.empty()) {
    [[maybe_unused]] const auto [ptr, ec] = std::from_chars(
      status_code.data(), status_code.data() + status_code.size(), status);
    if (ec != std::errc{})
      status = 0;
  }
}

http_header::http_header(
  const boost::beast::http::response_header<> &response_header) {
  status = response_header.result_int();
  status_code = std::to_string(status);
  const auto version = response_header.version();
  status_line =
    fmt::format("HTTP/{}.{} {} {}", version / 10, version % 10, status_code,
                std::string(response_header.reason()));
  rtrim(status_line);
  for (const auto &f : response_header)
    add_field(std::string(f.name_string()), std::string(f.value()));
}

auto
http_header::add_field(std::string name, std::string value) -> void {
  to_lower(name);
  if (name == "content-length") {
    std::uint64_t content_length_tmp{};
    const auto [ptr, ec] = std::from_chars(
      value.data(), value.data() + value.size(), content_length_tmp);
    if (ec == std::errc{} && ptr == value.data() + value.size())
      content_length = content_length_tmp;
  }
  else if (name == "accept-ranges")
    accept_ranges = value;
  else if (name == "location")
    location = value;
  else if (name == "connection")
    connection = value;
  else if (name == "last-modified")
    last_modified = value;
  else if (name == "content-range")
    content_range = value;
  fields.emplace_back(std::move(name), std::move(value));
}

auto
http_header::accepts_byte_ranges() const -> bool {
  auto v = accept_ranges;
  trim(v);
  to_lower(v);
  return v == "bytes";
}

auto
http_header::tostring() const -> std::string {
  std::string r = status_line;
  for (const auto &[name, value] : fields)
    r += fmt::format("\n{}: {}", name, value);
  return r;
}

}  // namespace vnr
