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

#ifndef LIB_HTTP_HEADER_HPP_
#define LIB_HTTP_HEADER_HPP_

#include <boost/beast/http/message.hpp>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace vnr {

struct http_header {
  std::string status_line;  // HTTP/1.1 200 OK
  std::string status_code;  // 200
  std::uint32_t status{};
  std::optional<std::uint64_t> content_length;  // content-length: 117607180
  std::string accept_ranges;                    // accept-ranges: bytes
  std::string location;       // location: https://example.org/file.tar.gz
  std::string connection;     // connection: keep-alive
  std::string last_modified;  // last-modified: Sun, 02 Feb 2025 20:10:46 GMT
  std::string content_range;  // content-range: bytes 0-3/117607180
  // all fields in the order received; names are lower case
  std::vector<std::tuple<std::string, std::string>> fields;

  http_header() = default;
  explicit http_header(const std::string &header_block);
  explicit http_header(
    const boost::beast::http::response_header<> &response_header);

  [[nodiscard]] auto
  is_success() const -> bool {
    return status >= 200 && status < 300;
  }

  [[nodiscard]] auto
  is_redirect() const -> bool {
    return status == 301 || status == 302 || status == 303 || status == 307 ||
           status == 308;
  }

  [[nodiscard]] auto
  accepts_byte_ranges() const -> bool;

  [[nodiscard]] auto
  tostring() const -> std::string;

private:
  auto
  add_field(std::string name, std::string value) -> void;
};

}  // namespace vnr

#endif  // LIB_HTTP_HEADER_HPP_
