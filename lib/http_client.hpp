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

#ifndef LIB_HTTP_CLIENT_HPP_
#define LIB_HTTP_CLIENT_HPP_

#include "http_header.hpp"
#include "url.hpp"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace vnr {

class http_session;
class connection;

/// Inclusive byte range for a Range request
struct byte_range {
  std::uint64_t first{};
  std::uint64_t last{};
};

struct redirect_hop {
  url from;
  std::uint32_t status{};
  url to;
};

/// A response whose header has been received; the body is read by the
/// caller in pieces
class http_response {
public:
  using parser_type =
    boost::beast::http::response_parser<boost::beast::http::buffer_body>;

  http_response(http_session &session, connection *conn,
                std::unique_ptr<parser_type> parser,
                boost::beast::flat_buffer buffer, url effective,
                std::vector<redirect_hop> redirects);
  ~http_response();

  http_response(const http_response &) = delete;
  auto
  operator=(const http_response &) -> http_response & = delete;

  [[nodiscard]] auto
  header() const -> const http_header & {
    return hdr;
  }

  [[nodiscard]] auto
  effective_url() const -> const url & {
    return effective;
  }

  [[nodiscard]] auto
  redirects() const -> const std::vector<redirect_hop> & {
    return hops;
  }

  /// Read up to size bytes of the body; returns the number of bytes read,
  /// which is 0 only when the body is complete or on error
  [[nodiscard]] auto
  read_some(char *data, const std::size_t size,
            std::error_code &ec) -> std::size_t;

  [[nodiscard]] auto
  is_done() const -> bool;

  [[nodiscard]] auto
  body_bytes() const -> std::uint64_t {
    return n_body_bytes;
  }

  /// Hand the connection back to the session; reusable only if the body
  /// was fully read and the response is keep-alive
  auto
  finish() -> void;

private:
  http_session &session;
  connection *conn{};
  std::unique_ptr<parser_type> parser;
  boost::beast::flat_buffer buffer;
  http_header hdr;
  url effective;
  std::vector<redirect_hop> hops;
  std::uint64_t n_body_bytes{};
};

class http_client {
public:
  explicit http_client(http_session &session) : session{session} {}

  /// GET u following redirects; on success the returned response has its
  /// header available
  [[nodiscard]] auto
  get(const url &u, std::error_code &ec,
      const std::optional<byte_range> &range = std::nullopt)
    -> std::unique_ptr<http_response>;

private:
  struct exchange {
    connection *conn{};
    std::unique_ptr<http_response::parser_type> parser;
    boost::beast::flat_buffer buffer;
  };

  [[nodiscard]] auto
  send(const url &u, const std::optional<byte_range> &range,
       std::error_code &ec) -> exchange;

  [[nodiscard]] auto
  request_once(connection &conn, const url &u,
               const std::optional<byte_range> &range, exchange &ex)
    -> std::error_code;

  auto
  drain(exchange &ex) -> bool;

  http_session &session;
};

}  // namespace vnr

#endif  // LIB_HTTP_CLIENT_HPP_
