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

#ifndef LIB_CONNECTION_HPP_
#define LIB_CONNECTION_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstdint>
#include <string>
#include <utility>  // for std::forward
#include <variant>

namespace vnr {

/// A transport connection to one origin, either plain TCP or TLS over TCP
class connection {
public:
  using plain_stream = boost::beast::tcp_stream;
  using tls_stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

  connection(boost::asio::io_context &ioc, const std::string &origin,
             const std::uint32_t id);
  connection(boost::asio::io_context &ioc, boost::asio::ssl::context &ssl_ctx,
             const std::string &origin, const std::uint32_t id);

  connection(const connection &) = delete;
  auto
  operator=(const connection &) -> connection & = delete;

  [[nodiscard]] auto
  is_tls() const -> bool {
    return std::holds_alternative<tls_stream>(stream);
  }

  [[nodiscard]] auto
  lowest_layer() -> boost::beast::tcp_stream &;

  [[nodiscard]] auto
  is_open() -> bool {
    return lowest_layer().socket().is_open();
  }

  /// The OpenSSL handle; nullptr for plain connections
  [[nodiscard]] auto
  tls_handle() -> SSL *;

  /// Call f with the underlying stream
  template <typename F>
  auto
  visit(F &&f) {
    return std::visit(std::forward<F>(f), stream);
  }

  /// Close the socket without any TLS shutdown
  auto
  close() -> void;

  std::uint32_t id{};
  std::string origin;
  std::string remote_endpoint;
  std::uint32_t n_requests{};

private:
  std::variant<plain_stream, tls_stream> stream;
};

/// Subject, issuer and expiry of a certificate on one line
[[nodiscard]] auto
describe_certificate(X509 *cert) -> std::string;

/// Trace negotiated protocol, cipher, resumption and the peer chain
auto
log_tls_details(SSL *ssl) -> void;

}  // namespace vnr

#endif  // LIB_CONNECTION_HPP_
