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

#ifndef LIB_HTTP_SESSION_HPP_
#define LIB_HTTP_SESSION_HPP_

#include "connection.hpp"
#include "url.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl/context.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <openssl/ssl.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace vnr {

using std::literals::string_view_literals::operator""sv;

enum class ip_version_t : std::uint8_t {
  any = 0,
  v4 = 1,
  v6 = 2,
};

static constexpr auto ip_version_t_name = std::array{
  // clang-format off
  "any"sv,
  "v4"sv,
  "v6"sv,
  // clang-format on
};

enum class tls_version_t : std::uint8_t {
  any = 0,
  tls1_2 = 1,
  tls1_3 = 2,
};

static constexpr auto tls_version_t_name = std::array{
  // clang-format off
  "any"sv,
  "1.2"sv,
  "1.3"sv,
  // clang-format on
};

auto
operator<<(std::ostream &o, const ip_version_t &v) -> std::ostream &;

auto
operator>>(std::istream &in, ip_version_t &v) -> std::istream &;

auto
operator<<(std::ostream &o, const tls_version_t &v) -> std::ostream &;

auto
operator>>(std::istream &in, tls_version_t &v) -> std::istream &;

struct http_config {
  static constexpr auto default_user_agent = "vnr";

  std::chrono::milliseconds connect_timeout{10'000};
  /// Inactivity timeout for each write or read after connecting
  std::chrono::milliseconds read_timeout{30'000};
  std::uint32_t max_redirects{5};
  std::string user_agent{default_user_agent};
  ip_version_t ip_version{ip_version_t::any};
  tls_version_t tls_version{tls_version_t::any};
  std::string ca_file;
  bool insecure{false};
  bool reuse_connections{true};
};

struct session_stats {
  std::uint32_t n_resolves{};
  std::uint32_t n_connect_attempts{};
  std::uint32_t n_connections{};
  std::uint32_t n_reused{};
  std::uint32_t n_stale{};
  std::uint32_t n_handshakes{};
  std::uint32_t n_tls_resumed{};
  double resolve_time{};    // seconds
  double connect_time{};    // seconds
  double handshake_time{};  // seconds

  [[nodiscard]] auto
  str() const -> std::string;
};

/// Owns every connection made during one run, and hands them out to
/// requests. All operations must be called from the coroutine given to
/// the constructor.
class http_session {
public:
  http_session(boost::asio::io_context &ioc, const http_config &config,
               const boost::asio::yield_context &yield, std::error_code &ec);
  ~http_session();

  http_session(const http_session &) = delete;
  auto
  operator=(const http_session &) -> http_session & = delete;

  /// Get a connection to the origin of u, reusing an idle one if allowed
  [[nodiscard]] auto
  acquire(const url &u, std::error_code &ec,
          const bool force_new = false) -> connection *;

  /// Return a connection after a request; if it can't be reused it is
  /// closed gracefully
  auto
  release(connection *conn, const bool reusable) -> void;

  /// Close a connection immediately, without TLS shutdown
  auto
  discard(connection *conn) -> void;

  /// Gracefully close all idle connections
  auto
  shutdown_all() -> void;

  /// Abort everything; safe to call from a signal handler running on the
  /// same io_context
  auto
  cancel() -> void;

  [[nodiscard]] auto
  is_cancelled() const -> bool {
    return cancelled;
  }

  [[nodiscard]] auto
  get_yield() const -> const boost::asio::yield_context & {
    return yield;
  }

  [[nodiscard]] auto
  get_config() const -> const http_config & {
    return config;
  }

  [[nodiscard]] auto
  get_stats() const -> const session_stats & {
    return stats;
  }

private:
  [[nodiscard]] auto
  resolve(const url &u, std::error_code &ec)
    -> boost::asio::ip::tcp::resolver::results_type;

  auto
  connect(connection &conn,
          const boost::asio::ip::tcp::resolver::results_type &endpoints,
          std::error_code &ec) -> void;

  auto
  handshake(connection &conn, const url &u, std::error_code &ec) -> void;

  [[nodiscard]] auto
  is_idle_alive(connection &conn) -> bool;

  auto
  save_tls_session(connection &conn) -> void;

  auto
  graceful_close(connection &conn) -> void;

  auto
  erase(connection *conn) -> void;

  boost::asio::io_context &ioc;
  boost::asio::ssl::context ssl_ctx;
  http_config config;
  boost::asio::yield_context yield;

  struct pooled {
    std::unique_ptr<connection> conn;
    bool idle{false};
  };
  std::vector<pooled> connections;
  std::unordered_map<std::string, SSL_SESSION *> tls_sessions;
  boost::asio::ip::tcp::resolver *active_resolver{nullptr};
  std::uint32_t next_id{1};
  session_stats stats;
  bool cancelled{false};
};

}  // namespace vnr

template <>
struct fmt::formatter<vnr::ip_version_t> : fmt::formatter<std::string_view> {
  auto
  format(const vnr::ip_version_t &v, fmt::format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
      vnr::ip_version_t_name[std::to_underlying(v)], ctx);
  }
};

template <>
struct fmt::formatter<vnr::tls_version_t> : fmt::formatter<std::string_view> {
  auto
  format(const vnr::tls_version_t &v, fmt::format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(
      vnr::tls_version_t_name[std::to_underlying(v)], ctx);
  }
};

#endif  // LIB_HTTP_SESSION_HPP_
