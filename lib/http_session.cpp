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

#include "http_session.hpp"

#include "connection.hpp"
#include "http_error_code.hpp"
#include "logger.hpp"
#include "url.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/ssl/verify_context.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <boost/beast/core/error.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace vnr {

auto
operator<<(std::ostream &o, const ip_version_t &v) -> std::ostream & {
  return o << ip_version_t_name[std::to_underlying(v)];
}

auto
operator>>(std::istream &in, ip_version_t &v) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  for (std::size_t idx = 0; idx < std::size(ip_version_t_name); ++idx)
    if (tmp == ip_version_t_name[idx]) {
      v = static_cast<ip_version_t>(idx);
      return in;
    }
  in.setstate(std::ios::failbit);
  return in;
}

auto
operator<<(std::ostream &o, const tls_version_t &v) -> std::ostream & {
  return o << tls_version_t_name[std::to_underlying(v)];
}

auto
operator>>(std::istream &in, tls_version_t &v) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  for (std::size_t idx = 0; idx < std::size(tls_version_t_name); ++idx)
    if (tmp == tls_version_t_name[idx]) {
      v = static_cast<tls_version_t>(idx);
      return in;
    }
  in.setstate(std::ios::failbit);
  return in;
}

[[nodiscard]] auto
session_stats::str() const -> std::string {
  static constexpr auto fmt_str =
    "resolves={} ({:.3f}s), connect attempts={}, connections={} ({:.3f}s), "
    "reused={}, stale={}, tls handshakes={} ({:.3f}s), tls resumed={}";
  return fmt::format(fmt_str, n_resolves, resolve_time, n_connect_attempts,
                     n_connections, connect_time, n_reused, n_stale,
                     n_handshakes, handshake_time, n_tls_resumed);
}

[[nodiscard]] static inline auto
seconds_since(const std::chrono::steady_clock::time_point t) -> double {
  const auto d = std::chrono::steady_clock::now() - t;
  return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

[[nodiscard]] static auto
endpoint_str(const boost::asio::ip::tcp::endpoint &ep) -> std::string {
  const auto addr = ep.address();
  if (addr.is_v6())
    return fmt::format("[{}]:{}", addr.to_string(), ep.port());
  return fmt::format("{}:{}", addr.to_string(), ep.port());
}

[[nodiscard]] static auto
is_ip_literal(const std::string &host) -> bool {
  boost::system::error_code ec;
  [[maybe_unused]] const auto addr = boost::asio::ip::make_address(host, ec);
  return !ec;
}

http_session::http_session(boost::asio::io_context &ioc,
                           const http_config &config,
                           const boost::asio::yield_context &yield,
                           std::error_code &ec) :
  ioc{ioc}, ssl_ctx{boost::asio::ssl::context::tls_client}, config{config},
  yield{yield} {
  auto &lgr = logger::instance();

  boost::system::error_code bec;
  ssl_ctx.set_default_verify_paths(bec);
  if (bec) {
    lgr.warning("Failed to load default trust store: {}", bec);
    bec.clear();
  }
  if (!config.ca_file.empty()) {
    ssl_ctx.load_verify_file(config.ca_file, bec);
    if (bec) {
      lgr.error("Failed to load CA file {}: {}", config.ca_file, bec);
      ec = std::make_error_code(std::errc::invalid_argument);
      return;
    }
    lgr.debug("Loaded CA file: {}", config.ca_file);
  }

  auto native = ssl_ctx.native_handle();
  switch (config.tls_version) {
  case tls_version_t::any:
    SSL_CTX_set_min_proto_version(native, TLS1_2_VERSION);
    break;
  case tls_version_t::tls1_2:
    SSL_CTX_set_min_proto_version(native, TLS1_2_VERSION);
    SSL_CTX_set_max_proto_version(native, TLS1_2_VERSION);
    break;
  case tls_version_t::tls1_3:
    SSL_CTX_set_min_proto_version(native, TLS1_3_VERSION);
    SSL_CTX_set_max_proto_version(native, TLS1_3_VERSION);
    break;
  }
  // sessions are kept by this class, keyed by origin
  SSL_CTX_set_session_cache_mode(native, SSL_SESS_CACHE_CLIENT |
                                           SSL_SESS_CACHE_NO_INTERNAL_STORE);
  if (config.insecure)
    lgr.warning("TLS certificate verification disabled (insecure)");
}

http_session::~http_session() {
  for (auto &p : connections)
    if (p.conn->is_open())
      p.conn->close();
  for (auto &[origin, session] : tls_sessions)
    SSL_SESSION_free(session);
}

[[nodiscard]] auto
http_session::acquire(const url &u, std::error_code &ec,
                      const bool force_new) -> connection * {
  auto &lgr = logger::instance();
  if (cancelled) {
    ec = http_error_code::interrupted;
    return nullptr;
  }

  const auto origin = u.origin();
  if (config.reuse_connections && !force_new) {
    for (auto &p : connections) {
      if (!p.idle || p.conn->origin != origin)
        continue;
      if (!is_idle_alive(*p.conn)) {
        lgr.debug("Idle connection #{} to {} was closed by the server",
                  p.conn->id, origin);
        ++stats.n_stale;
        discard(p.conn.get());
        break;  // discard invalidates the iteration
      }
      p.idle = false;
      ++stats.n_reused;
      lgr.debug("Reusing connection #{} to {} ({}, {} previous requests)",
                p.conn->id, origin, p.conn->remote_endpoint,
                p.conn->n_requests);
      return p.conn.get();
    }
  }

  const auto endpoints = resolve(u, ec);
  if (ec)
    return nullptr;

  const auto id = next_id++;
  lgr.debug("Opening connection #{} to {}", id, origin);
  // owned by the pool from the start so cancel() can reach it
  connections.push_back(
    {u.is_https() ? std::make_unique<connection>(ioc, ssl_ctx, origin, id)
                  : std::make_unique<connection>(ioc, origin, id),
     false});
  auto conn = connections.back().conn.get();

  connect(*conn, endpoints, ec);
  if (!ec && conn->is_tls())
    handshake(*conn, u, ec);
  if (ec) {
    discard(conn);
    return nullptr;
  }
  return conn;
}

[[nodiscard]] auto
http_session::resolve(const url &u, std::error_code &ec)
  -> boost::asio::ip::tcp::resolver::results_type {
  auto &lgr = logger::instance();
  const auto host = u.resolver_host();

  boost::asio::ip::tcp::resolver resolver(ioc);
  boost::system::error_code bec;
  lgr.debug("DNS: resolving {} (port {})", host, u.port);

  // the resolver has no expiry of its own; the timer handler can run
  // after this function returns, so it only touches the resolver while
  // the lookup is pending
  struct resolve_state {
    bool pending{true};
    bool timed_out{false};
  };
  const auto state = std::make_shared<resolve_state>();
  boost::asio::steady_timer timer(ioc, config.connect_timeout);
  timer.async_wait(
    [state, &resolver](const boost::system::error_code &timer_ec) {
      if (timer_ec || !state->pending)
        return;
      state->timed_out = true;
      resolver.cancel();
    });

  active_resolver = &resolver;
  const auto t0 = std::chrono::steady_clock::now();
  const auto results = resolver.async_resolve(host, u.port, yield[bec]);
  const auto elapsed = seconds_since(t0);
  state->pending = false;
  timer.cancel();
  active_resolver = nullptr;
  ++stats.n_resolves;
  stats.resolve_time += elapsed;
  if (cancelled) {
    ec = http_error_code::interrupted;
    return {};
  }
  if (state->timed_out) {
    lgr.error("DNS: resolving {} timed out after {:.3f}s", host, elapsed);
    ec = http_error_code::resolve_failed;
    return {};
  }
  if (bec) {
    lgr.error("DNS: resolving {} failed after {:.3f}s: {}", host, elapsed, bec);
    ec = http_error_code::resolve_failed;
    return {};
  }
  lgr.debug("DNS: resolved {} in {:.3f}s ({} addresses)", host, elapsed,
            std::size(results));
  for (const auto &entry : results)
    lgr.debug("DNS: {} -> {}", host, endpoint_str(entry.endpoint()));
  return results;
}

auto
http_session::connect(
  connection &conn,
  const boost::asio::ip::tcp::resolver::results_type &endpoints,
  std::error_code &ec) -> void {
  auto &lgr = logger::instance();
  auto &stream = conn.lowest_layer();

  bool attempted{false};
  for (const auto &entry : endpoints) {
    const auto ep = entry.endpoint();
    const auto ep_str = endpoint_str(ep);
    if ((config.ip_version == ip_version_t::v4 && !ep.address().is_v4()) ||
        (config.ip_version == ip_version_t::v6 && !ep.address().is_v6())) {
      lgr.debug("Connection #{}: skipping {} (ip-version {})", conn.id, ep_str,
                config.ip_version);
      continue;
    }
    attempted = true;
    ++stats.n_connect_attempts;
    lgr.debug("Connection #{}: connecting to {}", conn.id, ep_str);

    boost::system::error_code bec;
    stream.expires_after(config.connect_timeout);
    const auto t0 = std::chrono::steady_clock::now();
    stream.async_connect(ep, yield[bec]);
    const auto elapsed = seconds_since(t0);
    stats.connect_time += elapsed;

    if (cancelled) {
      ec = http_error_code::interrupted;
      return;
    }
    if (!bec) {
      stream.expires_never();
      ++stats.n_connections;
      conn.remote_endpoint = ep_str;
      lgr.debug("Connection #{}: connected to {} in {:.3f}s", conn.id, ep_str,
                elapsed);
      return;
    }
    lgr.warning("Connection #{}: connect to {} failed after {:.3f}s: {}",
                conn.id, ep_str, elapsed, bec);
    stream.close();
  }
  if (!attempted)
    lgr.error("Connection #{}: no endpoint matches ip-version {}", conn.id,
              config.ip_version);
  ec = http_error_code::connect_failed;
}

auto
http_session::handshake(connection &conn, const url &u,
                        std::error_code &ec) -> void {
  auto &lgr = logger::instance();
  const auto host = u.resolver_host();
  auto ssl = conn.tls_handle();

  // SNI is not sent for address literals
  if (!is_ip_literal(host)) {
    if (SSL_set_tlsext_host_name(ssl, host.data()) != 1) {
      lgr.error("Connection #{}: failed to set SNI to {}", conn.id, host);
      ec = http_error_code::handshake_failed;
      return;
    }
    lgr.debug("Connection #{}: TLS SNI {}", conn.id, host);
  }

  const auto cached = tls_sessions.find(conn.origin);
  if (cached != std::cend(tls_sessions)) {
    if (SSL_set_session(ssl, cached->second) == 1)
      lgr.debug("Connection #{}: offering cached TLS session", conn.id);
  }

  conn.visit([&](auto &s) {
    if constexpr (std::is_same_v<std::decay_t<decltype(s)>,
                                 connection::tls_stream>) {
      s.set_verify_mode(config.insecure ? boost::asio::ssl::verify_none
                                        : boost::asio::ssl::verify_peer);
      s.set_verify_callback(
        [verifier = boost::asio::ssl::host_name_verification(host),
         id = conn.id](const bool preverified,
                       boost::asio::ssl::verify_context &vctx) mutable {
          auto &lgr = logger::instance();
          auto store = vctx.native_handle();
          const auto depth = X509_STORE_CTX_get_error_depth(store);
          const auto cert = X509_STORE_CTX_get_current_cert(store);
          const bool ok = verifier(preverified, vctx);
          if (ok)
            lgr.debug("Connection #{}: TLS verify depth {} ok: {}", id, depth,
                      describe_certificate(cert));
          else
            lgr.warning(
              "Connection #{}: TLS verify depth {} failed ({}): {}", id, depth,
              X509_verify_cert_error_string(X509_STORE_CTX_get_error(store)),
              describe_certificate(cert));
          // with verify_none a failure here does not end the handshake
          return ok;
        });
    }
  });

  boost::system::error_code bec;
  conn.lowest_layer().expires_after(config.connect_timeout);
  const auto t0 = std::chrono::steady_clock::now();
  conn.visit([&](auto &s) {
    if constexpr (std::is_same_v<std::decay_t<decltype(s)>,
                                 connection::tls_stream>)
      s.async_handshake(boost::asio::ssl::stream_base::client, yield[bec]);
  });
  const auto elapsed = seconds_since(t0);
  conn.lowest_layer().expires_never();
  ++stats.n_handshakes;
  stats.handshake_time += elapsed;

  if (cancelled) {
    ec = http_error_code::interrupted;
    return;
  }
  if (bec) {
    lgr.error("Connection #{}: TLS handshake failed after {:.3f}s: {}", conn.id,
              elapsed, bec);
    const auto verify_result = SSL_get_verify_result(ssl);
    if (verify_result != X509_V_OK)
      lgr.error("Connection #{}: certificate verification: {}", conn.id,
                X509_verify_cert_error_string(verify_result));
    ec = http_error_code::handshake_failed;
    return;
  }
  lgr.debug("Connection #{}: TLS handshake completed in {:.3f}s", conn.id,
            elapsed);
  if (SSL_session_reused(ssl) == 1)
    ++stats.n_tls_resumed;
  log_tls_details(ssl);
}

[[nodiscard]] auto
http_session::is_idle_alive(connection &conn) -> bool {
  if (!conn.is_open())
    return false;
  auto &sock = conn.lowest_layer().socket();
  std::array<char, 1> peeked{};
  boost::system::error_code bec;
  sock.non_blocking(true, bec);
  if (bec)
    return false;
  [[maybe_unused]] const auto n = sock.receive(
    boost::asio::buffer(peeked), boost::asio::socket_base::message_peek, bec);
  boost::system::error_code ignored;
  sock.non_blocking(false, ignored);
  if (bec == boost::asio::error::would_block)
    return true;
  // pending bytes on a TLS connection can be session tickets
  return !bec && conn.is_tls();
}

auto
http_session::save_tls_session(connection &conn) -> void {
  auto ssl = conn.tls_handle();
  if (ssl == nullptr)
    return;
  auto session = SSL_get1_session(ssl);
  if (session == nullptr)
    return;
  if (SSL_SESSION_is_resumable(session) != 1) {
    SSL_SESSION_free(session);
    return;
  }
  auto &slot = tls_sessions[conn.origin];
  if (slot != nullptr)
    SSL_SESSION_free(slot);
  slot = session;
}

auto
http_session::release(connection *conn, const bool reusable) -> void {
  auto &lgr = logger::instance();
  if (conn == nullptr)
    return;
  save_tls_session(*conn);
  if (reusable && config.reuse_connections && !cancelled && conn->is_open()) {
    const auto itr = std::ranges::find_if(
      connections, [&](const auto &p) { return p.conn.get() == conn; });
    if (itr != std::end(connections)) {
      itr->idle = true;
      lgr.debug("Connection #{} kept alive after {} requests", conn->id,
                conn->n_requests);
      return;
    }
  }
  if (!cancelled)
    graceful_close(*conn);
  erase(conn);
}

auto
http_session::discard(connection *conn) -> void {
  auto &lgr = logger::instance();
  if (conn == nullptr)
    return;
  if (conn->is_open()) {
    lgr.debug("Connection #{} closed", conn->id);
    conn->close();
  }
  erase(conn);
}

auto
http_session::graceful_close(connection &conn) -> void {
  static constexpr auto shutdown_timeout = std::chrono::seconds(2);
  auto &lgr = logger::instance();
  if (!conn.is_open())
    return;

  boost::system::error_code bec;
  if (conn.is_tls()) {
    conn.lowest_layer().expires_after(shutdown_timeout);
    conn.visit([&](auto &s) {
      if constexpr (std::is_same_v<std::decay_t<decltype(s)>,
                                   connection::tls_stream>)
        s.async_shutdown(yield[bec]);
    });
    // many servers close without replying to close_notify
    if (bec == boost::asio::ssl::error::stream_truncated ||
        bec == boost::asio::error::eof || bec == boost::beast::error::timeout)
      bec.clear();
  }
  else
    conn.lowest_layer().socket().shutdown(
      boost::asio::ip::tcp::socket::shutdown_both, bec);

  if (bec)
    lgr.debug("Connection #{} shutdown: {}", conn.id, bec);
  lgr.debug("Connection #{} closed after {} requests", conn.id,
            conn.n_requests);
  conn.close();
}

auto
http_session::erase(connection *conn) -> void {
  std::erase_if(connections,
                [&](const auto &p) { return p.conn.get() == conn; });
}

auto
http_session::shutdown_all() -> void {
  std::vector<connection *> idle;
  for (const auto &p : connections)
    if (p.idle)
      idle.push_back(p.conn.get());
  for (auto conn : idle) {
    save_tls_session(*conn);
    if (!cancelled)
      graceful_close(*conn);
    erase(conn);
  }
}

auto
http_session::cancel() -> void {
  auto &lgr = logger::instance();
  cancelled = true;
  if (active_resolver != nullptr)
    active_resolver->cancel();
  for (auto &p : connections)
    if (p.conn->is_open()) {
      lgr.debug("Connection #{} aborted", p.conn->id);
      p.conn->close();
    }
}

}  // namespace vnr
