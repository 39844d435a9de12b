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

#include "http_client.hpp"

#include "connection.hpp"
#include "http_error_code.hpp"
#include "http_header.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include "url.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace vnr {

namespace http = boost::beast::http;

static constexpr auto http_version = 11;

[[nodiscard]] static auto
is_timeout(const boost::system::error_code &bec) -> bool {
  return bec == boost::beast::error::timeout;
}

/// Log each line of a header block with a direction marker
static auto
log_header_lines(const std::string_view marker, const std::uint32_t id,
                 const std::string &block) -> void {
  auto &lgr = logger::instance();
  std::size_t pos = 0;
  while (pos < std::size(block)) {
    auto end = block.find("\r\n", pos);
    if (end == std::string::npos)
      end = std::size(block);
    if (end > pos)
      lgr.debug("Connection #{}: {} {}", id, marker,
                std::string_view(block).substr(pos, end - pos));
    pos = end + 2;
  }
}

http_response::http_response(http_session &session, connection *conn,
                             std::unique_ptr<parser_type> parser,
                             boost::beast::flat_buffer buffer, url effective,
                             std::vector<redirect_hop> redirects) :
  session{session}, conn{conn}, parser{std::move(parser)},
  buffer{std::move(buffer)}, hdr{this->parser->get().base()},
  effective{std::move(effective)}, hops{std::move(redirects)} {}

http_response::~http_response() {
  // not finished: the connection state is unknown
  if (conn != nullptr)
    session.discard(conn);
}

[[nodiscard]] auto
http_response::is_done() const -> bool {
  return parser->is_done();
}

[[nodiscard]] auto
http_response::read_some(char *data, const std::size_t size,
                         std::error_code &ec) -> std::size_t {
  auto &lgr = logger::instance();
  if (conn == nullptr || parser->is_done() || size == 0)
    return 0;

  auto &body = parser->get().body();
  body.data = data;
  body.size = size;

  boost::system::error_code bec;
  conn->lowest_layer().expires_after(session.get_config().read_timeout);
  conn->visit([&](auto &s) {
    http::async_read(s, buffer, *parser, session.get_yield()[bec]);
  });
  conn->lowest_layer().expires_never();
  // the body buffer being full is how a partial read ends
  if (bec == http::error::need_buffer)
    bec.clear();

  const auto n_bytes = size - body.size;
  n_body_bytes += n_bytes;
  if (session.is_cancelled()) {
    ec = http_error_code::interrupted;
    return n_bytes;
  }
  if (bec) {
    lgr.error("Connection #{}: reading body failed after {} bytes: {}",
              conn->id, n_body_bytes, bec);
    ec = is_timeout(bec) ? http_error_code::inactive_timeout
                         : http_error_code::reading_body_failed;
  }
  return n_bytes;
}

auto
http_response::finish() -> void {
  if (conn == nullptr)
    return;
  const bool reusable = parser->is_done() && parser->get().keep_alive();
  if (!parser->is_done())
    logger::instance().debug(
      "Connection #{}: body not fully read ({} bytes); not reusable", conn->id,
      n_body_bytes);
  session.release(conn, reusable);
  conn = nullptr;
}

[[nodiscard]] auto
http_client::request_once(connection &conn, const url &u,
                          const std::optional<byte_range> &range,
                          exchange &ex) -> std::error_code {
  auto &lgr = logger::instance();
  const auto &config = session.get_config();

  http::request<http::empty_body> req{http::verb::get, u.target,
                                      http_version};
  req.set(http::field::host, u.host_field());
  req.set(http::field::user_agent, config.user_agent);
  req.set(http::field::accept, "*/*");
  if (range)
    req.set(http::field::range,
            fmt::format("bytes={}-{}", range->first, range->last));

  std::ostringstream oss;
  oss << req.base();
  log_header_lines(">", conn.id, oss.str());

  ++conn.n_requests;
  boost::system::error_code bec;
  conn.lowest_layer().expires_after(config.read_timeout);
  conn.visit(
    [&](auto &s) { http::async_write(s, req, session.get_yield()[bec]); });
  if (session.is_cancelled())
    return http_error_code::interrupted;
  if (bec) {
    lgr.warning("Connection #{}: sending request failed: {}", conn.id, bec);
    return is_timeout(bec) ? http_error_code::inactive_timeout
                           : http_error_code::send_request_failed;
  }

  ex.parser = std::make_unique<http_response::parser_type>();
  ex.parser->body_limit(std::numeric_limits<std::uint64_t>::max());
  const auto t0 = std::chrono::steady_clock::now();
  conn.lowest_layer().expires_after(config.read_timeout);
  conn.visit([&](auto &s) {
    http::async_read_header(s, ex.buffer, *ex.parser,
                            session.get_yield()[bec]);
  });
  conn.lowest_layer().expires_never();
  if (session.is_cancelled())
    return http_error_code::interrupted;
  if (bec) {
    lgr.warning("Connection #{}: receiving header failed: {}", conn.id, bec);
    return is_timeout(bec) ? http_error_code::inactive_timeout
                           : http_error_code::receive_header_failed;
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - t0);
  lgr.debug("Connection #{}: response header after {}ms", conn.id,
            elapsed.count());

  oss.str({});
  oss << ex.parser->get().base();
  log_header_lines("<", conn.id, oss.str());
  return {};
}

[[nodiscard]] auto
http_client::send(const url &u, const std::optional<byte_range> &range,
                  std::error_code &ec) -> exchange {
  auto &lgr = logger::instance();
  // a reused connection might have been closed by the server while idle,
  // so one retry on a new connection is allowed
  for (auto attempt = 0; attempt < 2; ++attempt) {
    exchange ex;
    ex.conn = session.acquire(u, ec, attempt > 0);
    if (ec)
      return {};
    const bool reused = ex.conn->n_requests > 0;
    ec = request_once(*ex.conn, u, range, ex);
    if (!ec)
      return ex;
    session.discard(ex.conn);
    if (!reused || ec == http_error_code::interrupted ||
        ec == http_error_code::inactive_timeout)
      return {};
    lgr.warning("Reused connection failed ({}); retrying on a new connection",
                ec);
    ec.clear();
  }
  return {};
}

auto
http_client::drain(exchange &ex) -> bool {
  static constexpr auto max_drain_size = 64 * 1024;
  static constexpr auto buf_size = 8 * 1024;

  auto &lgr = logger::instance();
  const auto length = ex.parser->content_length();
  if (!length || *length > max_drain_size)
    return ex.parser->is_done();

  std::array<char, buf_size> buf{};
  std::size_t total{};
  while (!ex.parser->is_done() && total <= max_drain_size) {
    auto &body = ex.parser->get().body();
    body.data = buf.data();
    body.size = buf_size;
    boost::system::error_code bec;
    ex.conn->lowest_layer().expires_after(session.get_config().read_timeout);
    ex.conn->visit([&](auto &s) {
      http::async_read(s, ex.buffer, *ex.parser, session.get_yield()[bec]);
    });
    ex.conn->lowest_layer().expires_never();
    if (bec == http::error::need_buffer)
      bec.clear();
    if (bec) {
      lgr.debug("Connection #{}: draining redirect body failed: {}",
                ex.conn->id, bec);
      return false;
    }
    total += buf_size - body.size;
  }
  return ex.parser->is_done();
}

[[nodiscard]] auto
http_client::get(const url &u, std::error_code &ec,
                 const std::optional<byte_range> &range)
  -> std::unique_ptr<http_response> {
  auto &lgr = logger::instance();
  const auto max_redirects = session.get_config().max_redirects;

  auto current = u;
  std::vector<redirect_hop> hops;
  for (;;) {
    lgr.debug("GET {}", current);
    auto ex = send(current, range, ec);
    if (ec)
      return nullptr;

    const http_header header(ex.parser->get().base());
    if (!header.is_redirect())
      return std::make_unique<http_response>(
        session, ex.conn, std::move(ex.parser), std::move(ex.buffer),
        std::move(current), std::move(hops));

    if (header.location.empty()) {
      lgr.error("Redirect {} from {} has no location", header.status,
                current);
      session.discard(ex.conn);
      ec = http_error_code::missing_location;
      return nullptr;
    }
    auto next = current.resolve(header.location, ec);
    if (ec) {
      lgr.error("Bad redirect location {}: {}", header.location, ec);
      session.discard(ex.conn);
      return nullptr;
    }
    lgr.info("Redirect {} ({}): {} -> {}", std::size(hops) + 1, header.status,
             current, next);
    if (current.origin() != next.origin())
      lgr.debug("Redirect changes origin: {} -> {}", current.origin(),
                next.origin());
    hops.push_back({current, header.status, next});

    const bool drained = drain(ex);
    session.release(ex.conn, drained && ex.parser->get().keep_alive());

    if (std::size(hops) > max_redirects) {
      lgr.error("Too many redirects ({} allowed)", max_redirects);
      ec = http_error_code::too_many_redirects;
      return nullptr;
    }
    current = std::move(next);
  }
}

}  // namespace vnr
