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

#include <http_client.hpp>

#include <http_error_code.hpp>
#include <http_session.hpp>
#include <url.hpp>

#include "local_http_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

using namespace vnr;  // NOLINT

/// Run f(session) inside a coroutine on a fresh io_context
template <typename F>
[[nodiscard]] static auto
with_session(const http_config &config, F &&f) -> std::error_code {
  boost::asio::io_context ioc;
  std::error_code ec;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    http_session session(ioc, config, yield, ec);
    if (ec)
      return;
    f(session);
    session.shutdown_all();
  });
  ioc.run();
  return ec;
}

[[nodiscard]] static auto
read_body(http_response &response, std::error_code &ec) -> std::string {
  std::string body;
  std::array<char, 1024> buf{};
  while (!response.is_done()) {
    const auto n = response.read_some(buf.data(), std::size(buf), ec);
    if (ec || n == 0)
      break;
    body.append(buf.data(), n);
  }
  return body;
}

[[nodiscard]] static auto
parse(const std::string &s) -> url {
  std::error_code ec;
  auto u = parse_url(s, ec);
  EXPECT_FALSE(ec) << s;
  return u;
}

class http_client_mock : public testing::Test {
protected:
  auto
  SetUp() -> void override {
    const std::string body = payload;
    server.route("/file.bin", [body](const auto &req) {
      return local_http_server::file_response(req, body);
    });
  }

public:
  static constexpr auto payload = "0123456789abcdefghijklmnopqrstuvwxyz";
  local_http_server server;
  http_config config;
};

TEST_F(http_client_mock, simple_get) {
  std::string body;
  std::error_code get_ec;
  std::uint32_t status{};
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    auto response = client.get(parse(server.url("/file.bin")), get_ec);
    if (get_ec)
      return;
    status = response->header().status;
    EXPECT_EQ(response->header().content_length.value_or(0),
              std::string(payload).size());
    EXPECT_TRUE(response->header().accepts_byte_ranges());
    EXPECT_TRUE(response->redirects().empty());
    body = read_body(*response, get_ec);
    EXPECT_EQ(response->body_bytes(), std::size(body));
    response->finish();
  });
  EXPECT_FALSE(ec);
  EXPECT_FALSE(get_ec) << get_ec.message();
  EXPECT_EQ(status, 200u);
  EXPECT_EQ(body, payload);
}

TEST_F(http_client_mock, connection_reused) {
  session_stats stats;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    for (auto i = 0; i < 2; ++i) {
      std::error_code get_ec;
      auto response = client.get(parse(server.url("/file.bin")), get_ec);
      ASSERT_FALSE(get_ec) << get_ec.message();
      EXPECT_EQ(read_body(*response, get_ec), payload);
      response->finish();
    }
    stats = session.get_stats();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(server.n_connections.load(), 1u);
  EXPECT_EQ(server.n_requests.load(), 2u);
  EXPECT_EQ(stats.n_connections, 1u);
  EXPECT_EQ(stats.n_reused, 1u);
  EXPECT_EQ(stats.n_resolves, 1u);
}

TEST_F(http_client_mock, no_reuse) {
  config.reuse_connections = false;
  session_stats stats;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    for (auto i = 0; i < 2; ++i) {
      std::error_code get_ec;
      auto response = client.get(parse(server.url("/file.bin")), get_ec);
      ASSERT_FALSE(get_ec) << get_ec.message();
      EXPECT_EQ(read_body(*response, get_ec), payload);
      response->finish();
    }
    stats = session.get_stats();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(server.n_connections.load(), 2u);
  EXPECT_EQ(stats.n_connections, 2u);
  EXPECT_EQ(stats.n_reused, 0u);
}

TEST_F(http_client_mock, stale_connection_replaced) {
  server.set_close_after_response(true);
  std::string body;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    for (auto i = 0; i < 2; ++i) {
      std::error_code get_ec;
      auto response = client.get(parse(server.url("/file.bin")), get_ec);
      ASSERT_FALSE(get_ec) << get_ec.message();
      body = read_body(*response, get_ec);
      EXPECT_FALSE(get_ec);
      response->finish();
    }
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(body, payload);
  EXPECT_EQ(server.n_connections.load(), 2u);
}

TEST_F(http_client_mock, follows_redirects) {
  server.route("/old", [this](const auto &req) {
    return local_http_server::redirect(req, server.url("/middle"), 301);
  });
  server.route("/middle", [](const auto &req) {
    return local_http_server::redirect(req, "/file.bin", 307);
  });
  std::string body;
  std::vector<redirect_hop> hops;
  std::string effective;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    std::error_code get_ec;
    auto response = client.get(parse(server.url("/old")), get_ec);
    ASSERT_FALSE(get_ec) << get_ec.message();
    hops = response->redirects();
    effective = response->effective_url().str();
    body = read_body(*response, get_ec);
    response->finish();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(body, payload);
  ASSERT_EQ(std::size(hops), 2u);
  EXPECT_EQ(hops[0].status, 301u);
  EXPECT_EQ(hops[0].to.target, "/middle");
  EXPECT_EQ(hops[1].status, 307u);
  EXPECT_EQ(hops[1].from.target, "/middle");
  EXPECT_EQ(effective, server.url("/file.bin"));
  // redirect bodies are drained so one connection serves all three
  EXPECT_EQ(server.n_connections.load(), 1u);
}

TEST_F(http_client_mock, too_many_redirects) {
  config.max_redirects = 3;
  server.route("/loop", [](const auto &req) {
    return local_http_server::redirect(req, "/loop");
  });
  std::error_code get_ec;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    auto response = client.get(parse(server.url("/loop")), get_ec);
    EXPECT_FALSE(response);
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(get_ec, http_error_code::too_many_redirects);
  EXPECT_EQ(server.n_requests.load(), 4u);
}

TEST_F(http_client_mock, redirect_without_location) {
  server.route("/nowhere", [](const auto &req) {
    return local_http_server::redirect(req, "");
  });
  std::error_code get_ec;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    [[maybe_unused]] auto response =
      client.get(parse(server.url("/nowhere")), get_ec);
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(get_ec, http_error_code::missing_location);
}

TEST_F(http_client_mock, error_status_is_returned) {
  std::uint32_t status{};
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    std::error_code get_ec;
    auto response = client.get(parse(server.url("/missing")), get_ec);
    ASSERT_FALSE(get_ec) << get_ec.message();
    status = response->header().status;
    EXPECT_FALSE(response->header().is_success());
    response->finish();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(status, 404u);
}

TEST_F(http_client_mock, byte_range) {
  std::string body;
  std::string content_range;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    std::error_code get_ec;
    auto response = client.get(parse(server.url("/file.bin")), get_ec,
                               byte_range{2, 5});
    ASSERT_FALSE(get_ec) << get_ec.message();
    EXPECT_EQ(response->header().status, 206u);
    content_range = response->header().content_range;
    body = read_body(*response, get_ec);
    response->finish();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(body, "2345");
  EXPECT_EQ(content_range,
            fmt::format("bytes 2-5/{}", std::string(payload).size()));
  EXPECT_EQ(server.n_range_requests.load(), 1u);
}

TEST_F(http_client_mock, chunked_body) {
  server.route("/chunked", [](const local_http_server::request_type &req) {
    local_http_server::response_type res{boost::beast::http::status::ok,
                                         req.version()};
    res.chunked(true);
    res.body() = std::string(5000, 'c');
    return res;
  });
  std::string body;
  bool has_length{true};
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    std::error_code get_ec;
    auto response = client.get(parse(server.url("/chunked")), get_ec);
    ASSERT_FALSE(get_ec) << get_ec.message();
    has_length = response->header().content_length.has_value();
    body = read_body(*response, get_ec);
    EXPECT_FALSE(get_ec);
    response->finish();
  });
  EXPECT_FALSE(ec);
  EXPECT_FALSE(has_length);
  EXPECT_EQ(body, std::string(5000, 'c'));
}

TEST_F(http_client_mock, ip_version_filter) {
  config.ip_version = ip_version_t::v6;
  std::error_code get_ec;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    [[maybe_unused]] auto response =
      client.get(parse(server.url("/file.bin")), get_ec);
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(get_ec, http_error_code::connect_failed);
  EXPECT_EQ(server.n_requests.load(), 0u);
}

TEST_F(http_client_mock, tls_to_plain_server) {
  std::error_code get_ec;
  const auto ec = with_session(config, [&](http_session &session) {
    http_client client(session);
    const auto u =
      parse(fmt::format("https://127.0.0.1:{}/file.bin", server.get_port()));
    [[maybe_unused]] auto response = client.get(u, get_ec);
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(get_ec, http_error_code::handshake_failed);
}

TEST(http_session_test, bad_ca_file) {
  http_config config;
  config.ca_file = "/no/such/ca-bundle.pem";
  boost::asio::io_context ioc;
  std::error_code ec;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    http_session session(ioc, config, yield, ec);
  });
  ioc.run();
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(http_client_mock, cancel_while_waiting_for_header) {
  server.route("/slow", [](const auto &req) {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return local_http_server::file_response(req, "late");
  });
  std::error_code get_ec;
  bool was_cancelled{false};
  boost::asio::io_context ioc;
  boost::asio::steady_timer timer(ioc);
  std::error_code ec;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    http_session session(ioc, config, yield, ec);
    if (ec)
      return;
    timer.expires_after(std::chrono::milliseconds(50));
    timer.async_wait([&](const boost::system::error_code &timer_ec) {
      if (!timer_ec)
        session.cancel();
    });
    http_client client(session);
    [[maybe_unused]] auto response =
      client.get(parse(server.url("/slow")), get_ec);
    was_cancelled = session.is_cancelled();
    timer.cancel();
  });
  ioc.run();
  EXPECT_FALSE(ec);
  EXPECT_TRUE(was_cancelled);
  EXPECT_EQ(get_ec, http_error_code::interrupted);
}

TEST(http_session_test, resolve_bounded_by_connect_timeout) {
  http_config config;
  // expires before the lookup can complete
  config.connect_timeout = std::chrono::milliseconds(0);
  std::error_code acquire_ec;
  session_stats stats;
  const auto ec = with_session(config, [&](http_session &session) {
    [[maybe_unused]] const auto conn =
      session.acquire(parse("http://localhost:8080/file.bin"), acquire_ec);
    stats = session.get_stats();
  });
  EXPECT_FALSE(ec);
  EXPECT_EQ(acquire_ec, http_error_code::resolve_failed);
  EXPECT_EQ(stats.n_resolves, 1u);
  EXPECT_EQ(stats.n_connect_attempts, 0u);
}
