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

#ifndef LIB_INCLUDE_LOGGER_HPP_
#define LIB_INCLUDE_LOGGER_HPP_

#include "format_error_code.hpp"  // IWYU pragma: keep

#include <fmt/core.h>
#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstdint>  // std::uint8_t
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // std::to_underlying

namespace vnr {
/*
  Each line:
  - date and time with milliseconds (YYYY-MM-DD HH:MM:SS.mmm)
  - seconds since the logger started (+S.mmm)
  - appname[pid]
  - log level
  - message
*/

using std::literals::string_view_literals::operator""sv;

enum class log_level_t : std::uint8_t {
  debug,
  info,
  warning,
  error,
  critical,
};

static constexpr auto level_name = std::array{
  // clang-format off
  "debug"sv,
  "info"sv,
  "warning"sv,
  "error"sv,
  "critical"sv,
  // clang-format on
};

[[nodiscard]] constexpr auto
to_name(const log_level_t l) -> const std::string_view {
  return level_name[std::to_underlying(l)];
}

inline auto
operator<<(std::ostream &o, const log_level_t &l) -> std::ostream & {
  return o << to_name(l);
}

inline auto
operator>>(std::istream &in, log_level_t &l) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  for (std::size_t idx = 0; idx < std::size(level_name); ++idx)
    if (tmp == level_name[idx]) {
      l = static_cast<log_level_t>(idx);
      return in;
    }
  in.setstate(std::ios::failbit);
  return in;
}

[[nodiscard]] inline auto
shared_from_cerr() -> std::shared_ptr<std::ostream> {
  return std::make_shared<std::ostream>(std::cerr.rdbuf());
}

/// Process-wide logger; the first call to instance() decides where lines
/// go, and every line is flushed as it is written
class logger {
public:
  static constexpr log_level_t default_level{log_level_t::debug};

  static auto
  instance(const std::shared_ptr<std::ostream> &log_file_ptr = nullptr,
           const std::string &appname = "vnr",
           const log_level_t min_log_level = default_level) -> logger & {
    static logger lgr(log_file_ptr ? log_file_ptr : shared_from_cerr(),
                      appname, min_log_level);
    return lgr;
  }

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

  auto
  set_level(const log_level_t lvl) noexcept -> void {
    min_log_level = lvl;
  }

  [[nodiscard]] auto
  get_level() const noexcept -> log_level_t {
    return min_log_level;
  }

  [[nodiscard]] auto
  is_enabled(const log_level_t lvl) const noexcept -> bool {
    return lvl >= min_log_level;
  }

  operator bool() const { return status ? false : true; }

  template <log_level_t the_level, typename... Args>
  auto
  log(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    if (the_level >= min_log_level)
      write_line(the_level, fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  auto
  debug(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    log<log_level_t::debug>(fmt_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto
  info(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    log<log_level_t::info>(fmt_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto
  warning(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    log<log_level_t::warning>(fmt_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto
  error(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    log<log_level_t::error>(fmt_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto
  critical(fmt::format_string<Args...> fmt_str, Args &&...args) -> void {
    log<log_level_t::critical>(fmt_str, std::forward<Args>(args)...);
  }

private:
  logger(const std::shared_ptr<std::ostream> &log_file,
         const std::string &appname, const log_level_t min_log_level);
  ~logger() = default;

  logger(const logger &) = delete;
  auto
  operator=(const logger &) -> logger & = delete;

  auto
  write_line(const log_level_t lvl, const std::string_view msg) -> void;

  std::shared_ptr<std::ostream> log_file{nullptr};
  std::string tag;  // appname[pid]
  std::chrono::steady_clock::time_point start;
  std::mutex mtx{};
  log_level_t min_log_level{};
  std::error_code status{};
};

template <log_level_t lvl>
auto
log_args(const auto &key_value_pairs) {
  logger &lgr = logger::instance();
  for (const auto &[k, v] : key_value_pairs)
    lgr.log<lvl>("{}: {}", k, v);
}

}  // namespace vnr

template <>
struct fmt::formatter<vnr::log_level_t> : fmt::formatter<std::string_view> {
  auto
  format(const vnr::log_level_t &lvl, fmt::format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(vnr::to_name(lvl), ctx);
  }
};

#endif  // LIB_INCLUDE_LOGGER_HPP_
