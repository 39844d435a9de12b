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

#include "logger.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <unistd.h>  // for getpid

#include <chrono>
#include <ctime>  // for localtime_r
#include <iterator>
#include <memory>  // for std::shared_ptr
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

namespace vnr {

// fixed width so messages line up
static constexpr auto line_level_name = std::array{
  // clang-format off
  "DEBUG   "sv,
  "INFO    "sv,
  "WARNING "sv,
  "ERROR   "sv,
  "CRITICAL"sv,
  // clang-format on
};

logger::logger(const std::shared_ptr<std::ostream> &log_file,
               const std::string &appname, const log_level_t min_log_level) :
  log_file{log_file}, tag{fmt::format("{}[{}]", appname, getpid())},
  start{std::chrono::steady_clock::now()}, min_log_level{min_log_level} {
  if (log_file == nullptr || !log_file->good())
    status = std::make_error_code(std::errc::bad_file_descriptor);
}

auto
logger::write_line(const log_level_t lvl, const std::string_view msg) -> void {
  namespace chrono = std::chrono;
  const auto now = chrono::system_clock::now();
  const auto millis =
    chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) %
    1000;
  const auto now_time_t = chrono::system_clock::to_time_t(now);
  struct tm tm {};
  localtime_r(&now_time_t, &tm);  // localtime_r is thread-safe
  const auto elapsed = chrono::duration_cast<chrono::milliseconds>(
    chrono::steady_clock::now() - start);

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line),
                 "{:%Y-%m-%d %H:%M:%S}.{:03} +{}.{:03} {} {} {}\n", tm,
                 millis.count(), elapsed.count() / 1000,
                 elapsed.count() % 1000, tag,
                 line_level_name[std::to_underlying(lvl)], msg);

  std::lock_guard lck{mtx};
  if (status)
    return;
  log_file->write(line.data(), static_cast<std::streamsize>(line.size()));
  log_file->flush();
  if (!log_file->good())
    status = std::make_error_code(std::errc::io_error);
}

}  // namespace vnr
