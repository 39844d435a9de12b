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

#ifndef LIB_TRANSFER_PROGRESS_HPP_
#define LIB_TRANSFER_PROGRESS_HPP_

#include "logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace vnr {

/// Traces bytes accumulated against an optional expected total
class transfer_progress {
public:
  static constexpr std::uint64_t report_step = 10 * 1024 * 1024;

  explicit transfer_progress(const std::optional<std::uint64_t> total) :
    total{total} {}

  auto
  update(const std::uint64_t n_bytes) -> void {
    acc += n_bytes;
    if (total && *total > 0) {
      const auto pct = 100.0 * static_cast<double>(acc) /
                       static_cast<double>(*total);
      if (pct > last_pct + 1.0) {
        last_pct = pct;
        ++n_reports;
        logger::instance().debug("read {} / {} bytes, (~{}%)", acc, *total,
                                 static_cast<std::uint64_t>(pct));
      }
    }
    else if (acc >= next_report) {
      logger::instance().debug("read {} bytes", acc);
      ++n_reports;
      next_report = (acc / report_step + 1) * report_step;
    }
  }

  [[nodiscard]] auto
  bytes() const -> std::uint64_t {
    return acc;
  }

  /// Number of progress lines written
  [[nodiscard]] auto
  reports() const -> std::uint32_t {
    return n_reports;
  }

private:
  std::optional<std::uint64_t> total;
  std::uint64_t acc{};
  double last_pct{};
  std::uint64_t next_report{report_step};
  std::uint32_t n_reports{};
};

/// Sizes of individual reads; odd patterns point at stalls or tiny
/// segments
struct transfer_stats {
  std::uint32_t n_xfrs{};
  std::uint64_t xfr_bytes{};
  std::uint64_t min_xfr_size{std::numeric_limits<std::uint64_t>::max()};
  std::uint64_t max_xfr_size{};

  auto
  update(const std::uint64_t n_bytes) -> void {
    // Don't count zero-byte reads
    if (n_bytes == 0)
      return;
    ++n_xfrs;
    xfr_bytes += n_bytes;
    max_xfr_size = std::max(max_xfr_size, n_bytes);
    min_xfr_size = std::min(min_xfr_size, n_bytes);
  }

  [[nodiscard]] auto
  str() const -> std::string {
    static constexpr auto fmt_str = "{}B, N={}, max={}B, min={}B";
    return fmt::format(fmt_str, xfr_bytes, n_xfrs, max_xfr_size,
                       n_xfrs > 0 ? min_xfr_size : 0);
  }
};

}  // namespace vnr

#endif  // LIB_TRANSFER_PROGRESS_HPP_
