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

#ifndef LIB_FETCH_HPP_
#define LIB_FETCH_HPP_

#include "http_client.hpp"
#include "http_session.hpp"
#include "transfer_progress.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

enum class fetch_error_code : std::uint8_t {
  ok = 0,
  not_a_directory = 1,
  output_file_failed = 2,
  truncated_body = 3,
};

template <>
struct std::is_error_code_enum<fetch_error_code> : public std::true_type {};

struct fetch_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "fetch";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "destination is not an existing directory"s;
    case 2: return "failed to write output file"s;
    case 3: return "body shorter than content-length"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(fetch_error_code e) -> std::error_code {
  static auto category = fetch_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace vnr {

struct fetch_request {
  std::string url;
  std::string outdir;
  http_config config;
  bool extract{true};
};

struct fetch_result {
  std::filesystem::path output_file;
  std::filesystem::path extraction_dir;  // empty if not extracted
  std::string effective_url;
  std::uint32_t status{};
  std::vector<redirect_hop> redirects;
  std::uint64_t content_length{};
  bool accepts_ranges{false};
  std::optional<std::uint32_t> isize;
  std::uint64_t bytes_downloaded{};
  std::uint64_t bytes_uncompressed{};
  std::uint32_t n_entries{};
  std::uint32_t n_files{};
  std::uint32_t n_dirs{};
  std::uint32_t n_links{};
  session_stats session;
  transfer_stats reads;
  std::chrono::milliseconds time_to_first_byte{};
  std::chrono::milliseconds total_time{};

  /// Key/value pairs for log_args
  [[nodiscard]] auto
  summary() const -> std::vector<std::tuple<std::string, std::string>>;
};

/// Path of the downloaded file inside the destination directory, which
/// must exist
[[nodiscard]] auto
output_file_path(const fetch_request &request,
                 std::error_code &ec) -> std::filesystem::path;

/// Download, and possibly extract, the requested url, tracing the network
/// activity
[[nodiscard]] auto
fetch(const fetch_request &request)
  -> std::tuple<fetch_result, std::error_code>;

}  // namespace vnr

#endif  // LIB_FETCH_HPP_
