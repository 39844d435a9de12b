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

#ifndef LIB_ZLIB_ADAPTER_HPP_
#define LIB_ZLIB_ADAPTER_HPP_

#include <zlib.h>

#include <array>
#include <cstdint>  // for std::uint8_t
#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

// clang-format off
// ADS: from zlib/zlib.h
// #define Z_OK            0
// #define Z_STREAM_END    1
// #define Z_NEED_DICT     2
// #define Z_ERRNO        (-1)
// #define Z_STREAM_ERROR (-2)
// #define Z_DATA_ERROR   (-3)
// #define Z_MEM_ERROR    (-4)
// #define Z_BUF_ERROR    (-5)
// #define Z_VERSION_ERROR (-6)
// clang-format on
enum class zlib_adapter_error_code : std::uint8_t {
  ok = 0,
  z_stream_end = 1,
  z_need_dict = 2,
  z_errno = 3,
  z_stream_error = 4,
  z_data_error = 5,
  z_mem_error = 6,
  z_buf_error = 7,
  z_version_error = 8,
  unexpected_return_code = 9,
  truncated_stream = 10,
};

template <>
struct std::is_error_code_enum<zlib_adapter_error_code>
  : public std::true_type {};

struct zlib_adapter_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "zlib_adapter_error_code";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "Z_STREAM_END"s;
    case 2: return "Z_NEED_DICT"s;
    case 3: return "Z_ERRNO"s;
    case 4: return "Z_STREAM_ERROR"s;
    case 5: return "Z_DATA_ERROR"s;
    case 6: return "Z_MEM_ERROR"s;
    case 7: return "Z_BUF_ERROR"s;
    case 8: return "Z_VERSION_ERROR"s;
    case 9: return "unexpected return code from zlib"s;
    case 10: return "gzip stream ended early"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(zlib_adapter_error_code e) -> std::error_code {
  static auto category = zlib_adapter_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace vnr {

[[nodiscard]] auto
zlib_return_to_error(const int ret) -> std::error_code;

/// Streaming gzip decoder; output is handed to a sink as it is produced
class gzip_inflater {
public:
  static constexpr std::uint32_t out_buf_size = 128 * 1024;

  explicit gzip_inflater(std::error_code &ec);
  ~gzip_inflater();

  gzip_inflater(const gzip_inflater &) = delete;
  auto
  operator=(const gzip_inflater &) -> gzip_inflater & = delete;

  /// Decode the given bytes; sink is called as sink(const char *, size)
  /// and returns a std::error_code, and a sink error stops decoding
  template <typename Sink>
  [[nodiscard]] auto
  inflate(const char *data, const std::size_t size,
          Sink &&sink) -> std::error_code {
    // ADS: 'next_in' is 'z_const' defined as 'const' in zconf.h
    strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
    strm.avail_in = static_cast<uInt>(size);
    n_in += size;
    for (;;) {
      if (stream_ended) {
        if (strm.avail_in == 0)
          break;
        // another gzip member follows
        if (inflateReset(&strm) != Z_OK)
          return zlib_adapter_error_code::z_stream_error;
        stream_ended = false;
        ++n_members;
      }
      strm.next_out = out.data();
      strm.avail_out = out_buf_size;
      const int ret = ::inflate(&strm, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR)
        return zlib_return_to_error(ret);

      const auto n_out = out_buf_size - strm.avail_out;
      n_out_total += n_out;
      if (n_out > 0)
        if (const auto err =
              sink(reinterpret_cast<const char *>(out.data()), n_out))
          return err;

      if (ret == Z_STREAM_END) {
        stream_ended = true;
        continue;
      }
      // all input consumed and nothing pending, or no progress possible
      if ((strm.avail_in == 0 && strm.avail_out != 0) || ret == Z_BUF_ERROR)
        break;
    }
    return zlib_adapter_error_code::ok;
  }

  /// True if the last gzip member ended and no input remains
  [[nodiscard]] auto
  is_done() const -> bool {
    return stream_ended && strm.avail_in == 0;
  }

  [[nodiscard]] auto
  total_in() const -> std::uint64_t {
    return n_in;
  }

  [[nodiscard]] auto
  total_out() const -> std::uint64_t {
    return n_out_total;
  }

  [[nodiscard]] auto
  members() const -> std::uint32_t {
    return n_members;
  }

private:
  z_stream strm{};
  std::vector<Bytef> out;
  std::uint64_t n_in{};
  std::uint64_t n_out_total{};
  std::uint32_t n_members{1};
  bool stream_ended{false};
  bool initialized{false};
};

/// The gzip ISIZE trailer field: uncompressed size modulo 2^32, stored
/// little-endian
[[nodiscard]] constexpr auto
isize_from_bytes(const std::array<std::uint8_t, 4> &b) -> std::uint32_t {
  return static_cast<std::uint32_t>(b[0]) |
         (static_cast<std::uint32_t>(b[1]) << 8) |
         (static_cast<std::uint32_t>(b[2]) << 16) |
         (static_cast<std::uint32_t>(b[3]) << 24);
}

/// Read ISIZE from the last 4 bytes of a gzip file
[[nodiscard]] auto
load_isize(const std::filesystem::path &path,
           std::error_code &ec) -> std::uint32_t;

}  // namespace vnr

#endif  // LIB_ZLIB_ADAPTER_HPP_
