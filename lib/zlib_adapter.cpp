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

#include "zlib_adapter.hpp"

#include <zlib.h>

#include <array>
#include <cerrno>  // for errno
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace vnr {

[[nodiscard]] auto
zlib_return_to_error(const int ret) -> std::error_code {
  // clang-format off
  switch (ret) {
  case Z_OK: return zlib_adapter_error_code::ok;
  case Z_STREAM_END: return zlib_adapter_error_code::z_stream_end;
  case Z_NEED_DICT: return zlib_adapter_error_code::z_need_dict;
  case Z_ERRNO: return zlib_adapter_error_code::z_errno;
  case Z_STREAM_ERROR: return zlib_adapter_error_code::z_stream_error;
  case Z_DATA_ERROR: return zlib_adapter_error_code::z_data_error;
  case Z_MEM_ERROR: return zlib_adapter_error_code::z_mem_error;
  case Z_BUF_ERROR: return zlib_adapter_error_code::z_buf_error;
  case Z_VERSION_ERROR: return zlib_adapter_error_code::z_version_error;
  }
  // clang-format on
  return zlib_adapter_error_code::unexpected_return_code;
}

gzip_inflater::gzip_inflater(std::error_code &ec) : out(out_buf_size) {
  // 16 added to window bits: expect a gzip header and trailer
  static constexpr auto gzip_window_bits = 16 + MAX_WBITS;
  const int ret = inflateInit2(&strm, gzip_window_bits);
  if (ret != Z_OK) {
    ec = zlib_return_to_error(ret);
    return;
  }
  initialized = true;
}

gzip_inflater::~gzip_inflater() {
  if (initialized)
    inflateEnd(&strm);
}

[[nodiscard]] auto
load_isize(const std::filesystem::path &path,
           std::error_code &ec) -> std::uint32_t {
  static constexpr auto isize_bytes = 4;
  const auto filesize = std::filesystem::file_size(path, ec);
  if (ec)
    return 0;
  if (filesize < isize_bytes) {
    ec = zlib_adapter_error_code::truncated_stream;
    return 0;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ec = std::make_error_code(std::errc(errno));
    return 0;
  }
  std::array<std::uint8_t, isize_bytes> buf{};
  in.seekg(-isize_bytes, std::ios::end);
  if (!in.read(reinterpret_cast<char *>(buf.data()), isize_bytes)) {
    ec = std::make_error_code(std::errc::io_error);
    return 0;
  }
  return isize_from_bytes(buf);
}

}  // namespace vnr
