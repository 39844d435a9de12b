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

#include <zlib_adapter.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace vnr;  // NOLINT

[[nodiscard]] static auto
inflate_all(gzip_inflater &inf, const std::string &data,
            const std::size_t chunk_size, std::string &out) -> std::error_code {
  const auto sink = [&](const char *d, const std::size_t n) -> std::error_code {
    out.append(d, n);
    return {};
  };
  for (std::size_t i = 0; i < std::size(data); i += chunk_size) {
    const auto n = std::min(chunk_size, std::size(data) - i);
    if (const auto ec = inf.inflate(data.data() + i, n, sink))
      return ec;
  }
  return {};
}

TEST(zlib_adapter_test, inflate_single_member) {
  std::string original;
  for (auto i = 0; i < 20000; ++i)
    original += std::to_string(i) + '\n';
  const auto compressed = gzip_compress(original);

  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  std::string out;
  ec = inflate_all(inf, compressed, std::size(compressed), out);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(inf.is_done());
  EXPECT_EQ(out, original);
  EXPECT_EQ(inf.total_out(), std::size(original));
  EXPECT_EQ(inf.total_in(), std::size(compressed));
  EXPECT_EQ(inf.members(), 1u);
}

TEST(zlib_adapter_test, inflate_small_chunks) {
  const std::string original(300000, 'a');
  const auto compressed = gzip_compress(original);
  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  std::string out;
  ec = inflate_all(inf, compressed, 7, out);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(inf.is_done());
  EXPECT_EQ(out, original);
}

TEST(zlib_adapter_test, inflate_multiple_members) {
  const auto compressed = gzip_compress("first ") + gzip_compress("second");
  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  std::string out;
  ec = inflate_all(inf, compressed, 5, out);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(inf.is_done());
  EXPECT_EQ(out, "first second");
  EXPECT_EQ(inf.members(), 2u);
}

TEST(zlib_adapter_test, truncated_input_is_not_done) {
  const auto compressed = gzip_compress(std::string(100000, 'x'));
  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  std::string out;
  ec = inflate_all(inf, compressed.substr(0, std::size(compressed) / 2), 1024,
                   out);
  EXPECT_FALSE(ec);
  EXPECT_FALSE(inf.is_done());
}

TEST(zlib_adapter_test, corrupt_input) {
  std::string compressed = gzip_compress("some data that is long enough");
  compressed[0] = 'X';  // bad magic
  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  std::string out;
  ec = inflate_all(inf, compressed, std::size(compressed), out);
  EXPECT_EQ(ec, zlib_adapter_error_code::z_data_error);
}

TEST(zlib_adapter_test, sink_error_stops_inflate) {
  const auto compressed = gzip_compress(std::string(1000, 'y'));
  std::error_code ec;
  gzip_inflater inf(ec);
  ASSERT_FALSE(ec);
  ec = inf.inflate(compressed.data(), std::size(compressed),
                   [](const char *, const std::size_t) -> std::error_code {
                     return std::make_error_code(std::errc::no_space_on_device);
                   });
  EXPECT_EQ(ec, std::errc::no_space_on_device);
}

TEST(zlib_adapter_test, isize_from_bytes) {
  static_assert(isize_from_bytes({0x01, 0x00, 0x00, 0x00}) == 1u);
  EXPECT_EQ(isize_from_bytes({0x78, 0x56, 0x34, 0x12}), 0x12345678u);
  EXPECT_EQ(isize_from_bytes({0xff, 0xff, 0xff, 0xff}), 0xffffffffu);
}

TEST(zlib_adapter_test, load_isize) {
  const std::string original(123457, 'z');
  const auto filename = generate_temp_filename("isize", ".gz");
  {
    std::ofstream out(filename, std::ios::binary);
    const auto compressed = gzip_compress(original);
    out.write(compressed.data(), static_cast<std::streamsize>(std::size(compressed)));
  }
  std::error_code ec;
  const auto isize = load_isize(filename, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(isize, std::size(original));
  std::filesystem::remove(filename, ec);
  EXPECT_FALSE(ec);

  [[maybe_unused]] const auto missing = load_isize(filename, ec);
  EXPECT_TRUE(ec);
}
