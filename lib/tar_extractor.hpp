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

#ifndef LIB_TAR_EXTRACTOR_HPP_
#define LIB_TAR_EXTRACTOR_HPP_

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

enum class tar_error_code : std::uint8_t {
  ok = 0,
  bad_checksum = 1,
  bad_header = 2,
  unsafe_path = 3,
  truncated_archive = 4,
  write_failed = 5,
};

template <>
struct std::is_error_code_enum<tar_error_code> : public std::true_type {};

struct tar_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "tar";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "tar header checksum mismatch"s;
    case 2: return "malformed tar header"s;
    case 3: return "tar entry path escapes extraction directory"s;
    case 4: return "tar archive truncated"s;
    case 5: return "failed writing extracted entry"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(tar_error_code e) -> std::error_code {
  static auto category = tar_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace vnr {

/// Extracts a tar stream (ustar, GNU long names and pax headers) under a
/// root directory, accepting input in chunks of any size
class tar_extractor {
public:
  static constexpr std::uint32_t block_size = 512;

  explicit tar_extractor(const std::filesystem::path &root);

  [[nodiscard]] auto
  write(const char *data, std::size_t size) -> std::error_code;

  /// Call at end of input; applies directory attributes
  [[nodiscard]] auto
  finish() -> std::error_code;

  [[nodiscard]] auto
  is_finished() const -> bool {
    return state == state_t::end_of_archive;
  }

  [[nodiscard]] auto
  get_root() const -> const std::filesystem::path & {
    return root;
  }

  std::uint32_t n_entries{};
  std::uint32_t n_files{};
  std::uint32_t n_dirs{};
  std::uint32_t n_links{};
  std::uint32_t n_skipped{};
  std::uint64_t bytes_written{};

private:
  enum class state_t : std::uint8_t {
    header,
    data,
    padding,
    end_of_archive,
  };

  enum class entry_kind : std::uint8_t {
    file,
    meta,
    skip,
  };

  [[nodiscard]] auto
  process_header() -> std::error_code;

  [[nodiscard]] auto
  begin_entry(const char type, const std::string &name,
              const std::string &link) -> std::error_code;

  [[nodiscard]] auto
  consume(const char *data, const std::size_t size) -> std::error_code;

  [[nodiscard]] auto
  end_entry() -> std::error_code;

  [[nodiscard]] auto
  parse_pax(const std::string &records) -> std::error_code;

  /// Map an archive name to a path under root; empty if the name refers
  /// to root itself
  [[nodiscard]] auto
  safe_path(const std::string &name,
            std::error_code &ec) const -> std::filesystem::path;

  std::filesystem::path root;
  state_t state{state_t::header};
  std::array<char, block_size> block{};
  std::size_t block_fill{};
  std::uint32_t n_zero_blocks{};

  // current entry
  entry_kind kind{entry_kind::skip};
  char entry_type{};
  std::filesystem::path entry_path;
  std::uint32_t entry_mode{};
  std::int64_t entry_mtime{};
  std::uint64_t remaining{};
  std::uint64_t padding{};
  std::ofstream out;
  std::string meta;

  // from GNU long name and pax headers, applied to the next entry
  std::optional<std::string> next_path;
  std::optional<std::string> next_link;
  std::optional<std::uint64_t> next_size;

  // directory mode and mtime are set after everything is extracted
  std::vector<std::tuple<std::filesystem::path, std::uint32_t, std::int64_t>>
    dir_attrs;
};

}  // namespace vnr

#endif  // LIB_TAR_EXTRACTOR_HPP_
