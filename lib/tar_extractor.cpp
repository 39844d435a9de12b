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

#include "tar_extractor.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>

namespace vnr {

// clang-format off
// ADS: ustar header layout (offset, size)
//   name      0  100
//   mode    100    8
//   size    124   12
//   mtime   136   12
//   chksum  148    8
//   type    156    1
//   link    157  100
//   magic   257    6
//   prefix  345  155 (POSIX ustar only)
// clang-format on
static constexpr auto name_offset = 0;
static constexpr auto name_size = 100;
static constexpr auto mode_offset = 100;
static constexpr auto mode_size = 8;
static constexpr auto size_offset = 124;
static constexpr auto size_size = 12;
static constexpr auto mtime_offset = 136;
static constexpr auto mtime_size = 12;
static constexpr auto chksum_offset = 148;
static constexpr auto chksum_size = 8;
static constexpr auto type_offset = 156;
static constexpr auto link_offset = 157;
static constexpr auto link_size = 100;
static constexpr auto magic_offset = 257;
static constexpr auto prefix_offset = 345;
static constexpr auto prefix_size = 155;

static constexpr auto max_meta_size = 1024 * 1024;

using std::literals::string_view_literals::operator""sv;
static constexpr auto posix_magic = "ustar\0"sv;

namespace fs = std::filesystem;

[[nodiscard]] static inline auto
field_str(const char *field, const std::size_t len) -> std::string {
  return std::string(field, ::strnlen(field, len));
}

/// Octal, or base-256 when the high bit of the first byte is set
[[nodiscard]] static auto
parse_numeric(const char *field, const std::size_t len,
              bool &ok) -> std::uint64_t {
  const auto first = static_cast<unsigned char>(field[0]);
  if (first & 0x80) {
    if (first & 0x40) {  // negative
      ok = false;
      return 0;
    }
    std::uint64_t value = first & 0x3f;
    for (std::size_t i = 1; i < len; ++i) {
      if (value >> 56) {
        ok = false;
        return 0;
      }
      value = (value << 8) | static_cast<unsigned char>(field[i]);
    }
    return value;
  }
  std::size_t i = 0;
  while (i < len && field[i] == ' ')
    ++i;
  std::uint64_t value{};
  for (; i < len; ++i) {
    const char c = field[i];
    if (c == ' ' || c == '\0')
      break;
    if (c < '0' || c > '7') {
      ok = false;
      return 0;
    }
    value = value * 8 + static_cast<std::uint64_t>(c - '0');
  }
  return value;
}

[[nodiscard]] static inline auto
to_file_time(const std::int64_t t) -> fs::file_time_type {
  const auto sys = std::chrono::system_clock::from_time_t(
    static_cast<std::time_t>(t));
  return std::chrono::file_clock::from_sys(sys);
}

[[nodiscard]] static inline auto
is_existing_symlink(const fs::path &p) -> bool {
  std::error_code ec;
  return fs::is_symlink(fs::symlink_status(p, ec));
}

tar_extractor::tar_extractor(const std::filesystem::path &root) : root{root} {}

[[nodiscard]] auto
tar_extractor::safe_path(const std::string &name,
                         std::error_code &ec) const -> std::filesystem::path {
  auto &lgr = logger::instance();
  std::string_view n{name};
  if (n.starts_with('/')) {
    lgr.debug("tar: removing leading '/' from {}", name);
    while (n.starts_with('/'))
      n.remove_prefix(1);
  }
  fs::path rel;
  for (const auto &part : fs::path(n)) {
    if (part.empty() || part == ".")
      continue;
    if (part == "..") {
      lgr.error("tar: entry {} has a '..' component", name);
      ec = tar_error_code::unsafe_path;
      return {};
    }
    rel /= part;
  }
  if (rel.empty())
    return {};

  // writing through an extracted symlink could leave root
  auto p = root;
  for (auto itr = std::cbegin(rel); std::next(itr) != std::cend(rel); ++itr) {
    p /= *itr;
    if (is_existing_symlink(p)) {
      lgr.error("tar: entry {} goes through symlink {}", name, p.string());
      ec = tar_error_code::unsafe_path;
      return {};
    }
  }
  return root / rel;
}

[[nodiscard]] auto
tar_extractor::write(const char *data, std::size_t size) -> std::error_code {
  while (size > 0) {
    switch (state) {
    case state_t::header: {
      const auto n = std::min(block_size - block_fill, size);
      std::memcpy(block.data() + block_fill, data, n);
      block_fill += n;
      data += n;
      size -= n;
      if (block_fill == block_size) {
        block_fill = 0;
        if (const auto err = process_header())
          return err;
      }
      break;
    }
    case state_t::data: {
      const auto n = static_cast<std::size_t>(
        std::min(remaining, static_cast<std::uint64_t>(size)));
      if (const auto err = consume(data, n))
        return err;
      remaining -= n;
      data += n;
      size -= n;
      if (remaining == 0) {
        if (const auto err = end_entry())
          return err;
        state = padding > 0 ? state_t::padding : state_t::header;
      }
      break;
    }
    case state_t::padding: {
      const auto n = static_cast<std::size_t>(
        std::min(padding, static_cast<std::uint64_t>(size)));
      padding -= n;
      data += n;
      size -= n;
      if (padding == 0)
        state = state_t::header;
      break;
    }
    case state_t::end_of_archive:
      // archives are usually padded to a multiple of the record size
      return tar_error_code::ok;
    }
  }
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::process_header() -> std::error_code {
  auto &lgr = logger::instance();
  const auto h = block.data();

  if (std::ranges::all_of(block, [](const char c) { return c == '\0'; })) {
    if (++n_zero_blocks == 2)
      state = state_t::end_of_archive;
    return tar_error_code::ok;
  }
  n_zero_blocks = 0;

  bool ok{true};
  const auto stored = parse_numeric(h + chksum_offset, chksum_size, ok);
  if (!ok) {
    lgr.error("tar: unreadable header checksum");
    return tar_error_code::bad_header;
  }
  // some old archives were written with signed sums
  std::uint64_t sum{};
  std::int64_t signed_sum{};
  for (std::uint32_t i = 0; i < block_size; ++i) {
    const char c = (i >= chksum_offset && i < chksum_offset + chksum_size)
                     ? ' '
                     : block[i];
    sum += static_cast<unsigned char>(c);
    signed_sum += static_cast<signed char>(c);
  }
  if (stored != sum && static_cast<std::int64_t>(stored) != signed_sum) {
    lgr.error("tar: header checksum {} does not match computed {}", stored,
              sum);
    return tar_error_code::bad_checksum;
  }

  const char type = h[type_offset];
  const bool is_meta = type == 'L' || type == 'K' || type == 'x' || type == 'g';

  std::string name;
  if (next_path && !is_meta)
    name = *next_path;
  else {
    name = field_str(h + name_offset, name_size);
    const auto magic = std::string_view(h + magic_offset, std::size(posix_magic));
    if (magic == posix_magic) {
      const auto prefix = field_str(h + prefix_offset, prefix_size);
      if (!prefix.empty())
        name = prefix + "/" + name;
    }
  }
  const auto link = (next_link && !is_meta)
                      ? *next_link
                      : field_str(h + link_offset, link_size);

  auto size = parse_numeric(h + size_offset, size_size, ok);
  if (next_size && !is_meta)
    size = *next_size;
  entry_mode =
    static_cast<std::uint32_t>(parse_numeric(h + mode_offset, mode_size, ok)) &
    07777u;
  entry_mtime =
    static_cast<std::int64_t>(parse_numeric(h + mtime_offset, mtime_size, ok));
  if (!ok) {
    lgr.error("tar: malformed numeric field in header for {}", name);
    return tar_error_code::bad_header;
  }

  if (const auto err = begin_entry(type, name, link))
    return err;

  remaining = size;
  padding = (block_size - size % block_size) % block_size;
  if (remaining > 0)
    state = state_t::data;
  else if (const auto err = end_entry())
    return err;
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::begin_entry(const char type, const std::string &name,
                           const std::string &link) -> std::error_code {
  auto &lgr = logger::instance();
  entry_type = type;
  kind = entry_kind::skip;

  switch (type) {
  case 'L':
  case 'K':
  case 'x':
    kind = entry_kind::meta;
    meta.clear();
    return tar_error_code::ok;
  case 'g':
    lgr.debug("tar: skipping global pax header");
    return tar_error_code::ok;
  }

  ++n_entries;
  next_path.reset();
  next_link.reset();
  next_size.reset();

  std::error_code ec;
  const auto path = safe_path(name, ec);
  if (ec)
    return ec;
  if (path.empty())
    return tar_error_code::ok;
  entry_path = path;

  switch (type) {
  case '0':
  case '\0':
  case '7': {
    fs::create_directories(path.parent_path(), ec);
    if (!ec)
      fs::remove(path, ec);  // never write through an existing link
    if (ec) {
      lgr.error("tar: cannot create {}: {}", path.string(), ec);
      return tar_error_code::write_failed;
    }
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      lgr.error("tar: cannot open {}: {}", path.string(),
                std::make_error_code(std::errc(errno)));
      return tar_error_code::write_failed;
    }
    kind = entry_kind::file;
    ++n_files;
    return tar_error_code::ok;
  }
  case '5': {
    // attributes are applied at finish and would follow the link
    if (is_existing_symlink(path)) {
      lgr.error("tar: directory entry {} is an existing symlink", name);
      return tar_error_code::unsafe_path;
    }
    fs::create_directories(path, ec);
    if (ec) {
      lgr.error("tar: cannot create directory {}: {}", path.string(), ec);
      return tar_error_code::write_failed;
    }
    dir_attrs.emplace_back(path, entry_mode, entry_mtime);
    ++n_dirs;
    return tar_error_code::ok;
  }
  case '2': {
    fs::create_directories(path.parent_path(), ec);
    if (!ec)
      fs::remove(path, ec);
    if (!ec)
      fs::create_symlink(link, path, ec);
    if (ec) {
      lgr.error("tar: cannot create symlink {} -> {}: {}", path.string(), link,
                ec);
      return tar_error_code::write_failed;
    }
    lgr.debug("tar: symlink {} -> {}", name, link);
    ++n_links;
    return tar_error_code::ok;
  }
  case '1': {
    const auto target = safe_path(link, ec);
    if (ec)
      return ec;
    // the copy fallback would follow the link
    if (is_existing_symlink(target)) {
      lgr.error("tar: hard link {} targets symlink {}", name, link);
      return tar_error_code::unsafe_path;
    }
    fs::create_directories(path.parent_path(), ec);
    if (!ec)
      fs::remove(path, ec);
    if (!ec) {
      fs::create_hard_link(target, path, ec);
      if (ec) {
        lgr.debug("tar: hard link {} failed ({}), copying", name, ec);
        ec.clear();
        fs::copy_file(target, path, fs::copy_options::overwrite_existing, ec);
      }
    }
    if (ec) {
      lgr.error("tar: cannot link {} to {}: {}", path.string(),
                target.string(), ec);
      return tar_error_code::write_failed;
    }
    lgr.debug("tar: hard link {} -> {}", name, link);
    ++n_links;
    return tar_error_code::ok;
  }
  }
  lgr.debug("tar: skipping {} with entry type '{}'", name, type);
  ++n_skipped;
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::consume(const char *data,
                       const std::size_t size) -> std::error_code {
  switch (kind) {
  case entry_kind::file:
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
      logger::instance().error("tar: write failed for {}",
                               entry_path.string());
      return tar_error_code::write_failed;
    }
    bytes_written += size;
    break;
  case entry_kind::meta:
    if (std::size(meta) + size > max_meta_size) {
      logger::instance().error("tar: extended header too large");
      return tar_error_code::bad_header;
    }
    meta.append(data, size);
    break;
  case entry_kind::skip:
    break;
  }
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::end_entry() -> std::error_code {
  auto &lgr = logger::instance();
  const auto k = kind;
  kind = entry_kind::skip;
  switch (k) {
  case entry_kind::file: {
    out.close();
    if (!out) {
      lgr.error("tar: failed closing {}", entry_path.string());
      return tar_error_code::write_failed;
    }
    std::error_code ec;
    fs::permissions(entry_path, static_cast<fs::perms>(entry_mode), ec);
    if (ec)
      lgr.debug("tar: cannot set mode of {}: {}", entry_path.string(), ec);
    fs::last_write_time(entry_path, to_file_time(entry_mtime), ec);
    if (ec)
      lgr.debug("tar: cannot set mtime of {}: {}", entry_path.string(), ec);
    break;
  }
  case entry_kind::meta:
    // names are NUL terminated inside the data
    if (entry_type == 'L')
      next_path = std::string(meta.c_str());
    else if (entry_type == 'K')
      next_link = std::string(meta.c_str());
    else if (entry_type == 'x')
      return parse_pax(meta);
    break;
  case entry_kind::skip:
    break;
  }
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::parse_pax(const std::string &records) -> std::error_code {
  auto &lgr = logger::instance();
  // each record: "<length> <key>=<value>\n", length counting everything
  std::size_t pos{};
  while (pos < std::size(records)) {
    const auto space = records.find(' ', pos);
    if (space == std::string::npos)
      return tar_error_code::bad_header;
    std::size_t len{};
    const auto [ptr, ec] =
      std::from_chars(records.data() + pos, records.data() + space, len);
    if (ec != std::errc{} || ptr != records.data() + space ||
        len < space - pos + 3 || pos + len > std::size(records) ||
        records[pos + len - 1] != '\n') {
      lgr.error("tar: malformed pax record");
      return tar_error_code::bad_header;
    }
    const auto record =
      std::string_view(records).substr(space + 1, pos + len - space - 2);
    const auto eq = record.find('=');
    if (eq == std::string_view::npos)
      return tar_error_code::bad_header;
    const auto key = record.substr(0, eq);
    const auto value = record.substr(eq + 1);
    if (key == "path")
      next_path = std::string(value);
    else if (key == "linkpath")
      next_link = std::string(value);
    else if (key == "size") {
      std::uint64_t size{};
      const auto [size_ptr, size_ec] =
        std::from_chars(value.data(), value.data() + std::size(value), size);
      if (size_ec != std::errc{} || size_ptr != value.data() + std::size(value))
        return tar_error_code::bad_header;
      next_size = size;
    }
    pos += len;
  }
  return tar_error_code::ok;
}

[[nodiscard]] auto
tar_extractor::finish() -> std::error_code {
  auto &lgr = logger::instance();
  if (state == state_t::data || state == state_t::padding || block_fill != 0) {
    lgr.error("tar: archive ends inside an entry ({} bytes missing)",
              remaining + padding);
    return tar_error_code::truncated_archive;
  }
  if (state != state_t::end_of_archive)
    lgr.debug("tar: archive has no end-of-archive marker");

  // deepest first so parents stay writable until their children are done
  for (const auto &[path, mode, mtime] : std::views::reverse(dir_attrs)) {
    std::error_code ec;
    fs::last_write_time(path, to_file_time(mtime), ec);
    if (ec)
      lgr.debug("tar: cannot set mtime of {}: {}", path.string(), ec);
    fs::permissions(path, static_cast<fs::perms>(mode), ec);
    if (ec)
      lgr.debug("tar: cannot set mode of {}: {}", path.string(), ec);
  }
  dir_attrs.clear();
  lgr.debug("tar: {} entries, {} files, {} directories, {} links, {} skipped, "
            "{} bytes",
            n_entries, n_files, n_dirs, n_links, n_skipped, bytes_written);
  return tar_error_code::ok;
}

}  // namespace vnr
