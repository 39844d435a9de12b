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

#include "fetch.hpp"

#include "http_client.hpp"
#include "http_error_code.hpp"
#include "http_header.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include "tar_extractor.hpp"
#include "transfer_progress.hpp"
#include "url.hpp"
#include "zlib_adapter.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace vnr {

namespace fs = std::filesystem;

[[nodiscard]] static inline auto
ms_since(const std::chrono::steady_clock::time_point t)
  -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - t);
}

[[nodiscard]] static inline auto
is_gzip_name(const std::string_view file_name) -> bool {
  return file_name.ends_with(".gz") || file_name.ends_with(".tgz");
}

[[nodiscard]] auto
fetch_result::summary() const
  -> std::vector<std::tuple<std::string, std::string>> {
  // clang-format off
  std::vector<std::tuple<std::string, std::string>> s{
    {"output file", output_file.string()},
    {"extraction dir", extraction_dir.empty() ? "(none)" : extraction_dir.string()},
    {"effective url", effective_url},
    {"status", std::to_string(status)},
    {"redirects", std::to_string(std::size(redirects))},
    {"content length", std::to_string(content_length)},
    {"accepts ranges", accepts_ranges ? "true" : "false"},
    {"uncompressed size (isize)", isize ? std::to_string(*isize) : "unknown"},
    {"bytes downloaded", std::to_string(bytes_downloaded)},
    {"bytes uncompressed", std::to_string(bytes_uncompressed)},
    {"tar entries", fmt::format("{} ({} files, {} dirs, {} links)", n_entries, n_files, n_dirs, n_links)},
    {"connections", session.str()},
    {"reads", reads.str()},
    {"time to first byte", fmt::format("{}ms", time_to_first_byte.count())},
    {"total time", fmt::format("{}ms", total_time.count())},
  };
  // clang-format on
  return s;
}

[[nodiscard]] auto
output_file_path(const fetch_request &request,
                 std::error_code &ec) -> std::filesystem::path {
  const auto u = parse_url(request.url, ec);
  if (ec)
    return {};
  const auto file_name = file_name_from_url(u, ec);
  if (ec)
    return {};
  const fs::path outdir{request.outdir};
  std::error_code status_ec;
  if (outdir.empty() || !fs::is_directory(outdir, status_ec)) {
    ec = fetch_error_code::not_a_directory;
    return {};
  }
  return outdir / file_name;
}

/// Ranged request for the gzip trailer giving the uncompressed size
[[nodiscard]] static auto
fetch_isize(http_client &client, const url &u, const std::uint64_t length,
            std::error_code &ec) -> std::uint32_t {
  static constexpr auto isize_bytes = 4u;
  auto &lgr = logger::instance();
  if (length < isize_bytes) {
    ec = http_error_code::unexpected_content_length;
    return 0;
  }
  lgr.debug("Requesting gzip trailer: bytes {}-{}", length - isize_bytes,
            length - 1);
  auto response = client.get(u, ec, byte_range{length - isize_bytes, length - 1});
  if (ec)
    return 0;

  const auto &header = response->header();
  lgr.debug("Uncompressed size status: {}", header.status_line);
  if (!header.is_success()) {
    response->finish();
    ec = http_error_code::bad_status;
    return 0;
  }
  // a server ignoring Range sends the whole body; don't read it
  if (header.content_length != isize_bytes) {
    lgr.warning("Unexpected content length for ranged request: {}",
                header.content_length ? std::to_string(*header.content_length)
                                      : "none");
    response->finish();
    ec = http_error_code::unexpected_content_length;
    return 0;
  }
  if (!header.content_range.empty())
    lgr.debug("Content range: {}", header.content_range);

  std::array<std::uint8_t, isize_bytes> bytes{};
  std::size_t n_read{};
  while (n_read < isize_bytes && !response->is_done()) {
    const auto n =
      response->read_some(reinterpret_cast<char *>(bytes.data()) + n_read,
                          isize_bytes - n_read, ec);
    if (ec)
      return 0;
    if (n == 0)
      break;
    n_read += n;
  }
  response->finish();
  if (n_read != isize_bytes) {
    ec = fetch_error_code::truncated_body;
    return 0;
  }
  return isize_from_bytes(bytes);
}

[[nodiscard]] static auto
run_fetch(http_session &session, const url &u, const fetch_request &request,
          const std::chrono::steady_clock::time_point t_start,
          fetch_result &result) -> std::error_code {
  static constexpr auto buf_size = 64 * 1024;
  auto &lgr = logger::instance();

  http_client client(session);
  std::error_code ec;
  auto response = client.get(u, ec);
  if (ec)
    return ec;
  result.time_to_first_byte = ms_since(t_start);

  const auto &header = response->header();
  result.status = header.status;
  result.effective_url = response->effective_url().str();
  result.redirects = response->redirects();
  lgr.debug("Status: {}", header.status_line);
  if (!header.is_success()) {
    lgr.error("HTTP error: {}", header.status_line);
    response->finish();
    return http_error_code::bad_status;
  }
  if (!header.content_length) {
    lgr.error("Missing header: content-length");
    response->finish();
    return http_error_code::missing_content_length;
  }
  result.content_length = *header.content_length;
  lgr.debug("Compressed size: {}", result.content_length);

  result.accepts_ranges = header.accepts_byte_ranges();
  if (result.accepts_ranges)
    lgr.debug("Server accepts byte ranges");
  else
    lgr.debug("Server does not advertise byte ranges (accept-ranges: {})",
              header.accept_ranges.empty() ? "absent" : header.accept_ranges);

  const auto file_name = result.output_file.filename().string();
  const bool gzipped = is_gzip_name(file_name);
  const bool extract = request.extract && is_gzip_tarball_name(file_name);

  if (gzipped) {
    std::error_code isize_ec;
    const auto isize = fetch_isize(client, response->effective_url(),
                                   result.content_length, isize_ec);
    if (isize_ec == http_error_code::interrupted)
      return isize_ec;
    if (isize_ec)
      lgr.warning("Could not determine uncompressed size: {}", isize_ec);
    else {
      result.isize = isize;
      lgr.debug("Uncompressed size: {}", isize);
    }
  }

  std::ofstream out(result.output_file, std::ios::binary);
  if (!out) {
    lgr.error("Failed to open {}: {}", result.output_file.string(),
              std::make_error_code(std::errc(errno)));
    return fetch_error_code::output_file_failed;
  }

  std::optional<gzip_inflater> inflater;
  std::optional<tar_extractor> tar;
  if (extract) {
    result.extraction_dir =
      result.output_file.parent_path() / extraction_dir_name(file_name);
    lgr.debug("Extracting to {}", result.extraction_dir.string());
    inflater.emplace(ec);
    if (ec)
      return ec;
    tar.emplace(result.extraction_dir);
  }

  // progress is against the uncompressed size while extracting
  const auto expected =
    extract ? (result.isize ? std::optional<std::uint64_t>(*result.isize)
                            : std::nullopt)
            : std::optional<std::uint64_t>(result.content_length);
  transfer_progress progress(expected);

  std::vector<char> buf(buf_size);
  while (!response->is_done()) {
    const auto n = response->read_some(buf.data(), buf_size, ec);
    if (ec)
      return ec;
    if (n == 0)
      break;
    result.reads.update(n);
    out.write(buf.data(), static_cast<std::streamsize>(n));
    if (!out) {
      lgr.error("Failed writing {}", result.output_file.string());
      return fetch_error_code::output_file_failed;
    }
    result.bytes_downloaded += n;
    if (inflater) {
      ec = inflater->inflate(
        buf.data(), n,
        [&](const char *data, const std::size_t size) -> std::error_code {
          progress.update(size);
          return tar->write(data, size);
        });
      if (ec) {
        lgr.error("Extraction failed after {} compressed bytes: {}",
                  result.bytes_downloaded, ec);
        return ec;
      }
    }
    else
      progress.update(n);
  }
  const bool body_done = response->is_done();
  response->finish();
  out.close();
  if (!out) {
    lgr.error("Failed closing {}", result.output_file.string());
    return fetch_error_code::output_file_failed;
  }
  lgr.debug("Reads: {}", result.reads.str());
  if (!body_done || result.bytes_downloaded != result.content_length) {
    lgr.error("Received {} of {} bytes", result.bytes_downloaded,
              result.content_length);
    return fetch_error_code::truncated_body;
  }

  if (inflater) {
    if (!inflater->is_done()) {
      lgr.error("gzip stream ended early after {} bytes",
                inflater->total_out());
      return zlib_adapter_error_code::truncated_stream;
    }
    result.bytes_uncompressed = inflater->total_out();
    if (inflater->members() > 1)
      lgr.debug("gzip members: {}", inflater->members());
    ec = tar->finish();
    if (ec)
      return ec;
    result.n_entries = tar->n_entries;
    result.n_files = tar->n_files;
    result.n_dirs = tar->n_dirs;
    result.n_links = tar->n_links;
  }

  if (gzipped) {
    std::error_code disk_ec;
    const auto disk_isize = load_isize(result.output_file, disk_ec);
    if (disk_ec)
      lgr.warning("Could not read uncompressed size from {}: {}",
                  result.output_file.string(), disk_ec);
    else {
      lgr.debug("Uncompressed size from file: {}", disk_isize);
      if (result.isize && *result.isize != disk_isize)
        lgr.warning("Uncompressed size mismatch: ranged request {}, file {}",
                    *result.isize, disk_isize);
    }
  }
  return {};
}

[[nodiscard]] auto
fetch(const fetch_request &request)
  -> std::tuple<fetch_result, std::error_code> {
  auto &lgr = logger::instance();
  fetch_result result;

  std::error_code ec;
  const auto u = parse_url(request.url, ec);
  if (ec) {
    lgr.error("Bad url {}: {}", request.url, ec);
    return {result, ec};
  }
  result.output_file = output_file_path(request, ec);
  if (ec) {
    lgr.error("Bad destination {}: {}", request.outdir, ec);
    return {result, ec};
  }

  const auto t_start = std::chrono::steady_clock::now();
  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  http_session *active{nullptr};
  bool interrupted{false};
  signals.async_wait(
    [&](const boost::system::error_code &sig_ec, const int signo) {
      if (sig_ec)
        return;
      lgr.warning("Received signal {}, cancelling", signo);
      interrupted = true;
      if (active != nullptr)
        active->cancel();
    });

  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    http_session session(ioc, request.config, yield, ec);
    if (!ec) {
      active = &session;
      ec = run_fetch(session, u, request, t_start, result);
      session.shutdown_all();
      result.session = session.get_stats();
      active = nullptr;
    }
    signals.cancel();
  });
  ioc.run();

  result.total_time = ms_since(t_start);
  if (interrupted && ec)
    ec = http_error_code::interrupted;
  if (ec)
    lgr.error("Fetch failed: {}", ec);
  else
    log_args<log_level_t::info>(result.summary());
  return {result, ec};
}

}  // namespace vnr
