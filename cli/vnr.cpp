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

/* vnr: trace the networking behind a download
 */

#include "vnr_argset.hpp"

#include "fetch.hpp"
#include "logger.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>    // for EXIT_FAILURE
#include <exception>  // for std::set_terminate
#include <fstream>
#include <memory>  // std::make_shared
#include <ostream>
#include <string>
#include <system_error>

int
main(int argc, char *argv[]) {  // NOLINT(*-c-arrays)
  static constexpr auto program = "vnr";
  static constexpr auto usage = "Usage: vnr <url> <output directory>";
  static constexpr auto about_msg =
    "vnr: download a url and trace DNS, TLS, redirects and connection reuse";
  static constexpr auto description_msg = R"(
Example:
vnr https://nodejs.org/dist/v20.0.0/node-v20.0.0-darwin-arm64.tar.gz ~/Desktop

A gzipped tarball is also extracted next to the downloaded file. The trace
goes to stderr unless a log file is given.
)";

  std::set_terminate([]() {
    fmt::print(stderr, "Terminating due to critical error\n");
    std::abort();
  });

  vnr_argset args;
  const auto arg_ec = args.parse(argc, argv, usage, about_msg, description_msg);
  if (arg_ec == argument_error_code::help_requested)
    return EXIT_SUCCESS;
  if (arg_ec)
    return EXIT_FAILURE;

  if (args.connect_timeout == 0 || args.read_timeout == 0) {
    fmt::print(stderr, "Timeouts must be positive\n{}\n", usage);
    return EXIT_FAILURE;
  }

  std::shared_ptr<std::ostream> log_file =
    args.log_file.empty()
      ? vnr::shared_from_cerr()
      : std::make_shared<std::ofstream>(args.log_file, std::ios::app);

  auto &lgr = vnr::logger::instance(log_file, program, args.log_level);
  if (!lgr) {
    fmt::print(stderr, "Failure initializing logging: {}.\n",
               lgr.get_status());
    return EXIT_FAILURE;
  }

  args.log_options();

  const auto request = args.to_fetch_request();
  std::error_code ec;
  const auto outfile = vnr::output_file_path(request, ec);
  if (ec) {
    lgr.error("{} ({} {})", ec, request.url, request.outdir);
    fmt::print(stderr, "{}\n{}\n", ec, usage);
    return EXIT_FAILURE;
  }
  fmt::print("Output file path: {}\n", outfile.string());
  std::fflush(stdout);

  const auto [result, error] = vnr::fetch(request);
  if (error) {
    fmt::print(stderr, "Error: {}\n", error);
    return EXIT_FAILURE;
  }
  if (!result.extraction_dir.empty())
    fmt::print("Extracted to: {}\n", result.extraction_dir.string());

  return EXIT_SUCCESS;
}
