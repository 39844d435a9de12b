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

#ifndef CLI_ARGUMENTS_HPP_
#define CLI_ARGUMENTS_HPP_

#include <config.h>  // for VERSION

#include <boost/program_options.hpp>

#include <fmt/core.h>

#include <cstdint>  // for std::uint8_t
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

enum class argument_error_code : std::uint8_t {
  ok = 0,
  help_requested = 1,
  failure = 2,
};

template <>
struct std::is_error_code_enum<argument_error_code> : public std::true_type {};

struct argument_error_code_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "argument_error_code";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "help requested"s;
    case 2: return "failure parsing options"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(argument_error_code e) -> std::error_code {
  static auto category = argument_error_code_category{};
  return std::error_code(std::to_underlying(e), category);
}

/// Options come in three groups: cli-only (help, version, config file),
/// common (command line or config file) and positional. The derived type
/// T supplies each group and the default config file location.
template <typename T> struct argset_base {
  std::string config_file{};

  [[nodiscard]] static auto
  get_default_config_file() -> std::string {
    return T::get_default_config_file_impl();
  }

  [[nodiscard]] static auto
  get_default_config_dir() -> std::string {
    return T::get_default_config_dir_impl();
  }

  [[nodiscard]] auto
  parse(const int argc, char const *const argv[], const std::string &usage,
        const std::string &about_msg,
        const std::string &description_msg) -> std::error_code {
    namespace po = boost::program_options;
    const auto cli_only_opts = self().set_cli_only_opts_impl();
    const auto common_opts = self().set_common_opts_impl();
    const auto positional_opts = self().set_positional_opts_impl();
    po::positional_options_description positional;
    self().set_positional_impl(positional);

    const auto print_help = [&] {
      fmt::print("{}\n{}\n", about_msg, usage);
      std::cout << cli_only_opts << '\n' << common_opts << '\n';
      fmt::print("{}\n", description_msg);
    };

    try {
      // help, version and the config file are looked at before anything
      // else so a bad or missing positional doesn't hide them
      po::variables_map vm_cli_only;
      po::store(po::command_line_parser(argc, argv)
                  .options(cli_only_opts)
                  .allow_unregistered()
                  .run(),
                vm_cli_only);
      if (vm_cli_only.count("help")) {
        print_help();
        return argument_error_code::help_requested;
      }
      if (vm_cli_only.count("version")) {
        fmt::print("{}\n", VERSION);
        return argument_error_code::help_requested;
      }
      if (argc == 1) {
        print_help();
        return argument_error_code::failure;
      }
      po::notify(vm_cli_only);

      // cli-only options are listed again so their values are not taken
      // as positionals
      po::options_description all_opts;
      all_opts.add(cli_only_opts).add(common_opts).add(positional_opts);
      po::variables_map vm;
      po::store(po::command_line_parser(argc, argv)
                  .options(all_opts)
                  .positional(positional)
                  .run(),
                vm);

      // values already stored from the command line take precedence
      if (use_config_file(vm_cli_only["config-file"].defaulted()))
        po::store(po::parse_config_file(config_file.data(), common_opts, true),
                  vm);
      po::notify(vm);
    }
    catch (po::error &e) {
      fmt::print(stderr, "{}\n", e.what());
      print_help();
      return argument_error_code::failure;
    }
    return argument_error_code::ok;
  }

  auto
  log_options() const {
    self().log_options_impl();
  }

private:
  /// An explicitly named config file must be readable; the default one
  /// is used only if it exists
  [[nodiscard]] auto
  use_config_file(const bool defaulted) const -> bool {
    if (config_file.empty())
      return false;
    if (!defaulted)
      return true;
    std::error_code ec;
    return std::filesystem::exists(config_file, ec);
  }

  [[nodiscard]] auto
  self() -> T & {
    return static_cast<T &>(*this);
  }

  [[nodiscard]] auto
  self() const -> const T & {
    return static_cast<const T &>(*this);
  }
};

#endif  // CLI_ARGUMENTS_HPP_
