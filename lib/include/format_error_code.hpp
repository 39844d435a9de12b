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

#ifndef LIB_INCLUDE_FORMAT_ERROR_CODE_HPP_
#define LIB_INCLUDE_FORMAT_ERROR_CODE_HPP_

#include <boost/system/error_code.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <string_view>
#include <system_error>

template <>
struct fmt::formatter<std::error_code> : fmt::formatter<std::string_view> {
  auto
  format(const std::error_code &e, fmt::format_context &ctx) const {
    return fmt::format_to(ctx.out(), "{} ({}:{})", e.message(),
                          e.category().name(), e.value());
  }
};

template <>
struct fmt::formatter<boost::system::error_code>
  : fmt::formatter<std::string_view> {
  auto
  format(const boost::system::error_code &e, fmt::format_context &ctx) const {
    // asio and ssl errors are hard to tell apart by message alone
    return fmt::format_to(ctx.out(), "{} ({}:{})", e.message(),
                          e.category().name(), e.value());
  }
};

#endif  // LIB_INCLUDE_FORMAT_ERROR_CODE_HPP_
