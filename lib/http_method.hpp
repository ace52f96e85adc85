/* MIT License
 *
 * Copyright (c) 2025 Andrew D Smith
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

#ifndef LIB_HTTP_METHOD_HPP_
#define LIB_HTTP_METHOD_HPP_

#include <array>
#include <cstdint>
#include <format>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace webapi {

enum class http_method : std::uint8_t {
  get = 0,
  post = 1,
  put = 2,
  patch = 3,
  delete_ = 4,
};

using std::literals::string_view_literals::operator""sv;
static constexpr auto http_method_name = std::array{
  // clang-format off
  "GET"sv,
  "POST"sv,
  "PUT"sv,
  "PATCH"sv,
  "DELETE"sv,
  // clang-format on
};

static const std::map<std::string, http_method> http_method_cli11{
  // clang-format off
  {"GET", http_method::get},
  {"POST", http_method::post},
  {"PUT", http_method::put},
  {"PATCH", http_method::patch},
  {"DELETE", http_method::delete_},
  // clang-format on
};

[[nodiscard]] auto
to_string(const http_method m) -> std::string;

/// Case-insensitive; anything but the five verbs is
/// request_error_code::unsupported_method
[[nodiscard]] auto
parse_http_method(const std::string_view s,
                  std::error_code &error) noexcept -> http_method;

auto
operator<<(std::ostream &o, const http_method &m) -> std::ostream &;

auto
operator>>(std::istream &in, http_method &m) -> std::istream &;

}  // namespace webapi

template <>
struct std::formatter<webapi::http_method> : std::formatter<std::string> {
  auto
  format(const webapi::http_method &m,
         std::format_context &ctx) const -> std::format_context::iterator;
};

#endif  // LIB_HTTP_METHOD_HPP_
