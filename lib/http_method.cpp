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

#include "http_method.hpp"

#include "request_error_code.hpp"
#include "utilities.hpp"

#include <format>
#include <iostream>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>    // for std::get (iywu fp)
#include <utility>  // for std::to_underlying

namespace webapi {

[[nodiscard]] auto
to_string(const http_method m) -> std::string {
  // NOLINTNEXTLINE(*-array-index)
  return std::string(http_method_name[std::to_underlying(m)]);
}

[[nodiscard]] auto
parse_http_method(const std::string_view s,
                  std::error_code &error) noexcept -> http_method {
  for (const auto [idx, name] : std::views::enumerate(http_method_name))
    if (iequals(s, name))
      return static_cast<http_method>(idx);
  error = request_error_code::unsupported_method;
  return http_method::get;
}

auto
operator<<(std::ostream &o, const http_method &m) -> std::ostream & {
  // NOLINTNEXTLINE(*-array-index)
  return o << http_method_name[std::to_underlying(m)];
}

auto
operator>>(std::istream &in, http_method &m) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  std::error_code error;
  const auto parsed = parse_http_method(tmp, error);
  if (error) {
    in.setstate(std::ios::failbit);
    return in;
  }
  m = parsed;
  return in;
}

}  // namespace webapi

auto
std::formatter<webapi::http_method>::format(
  const webapi::http_method &m,
  std::format_context &ctx) const -> std::format_context::iterator {
  return std::format_to(
    ctx.out(), "{}",
    // NOLINTNEXTLINE(*-array-index)
    webapi::http_method_name[std::to_underlying(m)]);
};
