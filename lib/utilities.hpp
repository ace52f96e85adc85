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

#ifndef LIB_UTILITIES_HPP_
#define LIB_UTILITIES_HPP_

/*
  Functions declared here are used by multiple source files
 */

#include <algorithm>  // IWYU pragma: keep
#include <cctype>     // for std::toupper, std::tolower
#include <iterator>   // for std::size
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <variant>  // for std::tuple
#include <vector>

namespace webapi {

[[nodiscard]] inline auto
rstrip(const char *const x) -> const std::string_view {
  const std::string s{x};
  const auto start = s.find_first_not_of("\n\r");
  return std::string_view(x + start, x + std::size(s));
}

/// Trim ASCII whitespace only; bytes of multi-byte characters are kept
[[nodiscard]] inline auto
rlstrip(const std::string &s) noexcept -> std::string {
  static constexpr auto whitespace = " \t\r\n\f\v";
  const auto start = s.find_first_not_of(whitespace);
  if (start == std::string::npos)
    return {};
  const auto stop = s.find_last_not_of(whitespace);
  return s.substr(start, stop - start + 1);
}

[[nodiscard]] inline auto
to_upper(std::string s) -> std::string {
  std::ranges::transform(s, std::begin(s), [](const unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

[[nodiscard]] inline auto
to_lower(std::string s) -> std::string {
  std::ranges::transform(s, std::begin(s), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

[[nodiscard]] inline auto
iequals(const std::string_view a, const std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](const unsigned char x,
                                     const unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

[[nodiscard]] inline auto
join_with(const std::vector<std::string> &v, const char c) -> std::string {
  std::string r;
  for (const auto &s : v) {
    if (!r.empty())
      r += c;
    r += s;
  }
  return r;
}

/// Split "Key: Value" at the first colon and trim both parts; a line
/// without a colon is an error.
[[nodiscard]] auto
split_key_value(const std::string &item, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string>;

/// A string starting with '@' names a file whose contents are returned;
/// any other string is returned as given.
[[nodiscard]] auto
read_file_if_starts_with_at(const std::string &text,
                            std::error_code &error) noexcept -> std::string;

}  // namespace webapi

#endif  // LIB_UTILITIES_HPP_
