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

#ifndef LIB_INCLUDE_CONFIG_FILE_UTILS_HPP_
#define LIB_INCLUDE_CONFIG_FILE_UTILS_HPP_

/*
  Key/value files in the TOML subset used for persisted credentials:

    host = "www.example.com"
    port = 9999
    access_token = "..."

  Strings are basic TOML strings (double quoted, backslash escapes), other
  scalars are bare. Lines starting with '#' are comments.
 */

#include <boost/describe.hpp>
#include <boost/mp11/algorithm.hpp>  // for mp_for_each

#include <algorithm>  // for std::ranges::find
#include <cerrno>
#include <format>
#include <fstream>
#include <print>
#include <ranges>  // IWYU pragma: keep
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>  // for std::remove_cvref_t
#include <variant>      // for std::tuple
#include <vector>

namespace webapi {

/// Values are returned with quotes removed and escapes resolved
[[nodiscard]] auto
parse_config_file_as_key_val(const std::string &filename,
                             std::error_code &error) noexcept
  -> std::vector<std::tuple<std::string, std::string>>;

[[nodiscard]] auto
split_equals(const std::string &line, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string>;

/// Double quote a value, escaping backslash, quote and control characters
[[nodiscard]] auto
quote_value(const std::string_view value) -> std::string;

/// Inverse of quote_value; bare values are returned trimmed and without any
/// trailing comment
[[nodiscard]] auto
unquote_value(const std::string &value, std::error_code &error) noexcept
  -> std::string;

template <typename T>
[[nodiscard]] inline auto
format_config_value(const T &value) -> std::string {
  if constexpr (std::is_convertible_v<T, std::string_view>)
    return quote_value(value);
  else
    return std::format("{}", value);
}

[[nodiscard]] inline auto
format_as_config(const auto &t) -> std::string {
  using T = std::remove_cvref_t<decltype(t)>;
  using members =
    boost::describe::describe_members<T, boost::describe::mod_any_access |
                                           boost::describe::mod_inherited>;
  std::string r;
  boost::mp11::mp_for_each<members>([&](const auto &member) {
    r += std::format("{} = {}\n", member.name,
                     format_config_value(t.*member.pointer));
  });
  return r;
}

template <typename T>
inline auto
assign_member_impl(T &t, const std::string &value) -> std::error_code {
  if constexpr (std::is_same_v<T, std::string>) {
    t = value;
    return {};
  }
  else {
    std::istringstream is(value);
    T tmp{};
    // the whole value has to be consumed
    if (!(is >> tmp) || !(is >> std::ws).eof())
      return std::make_error_code(std::errc::invalid_argument);
    t = tmp;
    return {};
  }
}

/// Assign to the described member named `name`; returns true if such a
/// member exists
inline auto
assign_member(auto &t, const std::string_view name, const std::string &value,
              std::error_code &error) -> bool {
  namespace bd = boost::describe;
  using T = std::remove_cvref_t<decltype(t)>;
  using Md = bd::describe_members<T, bd::mod_any_access | bd::mod_inherited>;
  bool found{false};
  boost::mp11::mp_for_each<Md>([&](const auto &D) {
    if (!error && name == D.name) {
      found = true;
      error = assign_member_impl(t.*D.pointer, value);
    }
  });
  return found;
}

/// Assign each key in the file to the matching member of `t` and return the
/// names of the members that the file did not provide. Unknown keys are
/// ignored.
[[nodiscard]] inline auto
parse_config_file(auto &t, const std::string &filename,
                  std::error_code &error) -> std::vector<std::string> {
  namespace bd = boost::describe;
  using T = std::remove_cvref_t<decltype(t)>;
  using Md = bd::describe_members<T, bd::mod_any_access | bd::mod_inherited>;

  const auto key_vals = parse_config_file_as_key_val(filename, error);
  if (error)
    return {};

  std::vector<std::string> assigned;
  for (const auto &[key, val] : key_vals) {
    if (assign_member(t, key, val, error))
      assigned.push_back(key);
    if (error)
      return {};
  }

  std::vector<std::string> missing;
  boost::mp11::mp_for_each<Md>([&](const auto &D) {
    if (std::ranges::find(assigned, std::string_view{D.name}) ==
        std::cend(assigned))
      missing.emplace_back(D.name);
  });
  return missing;
}

[[nodiscard]] inline auto
write_config_file(const auto &obj,
                  const std::string &config_file) -> std::error_code {
  std::ofstream out(config_file);
  if (!out)
    return std::make_error_code(std::errc(errno));
  std::print(out, "{}", format_as_config(obj));
  if (!out)
    return std::make_error_code(std::errc(errno));
  return std::error_code{};
}

}  // namespace webapi

#endif  // LIB_INCLUDE_CONFIG_FILE_UTILS_HPP_
