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

#include "config_file_utils.hpp"

#include "utilities.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <variant>
#include <vector>

namespace webapi {

[[nodiscard]] auto
split_equals(const std::string &line, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string> {
  const auto key_ok = [](const unsigned char x) { return std::isgraph(x); };
  static constexpr auto delim = '=';
  const auto eq_pos = line.find(delim);
  if (eq_pos >= std::size(line)) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {std::string{}, std::string{}};
  }
  const std::string key{rlstrip(line.substr(0, eq_pos))};
  if (!std::ranges::all_of(key, key_ok)) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {std::string{}, std::string{}};
  }
  const std::string value{rlstrip(line.substr(eq_pos + 1))};
  if (std::size(key) == 0 || std::size(value) == 0) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {std::string{}, std::string{}};
  }
  return {key, value};
}

[[nodiscard]] auto
quote_value(const std::string_view value) -> std::string {
  std::string r{'"'};
  for (const auto c : value) {
    switch (c) {
    case '"':
      r += "\\\"";
      break;
    case '\\':
      r += "\\\\";
      break;
    case '\n':
      r += "\\n";
      break;
    case '\r':
      r += "\\r";
      break;
    case '\t':
      r += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        r += std::format("\\u{:04X}", static_cast<unsigned>(c));
      else
        r += c;
    }
  }
  r += '"';
  return r;
}

[[nodiscard]] auto
unquote_value(const std::string &value, std::error_code &error) noexcept
  -> std::string {
  if (value.empty() || value[0] != '"') {
    // bare value: cut any comment
    return rlstrip(value.substr(0, value.find('#')));
  }

  std::string r;
  auto itr = std::cbegin(value) + 1;
  for (; itr != std::cend(value) && *itr != '"'; ++itr) {
    if (*itr != '\\') {
      r += *itr;
      continue;
    }
    if (++itr == std::cend(value))
      break;
    switch (*itr) {
    case '"':
      r += '"';
      break;
    case '\\':
      r += '\\';
      break;
    case 'n':
      r += '\n';
      break;
    case 'r':
      r += '\r';
      break;
    case 't':
      r += '\t';
      break;
    case 'u': {
      static constexpr auto n_hex = 4;
      if (std::distance(itr, std::cend(value)) <= n_hex) {
        error = std::make_error_code(std::errc::invalid_argument);
        return {};
      }
      const std::string hex(itr + 1, itr + 1 + n_hex);
      unsigned code{};
      for (const auto h : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(h))) {
          error = std::make_error_code(std::errc::invalid_argument);
          return {};
        }
        code = code * 16 + static_cast<unsigned>(
                             std::isdigit(static_cast<unsigned char>(h))
                               ? h - '0'
                               : std::tolower(h) - 'a' + 10);
      }
      // only the control characters written by quote_value
      if (code >= 0x80) {
        error = std::make_error_code(std::errc::invalid_argument);
        return {};
      }
      r += static_cast<char>(code);
      itr += n_hex;
      break;
    }
    default:
      error = std::make_error_code(std::errc::invalid_argument);
      return {};
    }
  }
  if (itr == std::cend(value)) {
    // no closing quote
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }
  const auto rest = rlstrip(std::string(itr + 1, std::cend(value)));
  if (!rest.empty() && rest[0] != '#') {
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }
  return r;
}

[[nodiscard]] auto
parse_config_file_as_key_val(const std::string &filename,
                             std::error_code &error) noexcept
  -> std::vector<std::tuple<std::string, std::string>> {
  std::ifstream in(filename);
  if (!in) {
    error = std::make_error_code(std::errc(errno));
    return {};
  }

  std::vector<std::tuple<std::string, std::string>> key_val;
  std::string line;
  while (getline(in, line)) {
    line = rlstrip(line);
    // ignore empty lines and those beginning with '#'
    if (!line.empty() && line[0] != '#') {
      const auto [k, v] = split_equals(line, error);
      if (error)
        return {};
      auto value = unquote_value(v, error);
      if (error)
        return {};
      key_val.emplace_back(k, std::move(value));
    }
  }
  return key_val;
}

}  // namespace webapi
