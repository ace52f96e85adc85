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

#include "utilities.hpp"

#include "environment_utilities.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <tuple>

namespace webapi {

[[nodiscard]] auto
split_key_value(const std::string &item, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string> {
  static constexpr auto delim = ':';
  const auto colon_pos = item.find(delim);
  if (colon_pos == std::string::npos) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {std::string{}, std::string{}};
  }
  return {rlstrip(item.substr(0, colon_pos)),
          rlstrip(item.substr(colon_pos + 1))};
}

[[nodiscard]] auto
read_file_if_starts_with_at(const std::string &text,
                            std::error_code &error) noexcept -> std::string {
  if (text.empty() || text[0] != '@')
    return text;

  const auto filename = expand_user(text.substr(1));
  // a missing file shows up here as ENOENT
  const bool is_dir = std::filesystem::is_directory(filename, error);
  if (error)
    return {};
  if (is_dir) {
    error = std::make_error_code(std::errc::is_a_directory);
    return {};
  }

  std::ifstream in(filename);
  if (!in) {
    error = std::make_error_code(std::errc(errno));
    return {};
  }
  return std::string(std::istreambuf_iterator<char>(in), {});
}

}  // namespace webapi
