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

#include "http_header.hpp"

#include "http_error_code.hpp"
#include "utilities.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <format>
#include <iterator>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>

namespace webapi {

using std::string_view_literals::operator""sv;

// split a string at the first colon
static inline auto
split_http_field(const std::string &s) -> std::tuple<std::string, std::string> {
  const auto colon = s.find(':');
  if (colon == std::string::npos)
    return {{}, {}};
  return {rlstrip(s.substr(0, colon)), rlstrip(s.substr(colon + 1))};
}

[[nodiscard]] auto
is_valid_header_field(const std::string_view name,
                      const std::string_view value) noexcept -> bool {
  // token characters from RFC 9110 section 5.6.2
  static constexpr auto token_punct = "!#$%&'*+-.^_`|~"sv;
  const auto is_token_char = [](const unsigned char c) {
    return std::isalnum(c) || token_punct.find(c) != std::string_view::npos;
  };
  const auto is_ctl = [](const unsigned char c) {
    return (c < 0x20 && c != '\t') || c == 0x7f;
  };
  return !name.empty() && std::ranges::all_of(name, is_token_char) &&
         std::ranges::none_of(value, is_ctl);
}

static inline auto
is_status_line(const std::string &line) -> bool {
  constexpr auto http_tag = "HTTP/"sv;
  return line.starts_with(http_tag);
}

static inline auto
parse_status_line(const std::string &line, std::string &status_line,
                  int &status_code, std::string &reason) {
  constexpr auto status_code_size = 3u;

  status_line = line;
  std::istringstream iss(line);
  std::string version;
  std::string code;
  if (!(iss >> version >> code) || std::size(code) != status_code_size ||
      !std::ranges::all_of(code, [](const unsigned char c) {
        return std::isdigit(c);
      }))
    return;
  status_code = std::atoi(code.data());
  std::string rest;
  std::getline(iss, rest);
  reason = rlstrip(rest);
}

[[nodiscard]] auto
find_header(const http_headers &headers,
            const std::string_view name) -> std::optional<std::string> {
  const auto itr = std::ranges::find_if(headers, [&](const auto &h) {
    return iequals(std::get<0>(h), name);
  });
  if (itr == std::cend(headers))
    return std::nullopt;
  return std::get<1>(*itr);
}

auto
set_header(http_headers &headers, const std::string &name,
           const std::string &value) -> void {
  const auto itr = std::ranges::find_if(headers, [&](const auto &h) {
    return iequals(std::get<0>(h), name);
  });
  if (itr == std::end(headers))
    headers.emplace_back(name, value);
  else
    std::get<1>(*itr) = value;
}

http_header::http_header(const std::string &header_block) {
  const auto unview = [](const auto r) {
    return std::string(std::cbegin(r), std::cend(r));
  };
  for (const auto &line_view : header_block | std::views::split('\n')) {
    auto line = unview(line_view);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;
    if (status_line.empty() && is_status_line(line)) {
      parse_status_line(line, status_line, status_code, reason);
      continue;
    }

    const auto [field_name, field_value] = split_http_field(line);
    if (field_name.empty())
      continue;
    fields.emplace_back(field_name, field_value);

    if (iequals(field_name, "content-length")) {
      std::size_t content_length_tmp{};
      const auto last = field_value.data() + std::size(field_value);
      const auto [ptr, ec] =
        std::from_chars(field_value.data(), last, content_length_tmp);
      if (ec == std::errc{} && ptr == last) {
        content_length = content_length_tmp;
        has_content_length = true;
      }
    }
    if (iequals(field_name, "transfer-encoding") &&
        to_lower(field_value).find("chunked") != std::string::npos)
      chunked = true;
  }
}

[[nodiscard]] auto
http_header::tostring() const -> std::string {
  std::string r = status_line;
  for (const auto &[name, value] : fields)
    r += std::format("\n{}: {}", name, value);
  return r;
}

[[nodiscard]] auto
decode_chunked(const std::string &data,
               std::error_code &error) noexcept -> std::string {
  static constexpr auto crlf = "\r\n";
  static constexpr auto hex_base = 16;
  std::string body;
  std::size_t pos{};
  while (true) {
    const auto line_end = data.find(crlf, pos);
    if (line_end == std::string::npos) {
      error = http_error_code::malformed_chunked_body;
      return {};
    }
    // chunk extensions follow a ';'
    const auto size_end = std::min(data.find(';', pos), line_end);
    std::size_t chunk_size{};
    const auto first = data.data() + pos;
    const auto last = data.data() + size_end;
    const auto [ptr, ec] = std::from_chars(first, last, chunk_size, hex_base);
    // the size must be all hex digits up to any extension
    if (ec != std::errc{} || ptr == first || ptr != last) {
      error = http_error_code::malformed_chunked_body;
      return {};
    }
    pos = line_end + 2;
    if (chunk_size == 0)
      break;  // trailers, if any, are not kept
    if (pos + 2 > std::size(data) || chunk_size > std::size(data) - pos - 2) {
      error = http_error_code::malformed_chunked_body;
      return {};
    }
    body.append(data, pos, chunk_size);
    pos += chunk_size;
    if (data.compare(pos, 2, crlf) != 0) {
      error = http_error_code::malformed_chunked_body;
      return {};
    }
    pos += 2;
  }
  return body;
}

}  // namespace webapi
