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

#ifndef LIB_HTTP_HEADER_HPP_
#define LIB_HTTP_HEADER_HPP_

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace webapi {

/// Header fields in the order they were given; names compare without case
using http_headers = std::vector<std::tuple<std::string, std::string>>;

[[nodiscard]] auto
find_header(const http_headers &headers,
            const std::string_view name) -> std::optional<std::string>;

/// Replace the value of an existing field (any case) or append a new one
auto
set_header(http_headers &headers, const std::string &name,
           const std::string &value) -> void;

/// Name is a non-empty token; the value has no control characters other
/// than tab, so neither can end the field early
[[nodiscard]] auto
is_valid_header_field(const std::string_view name,
                      const std::string_view value) noexcept -> bool;

struct http_header {
  std::string status_line;       // HTTP/1.1 200 OK
  int status_code{};             // 200
  std::string reason;            // OK
  http_headers fields;           // content-type: application/json
  std::size_t content_length{};  // content-length: 117607180
  bool has_content_length{false};
  bool chunked{false};           // transfer-encoding: chunked

  http_header() = default;
  explicit http_header(const std::string &header_block);

  [[nodiscard]] auto
  is_valid() const -> bool {
    return status_code != 0;
  }

  [[nodiscard]] auto
  tostring() const -> std::string;
};

/// Reassemble a body sent with "Transfer-Encoding: chunked"
[[nodiscard]] auto
decode_chunked(const std::string &data,
               std::error_code &error) noexcept -> std::string;

}  // namespace webapi

#endif  // LIB_HTTP_HEADER_HPP_
