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

#ifndef LIB_HTTP_RESPONSE_HPP_
#define LIB_HTTP_RESPONSE_HPP_

#include "http_header.hpp"

#include <format>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move

namespace webapi {

struct http_response {
  int status_code{};
  std::string reason;
  http_headers headers;
  std::string body;

  http_response() = default;
  http_response(const http_header &header, std::string body) :
    status_code{header.status_code}, reason{header.reason},
    headers{header.fields}, body{std::move(body)} {}
  http_response(const int status_code, std::string reason,
                http_headers headers, std::string body) :
    status_code{status_code}, reason{std::move(reason)},
    headers{std::move(headers)}, body{std::move(body)} {}

  [[nodiscard]] auto
  content_type() const -> std::string {
    return find_header(headers, "content-type").value_or(std::string{});
  }

  /// True when the media subtype is exactly "json"
  [[nodiscard]] auto
  is_json() const -> bool;
};

/// Parse "type/subtype; params" into lower case type and subtype
[[nodiscard]] auto
parse_media_type(const std::string &content_type)
  -> std::tuple<std::string, std::string>;

/// Category for non-200 responses: the value of the error code is the
/// HTTP status itself
[[nodiscard]] auto
http_status_category() noexcept -> const std::error_category &;

[[nodiscard]] inline auto
make_http_status_error(const int status_code) -> std::error_code {
  return std::error_code(status_code, http_status_category());
}

/// An error is an authentication rejection (HTTP 401) from the server
[[nodiscard]] inline auto
is_unauthorized(const std::error_code &error) -> bool {
  static constexpr auto unauthorized = 401;
  return error.category() == http_status_category() &&
         error.value() == unauthorized;
}

/// The throwing counterpart of an http_status error; keeps the response
class http_response_error : public std::system_error {
public:
  explicit http_response_error(http_response response) :
    std::system_error(make_http_status_error(response.status_code),
                      response.reason),
    response{std::move(response)} {}

  [[nodiscard]] auto
  status_code() const noexcept -> int {
    return response.status_code;
  }

  [[nodiscard]] auto
  reason() const -> const std::string & {
    return response.reason;
  }

  [[nodiscard]] auto
  text() const -> const std::string & {
    return response.body;
  }

  [[nodiscard]] auto
  get_response() const -> const http_response & {
    return response;
  }

private:
  http_response response;
};

}  // namespace webapi

#endif  // LIB_HTTP_RESPONSE_HPP_
