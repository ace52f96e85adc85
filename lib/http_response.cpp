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

#include "http_response.hpp"

#include "utilities.hpp"

#include <format>
#include <string>
#include <system_error>
#include <tuple>

namespace webapi {

[[nodiscard]] auto
parse_media_type(const std::string &content_type)
  -> std::tuple<std::string, std::string> {
  const auto full = to_lower(rlstrip(content_type.substr(
    0, content_type.find(';'))));
  const auto slash = full.find('/');
  if (slash == std::string::npos)
    return {full, std::string{}};
  return {rlstrip(full.substr(0, slash)), rlstrip(full.substr(slash + 1))};
}

[[nodiscard]] auto
http_response::is_json() const -> bool {
  const auto [type, subtype] = parse_media_type(content_type());
  return subtype == "json";
}

struct http_status_error_category : std::error_category {
  auto
  name() const noexcept -> const char * override {
    return "http_status";
  }

  auto
  message(int code) const -> std::string override {
    // clang-format off
    switch (code) {
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 307: return "Temporary Redirect";
    case 308: return "Permanent Redirect";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 422: return "Unprocessable Content";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    }
    // clang-format on
    return std::format("HTTP status {}", code);
  }
};

[[nodiscard]] auto
http_status_category() noexcept -> const std::error_category & {
  static const http_status_error_category category{};
  return category;
}

}  // namespace webapi
