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

#ifndef LIB_HTTPS_TRANSPORT_HPP_
#define LIB_HTTPS_TRANSPORT_HPP_

#include "http_header.hpp"
#include "http_method.hpp"
#include "http_response.hpp"
#include "transport.hpp"

#include <chrono>
#include <string>
#include <system_error>
#include <tuple>

namespace webapi {

/// HTTP/1.1 over TLS, one connection per request
class https_transport : public transport {
public:
  static constexpr auto default_connect_timeout = std::chrono::seconds{10};
  static constexpr auto default_read_timeout = std::chrono::seconds{30};

  explicit https_transport(
    const bool insecure = false,
    const std::chrono::seconds connect_timeout = default_connect_timeout,
    const std::chrono::seconds read_timeout = default_read_timeout) :
    insecure{insecure}, connect_timeout{connect_timeout},
    read_timeout{read_timeout} {}

  [[nodiscard]] auto
  send(const http_method method, const std::string &url,
       const http_headers &headers, const std::string &body,
       std::error_code &error) -> http_response override;

  [[nodiscard]] auto
  is_insecure() const noexcept -> bool override {
    return insecure;
  }

private:
  bool insecure{};
  std::chrono::seconds connect_timeout{};
  std::chrono::seconds read_timeout{};
};

/// Split "https://host[:port]/target" into host, port and target; the port
/// defaults to 443 and the target to "/"
[[nodiscard]] auto
parse_https_url(const std::string &url, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string, std::string>;

/// Request line, Host (with the port unless it is 443), the given fields,
/// Content-Length when there is a body, Connection: close, blank line, body
[[nodiscard]] auto
format_http_request(const http_method method, const std::string &host,
                    const std::string &port, const std::string &target,
                    const http_headers &headers,
                    const std::string &body) -> std::string;

}  // namespace webapi

#endif  // LIB_HTTPS_TRANSPORT_HPP_
