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

#ifndef LIB_TRANSPORT_HPP_
#define LIB_TRANSPORT_HPP_

#include "http_header.hpp"
#include "http_method.hpp"
#include "http_response.hpp"

#include <string>
#include <system_error>

namespace webapi {

/// Sends one HTTP request and returns the response. A non-2xx status is not
/// a transport error; `error` reports only failure to get a response.
class transport {
public:
  virtual ~transport() = default;

  [[nodiscard]] virtual auto
  send(const http_method method, const std::string &url,
       const http_headers &headers, const std::string &body,
       std::error_code &error) -> http_response = 0;

  /// True when server certificates are not verified
  [[nodiscard]] virtual auto
  is_insecure() const noexcept -> bool {
    return false;
  }
};

}  // namespace webapi

#endif  // LIB_TRANSPORT_HPP_
