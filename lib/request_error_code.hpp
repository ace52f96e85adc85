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

#ifndef LIB_REQUEST_ERROR_CODE_HPP_
#define LIB_REQUEST_ERROR_CODE_HPP_

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

/// @brief Enum for error codes related to building requests
enum class request_error_code : std::uint8_t {
  ok = 0,
  invalid_path = 1,
  unsupported_method = 2,
  invalid_url = 3,
  invalid_header = 4,
  invalid_body = 5,
  no_transport = 6,
};

template <>
struct std::is_error_code_enum<request_error_code> : public std::true_type {};

struct request_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "request";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "request path must start with '/'"s;
    case 2: return "unsupported method (use GET, POST, PUT, PATCH or DELETE)"s;
    case 3: return "invalid url"s;
    case 4: return "invalid header (expected \"Key: Value\")"s;
    case 5: return "invalid request body (expected JSON)"s;
    case 6: return "no transport to send the request"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(request_error_code e) -> std::error_code {
  static auto category = request_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_REQUEST_ERROR_CODE_HPP_
