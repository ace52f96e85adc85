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

#ifndef LIB_AUTHENTICATOR_HPP_
#define LIB_AUTHENTICATOR_HPP_

#include "credentials.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace webapi {

class transport;

/// Exchanges a username and password for an access token
class authenticator {
public:
  virtual ~authenticator() = default;

  [[nodiscard]] virtual auto
  authenticate(const credentials &creds,
               std::error_code &error) const -> std::string = 0;
};

/// Posts the username and password as a JSON object to the login endpoint
/// of the same host and reads the token from the JSON reply
class login_authenticator : public authenticator {
public:
  static constexpr auto default_login_path = "/auth/login";

  explicit login_authenticator(std::shared_ptr<transport> dispatcher,
                               std::string login_path = default_login_path) :
    dispatcher{std::move(dispatcher)}, login_path{std::move(login_path)} {}

  [[nodiscard]] auto
  authenticate(const credentials &creds,
               std::error_code &error) const -> std::string override;

  [[nodiscard]] auto
  get_login_path() const -> const std::string & {
    return login_path;
  }

private:
  std::shared_ptr<transport> dispatcher;
  std::string login_path;
};

}  // namespace webapi

/// @brief Enum for error codes from the login endpoint
enum class auth_error_code : std::uint8_t {
  ok = 0,
  login_response_not_json = 1,
  no_access_token_in_response = 2,
  invalid_login_path = 3,
};

template <>
struct std::is_error_code_enum<auth_error_code> : public std::true_type {};

struct auth_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "auth";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "login response is not JSON"s;
    case 2: return "login response has no access token"s;
    case 3: return "login path must start with '/'"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(auth_error_code e) -> std::error_code {
  static auto category = auth_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_AUTHENTICATOR_HPP_
