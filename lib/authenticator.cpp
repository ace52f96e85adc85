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

#include "authenticator.hpp"

#include "format_error_code.hpp"  // IWYU pragma: keep
#include "http_method.hpp"
#include "http_response.hpp"
#include "logger.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <system_error>

namespace webapi {

[[nodiscard]] auto
login_authenticator::authenticate(const credentials &creds,
                                  std::error_code &error) const
  -> std::string {
  static constexpr auto http_ok = 200;
  auto &lgr = logger::instance();

  if (!login_path.starts_with('/')) {
    error = auth_error_code::invalid_login_path;
    return {};
  }

  const auto url =
    std::format("https://{}:{}{}", creds.host, creds.port, login_path);
  const http_headers headers{
    {"Content-Type", "application/json"},
    {"Accept", "application/json"},
  };
  const nlohmann::json payload{
    {"username", creds.username},
    {"password", creds.password},
  };

  lgr.debug("Requesting access token from {}", url);
  const auto response =
    dispatcher->send(http_method::post, url, headers, payload.dump(), error);
  if (error) {
    lgr.debug("Login request failed: {}", error);
    return {};
  }
  if (response.status_code != http_ok) {
    lgr.debug("Login endpoint returned {} {}", response.status_code,
              response.reason);
    error = make_http_status_error(response.status_code);
    return {};
  }

  const auto reply = nlohmann::json::parse(response.body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    error = auth_error_code::login_response_not_json;
    return {};
  }
  for (const auto key : {"access_token", "token"}) {
    const auto itr = reply.find(key);
    if (itr != reply.end() && itr->is_string())
      return itr->get<std::string>();
  }
  error = auth_error_code::no_access_token_in_response;
  return {};
}

}  // namespace webapi
