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

#include "caller.hpp"

#include "format_error_code.hpp"  // IWYU pragma: keep
#include "logger.hpp"
#include "request_error_code.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace webapi {

static constexpr auto json_media_type = "application/json";

api_request::api_request(const http_method method, std::string path,
                         std::string url, http_headers headers,
                         std::optional<nlohmann::json> body,
                         std::shared_ptr<transport> dispatcher) :
  method_{method}, path_{std::move(path)}, url_{std::move(url)},
  headers_{std::move(headers)}, body_{std::move(body)},
  dispatcher{std::move(dispatcher)} {}

[[nodiscard]] auto
api_request::wire_headers() const -> http_headers {
  auto h = headers_;
  if (body_ && !find_header(h, "content-type"))
    h.emplace_back("Content-Type", json_media_type);
  return h;
}

[[nodiscard]] auto
api_request::invoke(std::error_code &error) const -> http_response {
  static constexpr auto http_ok = 200;
  auto &lgr = logger::instance();

  if (!dispatcher) {
    error = request_error_code::no_transport;
    return {};
  }
  const auto payload = body_ ? body_->dump() : std::string{};
  lgr.debug("{} {}", method_, url_);
  auto response =
    dispatcher->send(method_, url_, wire_headers(), payload, error);
  if (error) {
    lgr.debug("Request to {} failed: {}", url_, error);
    return {};
  }
  lgr.debug("Response: {} {}", response.status_code, response.reason);
  if (response.status_code != http_ok)
    error = make_http_status_error(response.status_code);
  return response;
}

#ifndef WEBAPI_NOEXCEPT
[[nodiscard]] auto
api_request::invoke() const -> http_response {
  std::error_code error;
  auto response = invoke(error);
  if (error.category() == http_status_category())
    throw http_response_error(std::move(response));
  if (error)
    throw std::system_error(error, std::format("[{} {}]", method_, url_));
  return response;
}
#endif

[[nodiscard]] auto
api_request::similar_of_curl() const -> std::vector<std::string> {
  std::vector<std::string> args{"curl"};
  if (dispatcher && dispatcher->is_insecure())
    args.emplace_back("--insecure");
  args.emplace_back("-X");
  args.emplace_back(to_string(method_));
  args.push_back(url_);
  for (const auto &[name, value] : wire_headers()) {
    args.emplace_back("-H");
    args.emplace_back(std::format("{}: {}", name, value));
  }
  if (body_) {
    args.emplace_back("--data");
    args.emplace_back(body_->dump());
  }
  return args;
}

caller::caller(authenticated_credentials creds,
               std::shared_ptr<const credential_applier> applier,
               std::shared_ptr<transport> dispatcher) :
  creds{std::move(creds)}, applier{std::move(applier)},
  dispatcher{std::move(dispatcher)} {}

[[nodiscard]] auto
caller::request(const std::string_view method, const std::string &path,
                const http_headers &headers,
                const std::optional<nlohmann::json> &body,
                std::error_code &error) const -> api_request {
  const auto m = parse_http_method(method, error);
  if (error)
    return api_request(http_method::get, {}, {}, {}, {}, dispatcher);
  return request(m, path, headers, body, error);
}

[[nodiscard]] auto
caller::request(const http_method method, const std::string &path,
                const http_headers &headers,
                const std::optional<nlohmann::json> &body,
                std::error_code &error) const -> api_request {
  if (!path.starts_with('/')) {
    error = request_error_code::invalid_path;
    return api_request(method, {}, {}, {}, {}, dispatcher);
  }
  for (const auto &[name, value] : headers)
    if (!is_valid_header_field(name, value)) {
      error = request_error_code::invalid_header;
      return api_request(method, {}, {}, {}, {}, dispatcher);
    }
  auto url = std::format("https://{}:{}{}", creds.host(), creds.port(), path);
  // the applier receives its own copy of the headers
  auto applied = applier->apply(creds, headers);
  return api_request(method, path, std::move(url), std::move(applied), body,
                     dispatcher);
}

#ifndef WEBAPI_NOEXCEPT
[[nodiscard]] auto
caller::request(const std::string_view method, const std::string &path,
                const http_headers &headers,
                const std::optional<nlohmann::json> &body) const
  -> api_request {
  std::error_code error;
  auto r = request(method, path, headers, body, error);
  if (error)
    throw std::system_error(error, std::format("[{} {}]", method, path));
  return r;
}
#endif

[[nodiscard]] auto
to_shell_command(const std::vector<std::string> &args) -> std::string {
  static constexpr auto plain =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
    "-_./:=@%+,";
  std::string r;
  for (const auto &arg : args) {
    if (!r.empty())
      r += ' ';
    if (!arg.empty() && arg.find_first_not_of(plain) == std::string::npos) {
      r += arg;
      continue;
    }
    r += '\'';
    for (const auto c : arg) {
      if (c == '\'')
        r += "'\\''";
      else
        r += c;
    }
    r += '\'';
  }
  return r;
}

}  // namespace webapi
