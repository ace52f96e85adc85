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

#ifndef LIB_CALLER_HPP_
#define LIB_CALLER_HPP_

#include "credential_applier.hpp"
#include "credentials.hpp"
#include "http_header.hpp"
#include "http_method.hpp"
#include "http_response.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace webapi {

/// One outbound call. The url and the credential-applied headers are
/// computed when the request is built and do not change afterwards.
class api_request {
public:
  [[nodiscard]] auto
  method() const noexcept -> http_method {
    return method_;
  }

  [[nodiscard]] auto
  path() const noexcept -> const std::string & {
    return path_;
  }

  /// https://{host}:{port}{path}
  [[nodiscard]] auto
  url() const noexcept -> const std::string & {
    return url_;
  }

  /// Headers given to the request with the credentials applied
  [[nodiscard]] auto
  headers() const noexcept -> const http_headers & {
    return headers_;
  }

  [[nodiscard]] auto
  body() const noexcept -> const std::optional<nlohmann::json> & {
    return body_;
  }

  /// Send through the transport. Any status but 200 sets `error` to an
  /// http_status error; the response is still returned so its body can be
  /// shown. Exceptions thrown by the transport are not caught here.
  [[nodiscard]] auto
  invoke(std::error_code &error) const -> http_response;

#ifndef WEBAPI_NOEXCEPT
  /// Throws http_response_error for any status but 200
  [[nodiscard]] auto
  invoke() const -> http_response;
#endif

  /// Arguments of an equivalent curl command, starting with "curl"
  [[nodiscard]] auto
  similar_of_curl() const -> std::vector<std::string>;

private:
  friend class caller;

  api_request(const http_method method, std::string path, std::string url,
              http_headers headers, std::optional<nlohmann::json> body,
              std::shared_ptr<transport> dispatcher);

  [[nodiscard]] auto
  wire_headers() const -> http_headers;

  http_method method_{};
  std::string path_;
  std::string url_;
  http_headers headers_;
  std::optional<nlohmann::json> body_;
  std::shared_ptr<transport> dispatcher;
};

/// Builds requests against the host and port of one set of authenticated
/// credentials. Owns the credentials so a 401 can purge them.
class caller {
public:
  caller(authenticated_credentials creds,
         std::shared_ptr<const credential_applier> applier,
         std::shared_ptr<transport> dispatcher);

  /// The path must start with '/' (request_error_code::invalid_path). The
  /// method name is case insensitive. A header with a control character in
  /// its value, or a name that is not a token, is
  /// request_error_code::invalid_header.
  [[nodiscard]] auto
  request(const std::string_view method, const std::string &path,
          const http_headers &headers,
          const std::optional<nlohmann::json> &body,
          std::error_code &error) const -> api_request;

  [[nodiscard]] auto
  request(const http_method method, const std::string &path,
          const http_headers &headers,
          const std::optional<nlohmann::json> &body,
          std::error_code &error) const -> api_request;

#ifndef WEBAPI_NOEXCEPT
  [[nodiscard]] auto
  request(const std::string_view method, const std::string &path,
          const http_headers &headers = {},
          const std::optional<nlohmann::json> &body = std::nullopt) const
    -> api_request;
#endif

  [[nodiscard]] auto
  get_credentials() noexcept -> authenticated_credentials & {
    return creds;
  }

  [[nodiscard]] auto
  get_credentials() const noexcept -> const authenticated_credentials & {
    return creds;
  }

private:
  authenticated_credentials creds;
  std::shared_ptr<const credential_applier> applier;
  std::shared_ptr<transport> dispatcher;
};

/// Join arguments into one line for a POSIX shell, single-quoting any
/// argument that needs it
[[nodiscard]] auto
to_shell_command(const std::vector<std::string> &args) -> std::string;

}  // namespace webapi

#endif  // LIB_CALLER_HPP_
