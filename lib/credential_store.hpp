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

#ifndef LIB_CREDENTIAL_STORE_HPP_
#define LIB_CREDENTIAL_STORE_HPP_

#include "credentials.hpp"

#include <format>
#include <string>
#include <system_error>
#include <utility>

namespace webapi {

/// Locates the active authenticated credentials for one application:
/// environment variables named with the application's prefix first, then
/// the credential file.
class credential_store {
public:
  explicit credential_store(std::string appname,
                            std::string credential_file = {});

  /// "./.{appname}/session"
  [[nodiscard]] static auto
  well_known_path(const std::string &appname) -> std::string;

  /// "{APPNAME}_"
  [[nodiscard]] static auto
  env_prefix(const std::string &appname) -> std::string;

  [[nodiscard]] auto
  get_env_prefix() const -> std::string {
    return env_prefix(appname);
  }

  [[nodiscard]] auto
  get_credential_file() const -> const std::string & {
    return credential_file;
  }

  /// Environment wins whenever all three variables are set. Falls back to
  /// the file only when some variable is missing; a file-backed result has
  /// a purge hook that deletes the file. Neither source gives
  /// credential_error_code::not_authenticated.
  [[nodiscard]] auto
  resolve(std::error_code &error) const noexcept -> authenticated_credentials;

  /// Write to the credential file, creating its directory
  auto
  save(const authenticated_credentials &creds,
       std::error_code &error) const noexcept -> void;

#ifndef WEBAPI_NOEXCEPT
  [[nodiscard]] auto
  resolve() const -> authenticated_credentials {
    std::error_code error;
    auto creds = resolve(error);
    if (error)
      throw std::system_error(error, std::format("[app: {}]", appname));
    return creds;
  }

  auto
  save(const authenticated_credentials &creds) const -> void {
    std::error_code error;
    save(creds, error);
    if (error)
      throw std::system_error(error,
                              std::format("[path: {}]", credential_file));
  }
#endif

private:
  std::string appname;
  std::string credential_file;
};

}  // namespace webapi

#endif  // LIB_CREDENTIAL_STORE_HPP_
