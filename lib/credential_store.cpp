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

#include "credential_store.hpp"

#include "environment_utilities.hpp"
#include "format_error_code.hpp"  // IWYU pragma: keep
#include "logger.hpp"
#include "utilities.hpp"

#include <filesystem>
#include <format>
#include <string>
#include <system_error>
#include <utility>

namespace webapi {

credential_store::credential_store(std::string appname,
                                   std::string credential_file) :
  appname{std::move(appname)}, credential_file{std::move(credential_file)} {
  if (this->credential_file.empty())
    this->credential_file = well_known_path(this->appname);
}

[[nodiscard]] auto
credential_store::well_known_path(const std::string &appname) -> std::string {
  return (std::filesystem::path{"."} / std::format(".{}", appname) / "session")
    .string();
}

[[nodiscard]] auto
credential_store::env_prefix(const std::string &appname) -> std::string {
  return to_upper(appname) + "_";
}

[[nodiscard]] auto
credential_store::resolve(std::error_code &error) const noexcept
  -> authenticated_credentials {
  auto &lgr = logger::instance();

  std::error_code env_error;
  auto from_env =
    authenticated_credentials::from_env(get_env_prefix(), env_error);
  if (!env_error) {
    lgr.debug("Using credentials from environment: {}", from_env);
    return from_env;
  }
  if (env_error != credential_error_code::missing_field) {
    error = env_error;
    return {};
  }

  std::error_code file_error;
  auto from_file =
    authenticated_credentials::from_file(credential_file, file_error);
  if (file_error == credential_error_code::credential_file_not_found) {
    lgr.debug("No credentials in environment or at {}", credential_file);
    error = credential_error_code::not_authenticated;
    return {};
  }
  if (file_error) {
    error = file_error;
    return {};
  }

  const auto filename = expand_user(credential_file);
  from_file.on_purge([filename] {
    auto &lgr = logger::instance();
    std::error_code remove_error;
    // already gone is fine
    if (std::filesystem::remove(filename, remove_error))
      lgr.info("Removed credential file: {}", filename);
    else if (remove_error)
      lgr.warning("Failed to remove credential file {}: {}", filename,
                  remove_error);
  });
  lgr.debug("Using credentials from file {}: {}", credential_file, from_file);
  return from_file;
}

auto
credential_store::save(const authenticated_credentials &creds,
                       std::error_code &error) const noexcept -> void {
  creds.write_to_file(credential_file, true, error);
}

}  // namespace webapi
