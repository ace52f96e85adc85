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

#include "credentials.hpp"

#include "authenticator.hpp"
#include "config_file_utils.hpp"
#include "environment_utilities.hpp"
#include "format_error_code.hpp"  // IWYU pragma: keep
#include "logger.hpp"
#include "utilities.hpp"

#include <boost/describe.hpp>
#include <boost/mp11/algorithm.hpp>

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <print>
#include <sstream>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

namespace webapi {

[[nodiscard]] static inline auto
valid_port(const std::int64_t port) -> bool {
  return port > 0 && port <= std::numeric_limits<std::uint16_t>::max();
}

[[nodiscard]] static inline auto
parse_port(const std::string &value, std::error_code &error) -> std::uint16_t {
  std::int64_t port{};
  std::istringstream is(rlstrip(value));
  if (!(is >> port) || !(is >> std::ws).eof() || !valid_port(port)) {
    error = credential_error_code::invalid_port;
    return {};
  }
  return static_cast<std::uint16_t>(port);
}

[[nodiscard]] auto
credentials::authenticate(const authenticator &auth,
                          std::error_code &error) const
  -> authenticated_credentials {
  auto &lgr = logger::instance();
  std::error_code auth_error;
  const auto access_token = auth.authenticate(*this, auth_error);
  if (auth_error) {
    // username and password never go to the log
    lgr.warning("Authentication with {}:{} failed: {}", host, port,
                auth_error);
    error = credential_error_code::authentication_failed;
    return {};
  }
  lgr.debug("Authenticated with {}:{}", host, port);
  return authenticated_credentials(host, port, access_token);
}

#ifndef WEBAPI_NOEXCEPT
[[nodiscard]] auto
credentials::authenticate(const authenticator &auth) const
  -> authenticated_credentials {
  std::error_code error;
  auto result = authenticate(auth, error);
  if (error)
    throw std::system_error(error, std::format("[{}:{}]", host, port));
  return result;
}
#endif

[[nodiscard]] auto
credentials::tostring() const -> std::string {
  return std::format("credentials(host={}, port={}, username={}, password={})",
                     host, port, username,
                     authenticated_credentials::masked_token);
}

auto
authenticated_credentials::purge() -> authenticated_credentials & {
  if (on_purge_)
    on_purge_();
  return *this;
}

auto
authenticated_credentials::write_to_file(const std::string &path,
                                         const bool mkdir,
                                         std::error_code &error) const noexcept
  -> void {
  auto &lgr = logger::instance();
  const auto filename = std::filesystem::absolute(expand_user(path), error);
  if (error) {
    lgr.debug("Failed to resolve credential path {}: {}", path, error);
    error = credential_error_code::failed_to_write_credential_file;
    return;
  }

  const auto parent = filename.parent_path();
  std::error_code dir_error;
  const bool parent_exists = std::filesystem::is_directory(parent, dir_error);
  if (!parent_exists) {
    if (!mkdir) {
      lgr.debug("Directory missing for credential file: {}", parent.string());
      error = credential_error_code::parent_directory_missing;
      return;
    }
    std::filesystem::create_directories(parent, dir_error);
    if (dir_error) {
      lgr.debug("Failed to create directory {}: {}", parent.string(),
                dir_error);
      error = credential_error_code::failed_to_write_credential_file;
      return;
    }
  }

  // create the file empty and restrict it before the token goes in
  if (!std::filesystem::exists(filename, dir_error)) {
    std::ofstream touch(filename);
    if (!touch) {
      error = credential_error_code::failed_to_write_credential_file;
      return;
    }
  }
  std::error_code perm_error;
  std::filesystem::permissions(filename,
                               std::filesystem::perms::owner_read |
                                 std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace,
                               perm_error);
  if (perm_error)
    lgr.debug("Could not restrict permissions on {}: {}", filename.string(),
              perm_error);

  const credential_record record{host_, port_, access_token_};
  const auto write_error = write_config_file(record, filename.string());
  if (write_error) {
    lgr.debug("Failed writing credential file {}: {}", filename.string(),
              write_error);
    error = credential_error_code::failed_to_write_credential_file;
    return;
  }
  lgr.debug("Wrote credential file: {}", filename.string());
}

[[nodiscard]] auto
authenticated_credentials::from_file(const std::string &path,
                                     std::error_code &error) noexcept
  -> authenticated_credentials {
  auto &lgr = logger::instance();
  const auto filename = expand_user(path);
  std::error_code exists_error;
  if (!std::filesystem::is_regular_file(filename, exists_error)) {
    error = credential_error_code::credential_file_not_found;
    return {};
  }

  credential_record record;
  std::error_code parse_error;
  const auto missing = parse_config_file(record, filename, parse_error);
  if (parse_error) {
    lgr.debug("Failed to parse credential file {}: {}", filename, parse_error);
    error = credential_error_code::failed_to_parse_credential_file;
    return {};
  }
  if (!missing.empty()) {
    lgr.debug("Credential file {} missing: {}", filename,
              join_with(missing, ','));
    error = credential_error_code::missing_field;
    return {};
  }
  if (!valid_port(record.port)) {
    error = credential_error_code::invalid_port;
    return {};
  }
  return authenticated_credentials(std::move(record.host),
                                   static_cast<std::uint16_t>(record.port),
                                   std::move(record.access_token));
}

[[nodiscard]] auto
authenticated_credentials::from_env(const std::string &prefix,
                                    std::error_code &error) noexcept
  -> authenticated_credentials {
  namespace bd = boost::describe;
  using Md = bd::describe_members<credential_record, bd::mod_public>;

  auto &lgr = logger::instance();
  const auto env_prefix = to_upper(prefix);

  // collect all values first so every missing variable gets reported
  std::vector<std::tuple<std::string, std::string>> values;
  std::vector<std::string> missing;
  boost::mp11::mp_for_each<Md>([&](const auto &D) {
    const auto name = env_prefix + to_upper(D.name);
    const auto [value, env_error] = get_env_value(name);
    if (env_error)
      missing.push_back(name);
    else
      values.emplace_back(D.name, value);
  });
  if (!missing.empty()) {
    lgr.debug("Environment variables not set: {}", join_with(missing, ','));
    error = credential_error_code::missing_field;
    return {};
  }

  std::string host;
  std::string access_token;
  std::uint16_t port{};
  for (const auto &[key, value] : values) {
    if (key == "host")
      host = value;
    else if (key == "access_token")
      access_token = value;
    else if (key == "port") {
      port = parse_port(value, error);
      if (error)
        return {};
    }
  }
  return authenticated_credentials(std::move(host), port,
                                   std::move(access_token));
}

auto
authenticated_credentials::print_to_env(const std::string &prefix,
                                        std::ostream &out) const
  -> const authenticated_credentials & {
  const auto env_prefix = to_upper(prefix);
  std::println(out, "export {}HOST={}", env_prefix, host_);
  std::println(out, "export {}PORT={}", env_prefix, port_);
  std::println(out, "export {}ACCESS_TOKEN={}", env_prefix, access_token_);
  return *this;
}

[[nodiscard]] auto
authenticated_credentials::tostring() const -> std::string {
  return std::format("authenticated_credentials(host={}, port={}, "
                     "access_token={})",
                     host_, port_, masked_token);
}

}  // namespace webapi
