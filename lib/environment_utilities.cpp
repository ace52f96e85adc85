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

#include "environment_utilities.hpp"

#include <config.h>

#include <asio.hpp>  // asio::ip::host_name()

// getpwuid_r
#include <pwd.h>
#include <unistd.h>  // for getuid

#include <array>
#include <cerrno>
#include <cstdlib>  // for std::getenv
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>

namespace webapi {

[[nodiscard]] auto
get_env_value(const std::string &name)
  -> std::tuple<std::string, std::error_code> {
  const char *value = std::getenv(name.data());
  if (value == nullptr)
    return {std::string{}, std::make_error_code(std::errc::invalid_argument)};
  return {std::string(value), std::error_code{}};
}

[[nodiscard]] auto
get_home_dir() -> std::tuple<std::string, std::error_code> {
  if (const auto [home, error] = get_env_value("HOME"); !error)
    return {home, {}};
  // no HOME in the environment, so ask the password database
  constexpr auto bufsize{1024};
  struct passwd pwd;
  struct passwd *result;
  std::array<char, bufsize> buf;
  const auto s = getpwuid_r(getuid(), &pwd, buf.data(), bufsize, &result);
  if (result == nullptr)
    return {{},
            std::make_error_code(s == 0 ? std::errc::invalid_argument
                                        : std::errc(errno))};
  return {std::string(pwd.pw_dir), {}};
}

[[nodiscard]] auto
expand_user(const std::string &path) -> std::string {
  if (path.empty() || path[0] != '~')
    return path;
  if (std::size(path) > 1 && path[1] != '/')
    return path;  // ~otheruser is left alone
  const auto [home, error] = get_home_dir();
  if (error)
    return path;
  return (std::filesystem::path{home} / path.substr(std::size(path) > 1 ? 2 : 1))
    .lexically_normal()
    .string();
}

[[nodiscard]] auto
get_hostname() -> std::tuple<std::string, std::error_code> {
  std::error_code error;
  const auto host = asio::ip::host_name(error);
  if (error)
    return {std::string{}, error};
  return {host, std::error_code{}};
}

[[nodiscard]] auto
get_version() -> std::string {
  return VERSION;
}

}  // namespace webapi
