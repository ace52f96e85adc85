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

#include "client_config.hpp"

#include "environment_utilities.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>  // for std::size
#include <string>
#include <system_error>

[[nodiscard]] static inline auto
get_file_if_not_already_dir(const std::string &filename,
                            std::error_code &error) noexcept -> std::string {
  const auto status = std::filesystem::status(filename, error);
  if (!std::filesystem::exists(status)) {
    error.clear();  // clear enoent
    return filename;
  }
  if (error)
    return {};

  // File exists as a dir
  if (std::filesystem::is_directory(status)) {
    error = std::make_error_code(std::errc::is_a_directory);
    return {};
  }
  return filename;
}

namespace webapi {

[[nodiscard]] auto
client_config::get_config_file(const std::string &config_dir) noexcept
  -> std::string {
  return (std::filesystem::path(config_dir) / client_config_filename_default)
    .lexically_normal();
}

[[nodiscard]] auto
client_config::get_default_config_dir(std::error_code &error) -> std::string {
  const auto [home, home_error] = get_home_dir();
  if (home_error) {
    error = client_config_error_code::error_obtaining_config_dir;
    return {};
  }
  const auto dirname =
    std::filesystem::path{home} / webapi_config_dirname_default;
  return dirname.string();
}

[[nodiscard]] auto
client_config::get_config_file(const std::string &config_dir,
                               std::error_code &error) -> std::string {
  const auto joined =
    std::filesystem::path{config_dir} / client_config_filename_default;
  return get_file_if_not_already_dir(joined, error);
}

auto
client_config::assign_defaults_to_missing() -> void {
  if (login_path.empty())
    login_path = login_path_default;
  if (connect_timeout <= 0)
    connect_timeout = connect_timeout_default;
  if (read_timeout <= 0)
    read_timeout = read_timeout_default;
}

[[nodiscard]] auto
client_config::read_config_file(const std::string &config_file,
                                std::error_code &error) noexcept
  -> client_config {
  std::ifstream in(config_file);
  if (!in) {
    error = client_config_error_code::failed_to_read_client_config_file;
    return {};
  }
  const nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
  if (data.is_discarded()) {
    error = client_config_error_code::failed_to_parse_client_config_file;
    return {};
  }
  client_config config;
  try {
    config = data;
  }
  catch (const nlohmann::json::exception &_) {
    error = client_config_error_code::invalid_client_config_file;
    return {};
  }
  return config;
}

[[nodiscard]] auto
client_config::read(std::string config_dir,
                    std::error_code &error) noexcept -> client_config {
  // If config dir is empty, get the default
  if (config_dir.empty()) {
    config_dir = get_default_config_dir(error);
    if (error)
      return {};
  }
  const auto config_file = get_config_file(config_dir, error);
  if (error)
    return {};

  auto config = read_config_file(config_file, error);
  if (error)
    return {};
  if (config.config_dir.empty())
    config.config_dir = config_dir;
  config.assign_defaults_to_missing();
  return config;
}

auto
client_config::save(std::error_code &error) const noexcept -> void {
  std::string dir = config_dir;
  if (dir.empty()) {
    dir = get_default_config_dir(error);
    if (error)
      return;
  }

  std::filesystem::create_directories(dir, error);
  if (error) {
    error = client_config_error_code::error_creating_directories;
    return;
  }

  const auto config_file = get_config_file(dir, error);
  if (error)
    return;

  const bool file_exists = std::filesystem::exists(config_file, error);
  if (error)
    return;

  client_config tmp = *this;
  tmp.config_dir = dir;
  if (file_exists) {
    tmp = client_config::read_config_file(config_file, error);
    if (error)
      return;
    tmp.config_dir = dir;
    if (!credential_file.empty())
      tmp.credential_file = credential_file;
    if (!login_path.empty())
      tmp.login_path = login_path;
    if (connect_timeout > 0)
      tmp.connect_timeout = connect_timeout;
    if (read_timeout > 0)
      tmp.read_timeout = read_timeout;
    // always overwrite log level and insecure -- no way to know not to
    tmp.log_level = log_level;
    tmp.insecure = insecure;
  }
  tmp.assign_defaults_to_missing();

  std::ofstream out(config_file);
  if (!out) {
    error = client_config_error_code::error_writing_config_file;
    return;
  }
  const std::string payload = tmp.tostring();
  out.write(payload.data(), static_cast<std::streamsize>(std::size(payload)));
  if (!out)
    error = client_config_error_code::error_writing_config_file;
}

[[nodiscard]] auto
client_config::tostring() const -> std::string {
  static constexpr auto n_indent = 4;
  nlohmann::json data = *this;
  return data.dump(n_indent);
}

}  // namespace webapi
