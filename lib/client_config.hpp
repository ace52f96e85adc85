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

#ifndef LIB_CLIENT_CONFIG_HPP_
#define LIB_CLIENT_CONFIG_HPP_

#include "logger.hpp"  // IWYU pragma: keep

#include <nlohmann/json.hpp>  // IWYU pragma: keep

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace webapi {

// clang-format off
NLOHMANN_JSON_SERIALIZE_ENUM(log_level_t, {
    {log_level_t::debug, "debug"},
    {log_level_t::info, "info"},
    {log_level_t::warning, "warning"},
    {log_level_t::error, "error"},
    {log_level_t::critical, "critical"},
})
// clang-format on

struct client_config {
  static constexpr auto webapi_config_dirname_default = ".config/webapi";
  static constexpr auto client_config_filename_default = "webapi_client.json";
  static constexpr auto login_path_default = "/auth/login";
  static constexpr auto connect_timeout_default = 10;  // seconds
  static constexpr auto read_timeout_default = 30;     // seconds

  std::string config_dir;
  /// Empty means "./.{appname}/session"
  std::string credential_file;
  std::string login_path;
  log_level_t log_level{log_level_t::info};
  bool insecure{false};
  std::int32_t connect_timeout{};
  std::int32_t read_timeout{};

  /// Read the client configuration from the given directory, or the
  /// default directory if `config_dir` is empty. Missing values get
  /// defaults.
  [[nodiscard]] static auto
  read(std::string config_dir,
       std::error_code &error) noexcept -> client_config;

  /// Initialize all values from a given config file
  [[nodiscard]] static auto
  read_config_file(const std::string &config_file,
                   std::error_code &error) noexcept -> client_config;

#ifndef WEBAPI_NOEXCEPT
  /// Overload of the read function that throws system_error exceptions to
  /// serve in an API
  [[nodiscard]] static auto
  read(const std::string &config_dir) -> client_config {
    std::error_code error;
    const auto obj = read(config_dir, error);
    if (error) {
      const auto message = std::format("[config_dir: {}]", config_dir);
      throw std::system_error(error, message);
    }
    return obj;
  }
#endif

  auto
  assign_defaults_to_missing() -> void;

  /// Write the client configuration to its directory. Values already in an
  /// existing file are kept unless this object has a non-empty value.
  auto
  save(std::error_code &error) const noexcept -> void;

#ifndef WEBAPI_NOEXCEPT
  auto
  save() const -> void {
    std::error_code error;
    save(error);
    if (error)
      throw std::system_error(error);
  }
#endif

  [[nodiscard]] auto
  get_connect_timeout() const -> std::chrono::seconds {
    return std::chrono::seconds{connect_timeout};
  }

  [[nodiscard]] auto
  get_read_timeout() const -> std::chrono::seconds {
    return std::chrono::seconds{read_timeout};
  }

  [[nodiscard]] auto
  tostring() const -> std::string;

  [[nodiscard]] static auto
  get_default_config_dir(std::error_code &error) -> std::string;

  /// Get the path to the config file (base on dir)
  [[nodiscard]] static auto
  get_config_file(const std::string &config_dir) noexcept -> std::string;

  [[nodiscard]] static auto
  get_config_file(const std::string &config_dir,
                  std::error_code &error) -> std::string;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(client_config, config_dir,
                                              credential_file, login_path,
                                              log_level, insecure,
                                              connect_timeout, read_timeout)
};

}  // namespace webapi

/// @brief Enum for error codes related to client configuration
enum class client_config_error_code : std::uint8_t {
  ok = 0,
  error_creating_directories = 1,
  error_writing_config_file = 2,
  error_obtaining_config_dir = 3,
  failed_to_read_client_config_file = 4,
  failed_to_parse_client_config_file = 5,
  invalid_client_config_file = 6,
};

template <>
struct std::is_error_code_enum<client_config_error_code>
  : public std::true_type {};

struct client_config_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "client_config";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "error creating directories"s;
    case 2: return "error writing config file"s;
    case 3: return "error obtaining config dir"s;
    case 4: return "failed to read client config file"s;
    case 5: return "failed to parse client config file"s;
    case 6: return "invalid client config file"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(client_config_error_code e) -> std::error_code {
  static auto category = client_config_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_CLIENT_CONFIG_HPP_
