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

#ifndef CLI_CLI_COMMON_HPP_
#define CLI_CLI_COMMON_HPP_

#include "client_config.hpp"
#include "logger.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

static const int column_width_default = 30;

static constexpr auto appname_default = "webapi";

class webapi_formatter : public CLI::Formatter {
  static constexpr auto max_descr_width = 50;

public:
  auto
  make_option_desc(const CLI::Option *opt) const -> std::string override {
    std::istringstream iss{opt->get_description()};
    const std::vector<std::string> words{
      std::istream_iterator<std::string>{iss}, {}};
    if (words.empty())
      return {};
    std::string r{words[0]};
    std::uint32_t width = std::size(words[0]);
    for (auto i = 1u; i < std::size(words); ++i) {
      if (width == 0 || width + std::size(words[i]) < max_descr_width) {
        r += ' ';
        ++width;
      }
      else {
        r += '\n';
        width = 0;
      }
      r += words[i];
      width += std::size(words[i]);
    }
    return r;
  }
};

/// Read the client config if one exists; otherwise all defaults. Only a
/// config file that exists but cannot be used is an error.
[[nodiscard]] inline auto
load_client_config(const std::string &config_dir,
                   std::error_code &error) -> webapi::client_config {
  namespace wa = webapi;
  auto dir = config_dir;
  if (dir.empty()) {
    dir = wa::client_config::get_default_config_dir(error);
    if (error)
      return {};
  }
  const auto config_file = wa::client_config::get_config_file(dir);
  std::error_code exists_error;
  if (!std::filesystem::exists(config_file, exists_error)) {
    wa::client_config cfg;
    cfg.config_dir = dir;
    cfg.assign_defaults_to_missing();
    return cfg;
  }
  return wa::client_config::read(dir, error);
}

/// An explicit -v wins, then --debug or --quiet, then the config file
[[nodiscard]] inline auto
select_log_level(const CLI::Option *log_level_opt,
                 const webapi::log_level_t log_level, const bool debug,
                 const bool quiet,
                 const webapi::log_level_t configured) -> webapi::log_level_t {
  if (log_level_opt->count() > 0)
    return log_level;
  if (debug)
    return webapi::log_level_t::debug;
  if (quiet)
    return webapi::log_level_t::error;
  return configured;
}

#endif  // CLI_CLI_COMMON_HPP_
