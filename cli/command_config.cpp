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

#include "command_config.hpp"

static constexpr auto about = R"(
configure the webapi client
)";

static constexpr auto description = R"(
Write the client configuration. The default config directory is
'${HOME}/.config/webapi'. Values already in an existing configuration are
kept unless given here. The configuration sets the credential file, the
login path used by 'auth', the log level, whether server certificates are
verified, and the connect and read timeouts. Note: configuration is not
strictly needed, as the defaults work for most servers.
)";

static constexpr auto examples = R"(
Examples:

webapi config --defaults

webapi config --login-path /api/v1/login

webapi config -f ~/.webapi/session --read-timeout 120
)";

#include "cli_common.hpp"
#include "client_config.hpp"
#include "logger.hpp"
#include "utilities.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

auto
command_config_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto log_level_default = webapi::log_level_t::info;
  static constexpr auto max_timeout = 3600;

  static constexpr auto command = "config";
  static const auto usage =
    std::format("Usage: webapi {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("webapi {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  namespace wa = webapi;

  wa::client_config cfg;
  cfg.log_level = log_level_default;
  bool all_defaults{false};
  bool quiet{false};
  bool debug{false};

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  app.usage(usage);
  if (argc >= 2)
    app.footer(description_msg);
  app.formatter(std::make_shared<webapi_formatter>());
  app.get_formatter()->column_width(column_width_default);
  app.get_formatter()->label("REQUIRED", "REQD");
  app.set_help_flag("-h,--help", "Print a detailed help message and exit");
  // clang-format off
  app.add_option("-c,--config-dir", cfg.config_dir,
                 "name of config directory; see help for default")
    ->option_text("TEXT")
    ->check(!CLI::ExistingFile);
  app.add_option("-f,--credential-file", cfg.credential_file,
                 "credential file written by 'auth'");
  app.add_option("--login-path", cfg.login_path,
                 std::format("path of the login endpoint [{}]",
                             wa::client_config::login_path_default));
  app.add_flag("--insecure", cfg.insecure,
               "do not verify server certificates")
    ->option_text(" ");
  app.add_option("--connect-timeout", cfg.connect_timeout,
                 "seconds to wait for a connection")
    ->option_text(std::format("INT [{}]",
                              wa::client_config::connect_timeout_default))
    ->check(CLI::Range(1, max_timeout));
  app.add_option("--read-timeout", cfg.read_timeout,
                 "seconds to wait for the server to respond")
    ->option_text(std::format("INT [{}]",
                              wa::client_config::read_timeout_default))
    ->check(CLI::Range(1, max_timeout));
  app.add_option("-v,--log-level", cfg.log_level,
                 "{debug, info, warning, error, critical}")
    ->option_text(std::format("ENUM [{}]", log_level_default))
    ->transform(CLI::CheckedTransformer(wa::str_to_level, CLI::ignore_case));
  app.add_flag("--defaults", all_defaults, "allow all default config values")
    ->option_text(" ");
  const auto quiet_opt =
    app.add_flag("--quiet", quiet, "only report errors")
    ->option_text(" ");
  app.add_flag("--debug", debug, "report debug information")
    ->option_text(" ")
    ->excludes(quiet_opt);
  // clang-format on

  if (argc < 2) {
    std::println("{}", app.help());
    return EXIT_SUCCESS;
  }
  CLI11_PARSE(app, argc, argv);

  auto &lgr = wa::logger::instance(wa::shared_from_cerr(), command);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }
  wa::logger::set_level(debug   ? wa::log_level_t::debug
                        : quiet ? wa::log_level_t::error
                                : wa::log_level_t::info);

  std::error_code error;
  if (cfg.config_dir.empty()) {
    cfg.config_dir = wa::client_config::get_default_config_dir(error);
    if (error) {
      lgr.error("Error obtaining config dir: {}", error);
      return EXIT_FAILURE;
    }
    lgr.debug("Taking default value for config dir: {}", cfg.config_dir);
  }

  using std::string_literals::operator""s;
  constexpr auto or_default = [](const auto &s) {
    return s.empty() ? "default"s : s;
  };
  const std::vector<std::tuple<std::string, std::string>> args_to_log{
    // clang-format off
    {"Config dir", cfg.config_dir},
    {"Config file", wa::client_config::get_config_file(cfg.config_dir)},
    {"Credential file", or_default(cfg.credential_file)},
    {"Login path", or_default(cfg.login_path)},
    {"Insecure", std::format("{}", cfg.insecure)},
    {"Log level", to_string(cfg.log_level)},
    // clang-format on
  };
  wa::log_args<wa::log_level_t::info>(args_to_log);

  cfg.save(error);
  if (error) {
    lgr.error("Error writing config: {}", error);
    return EXIT_FAILURE;
  }
  lgr.info("Completed configuration with status: Success");

  return EXIT_SUCCESS;
}
