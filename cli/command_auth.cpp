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

#include "command_auth.hpp"

static constexpr auto about = R"(
authenticate and store an access token
)";

static constexpr auto description = R"(
Exchange a username and password for an access token at the login endpoint
of the given host. The host, port and token are written to the credential
file, by default './.webapi/session', readable only by the owner. With
'--env' nothing is written; instead shell 'export' lines are printed for the
WEBAPI_HOST, WEBAPI_PORT and WEBAPI_ACCESS_TOKEN variables, which take
precedence over the credential file. The password is prompted for if not
given.
)";

static constexpr auto examples = R"(
Examples:

webapi auth -s api.example.com -U alice

webapi auth -s api.example.com -p 8443 -U alice -P secret

eval $(webapi auth -s api.example.com -U alice --env)
)";

#include "authenticator.hpp"
#include "cli_common.hpp"
#include "client_config.hpp"
#include "credential_store.hpp"
#include "credentials.hpp"
#include "https_transport.hpp"
#include "logger.hpp"
#include "utilities.hpp"

#include <CLI/CLI.hpp>

// tcgetattr, tcsetattr
#include <termios.h>
#include <unistd.h>  // for isatty, STDIN_FILENO

#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

/// Read one line from stdin; when stdin is a terminal the typed characters
/// are not echoed
[[nodiscard]] static auto
prompt_for_password(const std::string &prompt) -> std::string {
  const bool is_terminal = isatty(STDIN_FILENO) != 0;
  struct termios saved{};
  if (is_terminal) {
    std::print(std::cerr, "{}", prompt);
    if (tcgetattr(STDIN_FILENO, &saved) == 0) {
      auto no_echo = saved;
      no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
      (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &no_echo);
    }
  }
  std::string password;
  std::getline(std::cin, password);
  if (is_terminal) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
    std::println(std::cerr);
  }
  return password;
}

auto
command_auth_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto port_default = 443;
  static constexpr auto max_port = 65535;

  static constexpr auto command = "auth";
  static const auto usage =
    std::format("Usage: webapi {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("webapi {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  namespace wa = webapi;

  std::string config_dir;
  std::string credential_file;
  std::string hostname;
  std::uint16_t port{port_default};
  std::string username;
  std::string password;
  bool print_env{false};
  bool insecure{false};
  wa::log_level_t log_level{wa::logger::default_level};
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
  app.add_option("-s,--host", hostname, "server hostname")->required();
  app.add_option("-p,--port", port, "server port")
    ->option_text(std::format("INT [{}]", port_default))
    ->check(CLI::Range(1, max_port));
  app.add_option("-U,--user", username, "username")->required();
  app.add_option("-P,--pass", password, "password; prompted for if absent");
  app.add_flag("--env", print_env,
               "print shell export lines instead of writing the credential file")
    ->option_text(" ");
  app.add_flag("--insecure", insecure,
               "do not verify the server certificate")
    ->option_text(" ");
  app.add_option("-f,--credential-file", credential_file,
                 "credential file; see help for default");
  app.add_option("-c,--config-dir", config_dir,
                 "name of config directory; see help for default")
    ->option_text("TEXT")
    ->check(!CLI::ExistingFile);
  const auto log_level_opt =
    app.add_option("-v,--log-level", log_level,
                   "{debug, info, warning, error, critical}")
    ->option_text(std::format("ENUM [{}]", wa::logger::default_level))
    ->transform(CLI::CheckedTransformer(wa::str_to_level, CLI::ignore_case));
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

  std::error_code error;
  const auto cfg = load_client_config(config_dir, error);
  if (error) {
    std::println(std::cerr, "Failed to read client config: {}", error);
    return EXIT_FAILURE;
  }

  auto &lgr = wa::logger::instance(wa::shared_from_cerr(), command);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }
  wa::logger::set_level(
    select_log_level(log_level_opt, log_level, debug, quiet, cfg.log_level));

  if (credential_file.empty())
    credential_file = cfg.credential_file;
  const wa::credential_store store(appname_default, credential_file);

  std::vector<std::tuple<std::string, std::string>> args_to_log{
    // clang-format off
    {"Host", hostname},
    {"Port", std::format("{}", port)},
    {"Login path", cfg.login_path},
    {"Insecure", std::format("{}", insecure || cfg.insecure)},
    {"Output", print_env ? "environment" : store.get_credential_file()},
    // clang-format on
  };
  wa::log_args<wa::log_level_t::debug>(args_to_log);

  if (password.empty())
    password = prompt_for_password(std::format("Password for {}: ", username));

  const auto dispatcher = std::make_shared<wa::https_transport>(
    insecure || cfg.insecure, cfg.get_connect_timeout(),
    cfg.get_read_timeout());
  const wa::login_authenticator authenticator(dispatcher, cfg.login_path);
  const wa::credentials creds{hostname, port, username, password};

  const auto authenticated = creds.authenticate(authenticator, error);
  if (error) {
    lgr.error("Error: {}", error);
    return EXIT_FAILURE;
  }

  if (print_env) {
    authenticated.print_to_env(store.get_env_prefix(), std::cout);
    return EXIT_SUCCESS;
  }

  store.save(authenticated, error);
  if (error) {
    lgr.error("Error saving credentials to {}: {}",
              store.get_credential_file(), error);
    return EXIT_FAILURE;
  }
  lgr.info("Authenticated with {}:{}; credentials written to {}", hostname,
           port, store.get_credential_file());

  return EXIT_SUCCESS;
}
