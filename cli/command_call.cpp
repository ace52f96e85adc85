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

#include "command_call.hpp"

static constexpr auto about = R"(
make an authenticated request
)";

static constexpr auto description = R"(
Send one HTTP request to the host and port of the stored credentials, with
the access token applied. Credentials come from the WEBAPI_HOST, WEBAPI_PORT
and WEBAPI_ACCESS_TOKEN environment variables if all are set, and otherwise
from the credential file written by the 'auth' command. The body is inline
JSON, or '@' followed by the name of a file holding JSON. The response body
goes to stdout. Any status other than 200 is an error; a 401 also removes
the stored credential file, after which 'auth' must be run again.
)";

static constexpr auto examples = R"(
Examples:

webapi call GET /users

webapi call post /users -B '{"name": "alice", "age": 19}' --pretty

webapi call PUT /users/7 -H 'If-Match: abc' -B @user.json

webapi call DELETE /users/7 --curl
)";

#include "caller.hpp"
#include "cli_common.hpp"
#include "client_config.hpp"
#include "credential_applier.hpp"
#include "credential_store.hpp"
#include "http_header.hpp"
#include "http_method.hpp"
#include "http_response.hpp"
#include "https_transport.hpp"
#include "logger.hpp"
#include "request_error_code.hpp"
#include "utilities.hpp"

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

[[nodiscard]] static auto
parse_header_args(const std::vector<std::string> &args,
                  std::error_code &error) -> webapi::http_headers {
  webapi::http_headers headers;
  for (const auto &arg : args) {
    auto [name, value] = webapi::split_key_value(arg, error);
    if (error || !webapi::is_valid_header_field(name, value)) {
      webapi::logger::instance().error(
        "Invalid header (need 'Key: Value' without control characters)");
      error = request_error_code::invalid_header;
      return {};
    }
    headers.emplace_back(std::move(name), std::move(value));
  }
  return headers;
}

[[nodiscard]] static auto
parse_body_arg(const std::string &arg, std::error_code &error)
  -> std::optional<nlohmann::json> {
  if (arg.empty())
    return std::nullopt;
  const auto text = webapi::read_file_if_starts_with_at(arg, error);
  if (error) {
    webapi::logger::instance().error("Failed to read body from {}: {}", arg,
                                     error);
    return std::nullopt;
  }
  auto body = nlohmann::json::parse(text, nullptr, false);
  if (body.is_discarded()) {
    webapi::logger::instance().error("Body is not valid JSON");
    error = request_error_code::invalid_body;
    return std::nullopt;
  }
  return body;
}

static auto
print_response_body(const webapi::http_response &response, const bool pretty) {
  static constexpr auto n_indent = 2;
  if (pretty && response.is_json()) {
    const auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (!data.is_discarded()) {
      std::println("{}", data.dump(n_indent));
      return;
    }
  }
  std::print("{}", response.body);
  if (!response.body.empty() && !response.body.ends_with('\n'))
    std::println();
}

auto
command_call_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto command = "call";
  static const auto usage =
    std::format("Usage: webapi {} [options] METHOD PATH", rstrip(command));
  static const auto about_msg =
    std::format("webapi {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  namespace wa = webapi;

  std::string config_dir;
  std::string credential_file;
  wa::http_method method{};
  std::string path;
  std::vector<std::string> header_args;
  std::string body_arg;
  bool show_curl{false};
  bool show_header{false};
  bool pretty{false};
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
  app.add_option("METHOD", method, "{GET, POST, PUT, PATCH, DELETE}")
    ->required()
    ->option_text("ENUM")
    ->transform(CLI::CheckedTransformer(wa::http_method_cli11, CLI::ignore_case));
  app.add_option("PATH", path, "request path, starting with '/'")->required();
  app.add_option("-H,--header", header_args,
                 "request header as 'Key: Value' (repeatable)");
  app.add_option("-B,--body", body_arg, "JSON body, or @file to read it");
  app.add_flag("--curl", show_curl,
               "print an equivalent curl command and exit")
    ->option_text(" ");
  app.add_flag("--show-header", show_header,
               "print status line and response headers to stderr")
    ->option_text(" ");
  app.add_flag("--pretty", pretty, "indent a JSON response")
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

  const auto headers = parse_header_args(header_args, error);
  if (error)
    return EXIT_FAILURE;

  const auto body = parse_body_arg(body_arg, error);
  if (error)
    return EXIT_FAILURE;

  if (credential_file.empty())
    credential_file = cfg.credential_file;
  const wa::credential_store store(appname_default, credential_file);
  auto creds = store.resolve(error);
  if (error) {
    lgr.error("Error: {}", error);
    return EXIT_FAILURE;
  }

  const auto dispatcher = std::make_shared<wa::https_transport>(
    insecure || cfg.insecure, cfg.get_connect_timeout(),
    cfg.get_read_timeout());
  wa::caller c(std::move(creds),
               std::make_shared<wa::bearer_credential_applier>(), dispatcher);

  const auto req = c.request(method, path, headers, body, error);
  if (error) {
    lgr.error("Error: {} ({})", error, path);
    return EXIT_FAILURE;
  }

  if (show_curl) {
    std::println("{}", wa::to_shell_command(req.similar_of_curl()));
    return EXIT_SUCCESS;
  }

  const auto response = req.invoke(error);
  if (error && error.category() != wa::http_status_category()) {
    lgr.error("Error: {}", error);
    return EXIT_FAILURE;
  }

  if (show_header || error) {
    std::println(std::cerr, "{} {}", response.status_code, response.reason);
    if (show_header)
      for (const auto &[name, value] : response.headers)
        std::println(std::cerr, "{}: {}", name, value);
  }
  print_response_body(response, pretty);

  if (wa::is_unauthorized(error)) {
    lgr.warning("Access token rejected; run 'webapi auth' again");
    c.get_credentials().purge();
  }
  return error ? EXIT_FAILURE : EXIT_SUCCESS;
}
