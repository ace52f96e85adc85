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

#include "command_env.hpp"

static constexpr auto about = R"(
print version and build information
)";

static constexpr auto description = R"(
Print the program version, the compiler and language standard it was built
with, and the versions of the libraries it was built against. Also print
where credentials are looked for: the environment variables, then the
credential file.
)";

#include "cli_common.hpp"
#include "credential_store.hpp"
#include "environment_utilities.hpp"
#include "utilities.hpp"

#include <config.h>

#include <CLI/CLI.hpp>

#include <asio/version.hpp>
#include <boost/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/opensslv.h>

#include <cstdlib>
#include <format>
#include <memory>
#include <print>
#include <string>

auto
command_env_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto asio_version_major = ASIO_VERSION / 100000;
  static constexpr auto asio_version_minor = ASIO_VERSION / 100 % 1000;
  static constexpr auto asio_version_patch = ASIO_VERSION % 100;
  static constexpr auto boost_version_major = BOOST_VERSION / 100000;
  static constexpr auto boost_version_minor = BOOST_VERSION / 100 % 1000;

  static constexpr auto command = "env";
  static const auto usage =
    std::format("Usage: webapi {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("webapi {}: {}", rstrip(command), rstrip(about));

  namespace wa = webapi;

  std::string credential_file;

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  app.usage(usage);
  app.footer(std::string(rstrip(description)));
  app.formatter(std::make_shared<webapi_formatter>());
  app.get_formatter()->column_width(column_width_default);
  app.set_help_flag("-h,--help", "Print a detailed help message and exit");
  app.add_option("-f,--credential-file", credential_file,
                 "credential file; see help for default");
  CLI11_PARSE(app, argc, argv);

  const wa::credential_store store(appname_default, credential_file);
  const auto prefix = store.get_env_prefix();

  // clang-format off
  std::println("{} version: {}", PROJECT_NAME, wa::get_version());
  std::println("Compiler: {}", __VERSION__);
  std::println("C++ standard: {}", __cplusplus);
  std::println("Asio: {}.{}.{}", asio_version_major, asio_version_minor,
               asio_version_patch);
  std::println("OpenSSL: {}", OPENSSL_VERSION_TEXT);
  std::println("nlohmann/json: {}.{}.{}", NLOHMANN_JSON_VERSION_MAJOR,
               NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH);
  std::println("CLI11: {}", CLI11_VERSION);
  std::println("Boost: {}.{}", boost_version_major, boost_version_minor);
  std::println("Credential variables: {0}HOST, {0}PORT, {0}ACCESS_TOKEN",
               prefix);
  std::println("Credential file: {}", store.get_credential_file());
  // clang-format on

  return EXIT_SUCCESS;
}
