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

#include <command_auth.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdlib>  // for EXIT_FAILURE
#include <filesystem>
#include <string>
#include <system_error>

TEST(command_auth_test, insecure_login_to_closed_port) {
  const auto config_dir = generate_unique_dir_name();
  const auto credential_file =
    (std::filesystem::path{config_dir} / "session").string();
  // nothing listens on port 1, so the login fails after option parsing
  const auto argv = std::array{
    "auth", "-s", "127.0.0.1", "-p", "1", "-U", "user", "-P", "pass",
    "--insecure", "-f", credential_file.c_str(), "-c", config_dir.c_str(),
    "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_auth_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_FAILURE);
  EXPECT_FALSE(std::filesystem::exists(credential_file));

  std::error_code error;
  remove_directories(config_dir, error);
  EXPECT_FALSE(error);
}
