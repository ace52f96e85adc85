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

#include <command_call.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdlib>  // for EXIT_SUCCESS, EXIT_FAILURE
#include <string>
#include <system_error>

class command_call_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    config_dir = generate_unique_dir_name();
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(config_dir, error);
    EXPECT_FALSE(error) << error.message();
  }

public:
  std::string config_dir;
};

TEST_F(command_call_mock, curl_from_env_credentials) {
  const scoped_env_var host("WEBAPI_HOST", "api.example.com");
  const scoped_env_var port("WEBAPI_PORT", "8443");
  const scoped_env_var token("WEBAPI_ACCESS_TOKEN", "tok");

  const auto argv = std::array{
    "call",  "post", "/users", "-B", R"({"name": "alice"})",
    "--curl", "-c",  config_dir.c_str(), "-v", "error",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_SUCCESS);
}

TEST_F(command_call_mock, missing_credentials) {
  const auto missing_file = generate_temp_filename("session");
  const auto argv = std::array{
    "call", "GET", "/users", "-f", missing_file.c_str(),
    "-c",   config_dir.c_str(), "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST_F(command_call_mock, path_without_leading_slash) {
  const scoped_env_var host("WEBAPI_HOST", "api.example.com");
  const scoped_env_var port("WEBAPI_PORT", "443");
  const scoped_env_var token("WEBAPI_ACCESS_TOKEN", "tok");

  const auto argv = std::array{
    "call", "GET", "users", "--curl", "-c", config_dir.c_str(), "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST_F(command_call_mock, malformed_header) {
  const scoped_env_var host("WEBAPI_HOST", "api.example.com");
  const scoped_env_var port("WEBAPI_PORT", "443");
  const scoped_env_var token("WEBAPI_ACCESS_TOKEN", "tok");

  const auto argv = std::array{
    "call", "GET", "/users", "-H", "no-colon-here",
    "--curl", "-c", config_dir.c_str(), "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST_F(command_call_mock, header_with_line_break) {
  const scoped_env_var host("WEBAPI_HOST", "api.example.com");
  const scoped_env_var port("WEBAPI_PORT", "443");
  const scoped_env_var token("WEBAPI_ACCESS_TOKEN", "tok");

  const auto argv = std::array{
    "call", "GET", "/users", "-H", "X-A: b\r\nX-Injected: c",
    "--curl", "-c", config_dir.c_str(), "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST_F(command_call_mock, body_not_json) {
  const scoped_env_var host("WEBAPI_HOST", "api.example.com");
  const scoped_env_var port("WEBAPI_PORT", "443");
  const scoped_env_var token("WEBAPI_ACCESS_TOKEN", "tok");

  const auto argv = std::array{
    "call", "PUT", "/users/7", "-B", "{not json",
    "--curl", "-c", config_dir.c_str(), "-v", "critical",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result = command_call_main(argc, const_cast<char **>(argv.data()));
  EXPECT_EQ(result, EXIT_FAILURE);
}
