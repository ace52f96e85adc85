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

#include "unit_test_utils.hpp"

#include <credential_store.hpp>
#include <credentials.hpp>
#include <logger.hpp>

#include <gtest/gtest.h>

#include <cstdlib>  // for unsetenv
#include <filesystem>
#include <string>
#include <system_error>

using namespace webapi;  // NOLINT

class credential_store_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    test_dir = generate_unique_dir_name();
    std::filesystem::create_directories(test_dir);
    credential_file = (std::filesystem::path{test_dir} / "session").string();
    unsetenv("STORETEST_HOST");
    unsetenv("STORETEST_PORT");
    unsetenv("STORETEST_ACCESS_TOKEN");
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(test_dir, error);
    EXPECT_FALSE(error) << error.message();
  }

  auto
  write_file_credentials() const -> void {
    const authenticated_credentials creds(file_host, 443, file_token);
    creds.write_to_file(credential_file);
  }

public:
  static constexpr auto appname = "storetest";
  std::string test_dir;
  std::string credential_file;
  const std::string file_host{"file.example.com"};
  const std::string file_token{"file-token"};
};

TEST(credential_store_test, well_known_path_and_prefix) {
  EXPECT_EQ(credential_store::well_known_path("webapi"), "./.webapi/session");
  EXPECT_EQ(credential_store::env_prefix("webapi"), "WEBAPI_");
  const credential_store store("webapi");
  EXPECT_EQ(store.get_credential_file(), "./.webapi/session");
  EXPECT_EQ(store.get_env_prefix(), "WEBAPI_");
}

TEST_F(credential_store_mock, neither_source_not_authenticated) {
  const credential_store store(appname, credential_file);
  std::error_code error;
  [[maybe_unused]] const auto creds = store.resolve(error);
  EXPECT_EQ(error, credential_error_code::not_authenticated);
}

TEST_F(credential_store_mock, neither_source_throws) {
  const credential_store store(appname, credential_file);
  EXPECT_THROW({ [[maybe_unused]] const auto c = store.resolve(); },
               std::system_error);
}

TEST_F(credential_store_mock, environment_wins_over_file) {
  write_file_credentials();
  const scoped_env_var h("STORETEST_HOST", "env.example.com");
  const scoped_env_var p("STORETEST_PORT", "8443");
  const scoped_env_var t("STORETEST_ACCESS_TOKEN", "env-token");
  const credential_store store(appname, credential_file);
  std::error_code error;
  auto creds = store.resolve(error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(creds, authenticated_credentials("env.example.com", 8443,
                                             "env-token"));
  // env-backed credentials have nothing to remove
  creds.purge();
  EXPECT_TRUE(std::filesystem::exists(credential_file));
}

TEST_F(credential_store_mock, partial_environment_falls_back_to_file) {
  write_file_credentials();
  const scoped_env_var h("STORETEST_HOST", "env.example.com");
  const credential_store store(appname, credential_file);
  std::error_code error;
  const auto creds = store.resolve(error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(creds.host(), file_host);
  EXPECT_EQ(creds.access_token(), file_token);
  EXPECT_TRUE(creds.has_purge_hook());
}

TEST_F(credential_store_mock, invalid_env_port_is_an_error) {
  write_file_credentials();
  const scoped_env_var h("STORETEST_HOST", "env.example.com");
  const scoped_env_var p("STORETEST_PORT", "not-a-port");
  const scoped_env_var t("STORETEST_ACCESS_TOKEN", "env-token");
  const credential_store store(appname, credential_file);
  std::error_code error;
  [[maybe_unused]] const auto creds = store.resolve(error);
  EXPECT_EQ(error, credential_error_code::invalid_port);
}

TEST_F(credential_store_mock, purge_removes_credential_file) {
  write_file_credentials();
  const credential_store store(appname, credential_file);
  std::error_code error;
  auto creds = store.resolve(error);
  ASSERT_FALSE(error);
  ASSERT_TRUE(std::filesystem::exists(credential_file));
  creds.purge();
  EXPECT_FALSE(std::filesystem::exists(credential_file));
  // file already gone
  EXPECT_NO_THROW(creds.purge());
}

TEST_F(credential_store_mock, save_then_resolve) {
  const auto nested =
    (std::filesystem::path{test_dir} / ".storetest" / "session").string();
  const credential_store store(appname, nested);
  const authenticated_credentials creds("h.example.com", 9999, "T");
  std::error_code error;
  store.save(creds, error);
  ASSERT_FALSE(error) << error.message();
  const auto resolved = store.resolve(error);
  ASSERT_FALSE(error);
  EXPECT_EQ(resolved, creds);
}

TEST_F(credential_store_mock, malformed_file_is_an_error) {
  write_file_contents(credential_file, "host = \"h\"\nport = 1\n");
  const credential_store store(appname, credential_file);
  std::error_code error;
  [[maybe_unused]] const auto creds = store.resolve(error);
  EXPECT_EQ(error, credential_error_code::missing_field);
}
