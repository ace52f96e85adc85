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

#include "fake_collaborators.hpp"
#include "unit_test_utils.hpp"

#include <config_file_utils.hpp>
#include <credentials.hpp>
#include <logger.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>  // for unsetenv
#include <filesystem>
#include <format>
#include <sstream>
#include <string>
#include <system_error>

using namespace webapi;  // NOLINT

class credentials_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    test_dir = generate_unique_dir_name();
    std::filesystem::create_directories(test_dir);
    credential_file = (std::filesystem::path{test_dir} / "session").string();
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(test_dir, error);
    EXPECT_FALSE(error) << error.message();
  }

public:
  std::string test_dir;
  std::string credential_file;
  const std::string host{"www.example.com"};
  const std::uint16_t port{9999};
  const std::string token{"e30.bG9uZy10b2tlbg.c2ln"};
};

TEST_F(credentials_mock, write_then_read_file_success) {
  const authenticated_credentials creds(host, port, token);
  std::error_code error;
  creds.write_to_file(credential_file, false, error);
  ASSERT_FALSE(error) << error.message();

  const auto restored =
    authenticated_credentials::from_file(credential_file, error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(restored, creds);
  EXPECT_EQ(restored.host(), host);
  EXPECT_EQ(restored.port(), port);
  EXPECT_EQ(restored.access_token(), token);
  EXPECT_FALSE(restored.has_purge_hook());
}

TEST_F(credentials_mock, write_then_read_token_with_special_chars) {
  const std::string odd_token{"a\"b\\c d=e#f\tg"};
  const authenticated_credentials creds(host, port, odd_token);
  std::error_code error;
  creds.write_to_file(credential_file, false, error);
  ASSERT_FALSE(error) << error.message();
  const auto restored =
    authenticated_credentials::from_file(credential_file, error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(restored.access_token(), odd_token);
}

TEST_F(credentials_mock, written_file_is_key_value_document) {
  const authenticated_credentials creds(host, port, token);
  std::error_code error;
  creds.write_to_file(credential_file, false, error);
  ASSERT_FALSE(error);
  const auto contents = read_file_contents(credential_file);
  EXPECT_NE(contents.find(std::format("host = \"{}\"", host)),
            std::string::npos);
  EXPECT_NE(contents.find(std::format("port = {}", port)), std::string::npos);
  EXPECT_NE(contents.find(std::format("access_token = \"{}\"", token)),
            std::string::npos);
}

TEST_F(credentials_mock, written_file_is_owner_only) {
  namespace fs = std::filesystem;
  const authenticated_credentials creds(host, port, token);
  std::error_code error;
  creds.write_to_file(credential_file, false, error);
  ASSERT_FALSE(error);
  const auto perms = fs::status(credential_file).permissions();
  EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all),
            fs::perms::none);
  EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
  EXPECT_NE(perms & fs::perms::owner_write, fs::perms::none);
}

TEST_F(credentials_mock, write_without_parent_dir_failure) {
  const auto nested =
    (std::filesystem::path{test_dir} / "missing" / "session").string();
  const authenticated_credentials creds(host, port, token);
  std::error_code error;
  creds.write_to_file(nested, false, error);
  EXPECT_EQ(error, credential_error_code::parent_directory_missing);
  EXPECT_FALSE(std::filesystem::exists(nested));
}

TEST_F(credentials_mock, write_with_mkdir_success) {
  const auto nested =
    (std::filesystem::path{test_dir} / "a" / "b" / "session").string();
  const authenticated_credentials creds(host, port, token);
  std::error_code error;
  creds.write_to_file(nested, true, error);
  EXPECT_FALSE(error) << error.message();
  EXPECT_TRUE(std::filesystem::is_regular_file(nested));
}

TEST_F(credentials_mock, from_file_not_found) {
  std::error_code error;
  [[maybe_unused]] const auto creds = authenticated_credentials::from_file(
    (std::filesystem::path{test_dir} / "nope").string(), error);
  EXPECT_EQ(error, credential_error_code::credential_file_not_found);
}

TEST_F(credentials_mock, from_file_missing_access_token) {
  write_file_contents(credential_file,
                      "host = \"www.example.com\"\nport = 9999\n");
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_file(credential_file, error);
  EXPECT_EQ(error, credential_error_code::missing_field);
}

TEST_F(credentials_mock, from_file_invalid_port) {
  write_file_contents(credential_file, "host = \"h\"\nport = 70000\n"
                                       "access_token = \"T\"\n");
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_file(credential_file, error);
  EXPECT_EQ(error, credential_error_code::invalid_port);
}

TEST_F(credentials_mock, from_file_unparsable) {
  write_file_contents(credential_file, "this is not a key value document\n");
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_file(credential_file, error);
  EXPECT_EQ(error, credential_error_code::failed_to_parse_credential_file);
}

TEST_F(credentials_mock, from_file_ignores_comments_and_unknown_keys) {
  write_file_contents(credential_file, "# session\n"
                                       "host = \"h.example\"  # comment\n"
                                       "port = 443\n"
                                       "user = \"ignored\"\n"
                                       "access_token = \"T\"\n");
  std::error_code error;
  const auto creds =
    authenticated_credentials::from_file(credential_file, error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(creds.host(), "h.example");
  EXPECT_EQ(creds.port(), 443);
  EXPECT_EQ(creds.access_token(), "T");
}

TEST_F(credentials_mock, from_env_success) {
  const scoped_env_var h("MYAPP_HOST", host);
  const scoped_env_var p("MYAPP_PORT", std::format("{}", port));
  const scoped_env_var t("MYAPP_ACCESS_TOKEN", token);
  std::error_code error;
  // prefix is upper-cased
  const auto creds = authenticated_credentials::from_env("myapp_", error);
  ASSERT_FALSE(error) << error.message();
  EXPECT_EQ(creds, authenticated_credentials(host, port, token));
  EXPECT_FALSE(creds.has_purge_hook());
}

TEST_F(credentials_mock, from_env_missing_variable) {
  const scoped_env_var h("MYAPP_HOST", host);
  const scoped_env_var p("MYAPP_PORT", "443");
  unsetenv("MYAPP_ACCESS_TOKEN");
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_env("MYAPP_", error);
  EXPECT_EQ(error, credential_error_code::missing_field);
}

TEST_F(credentials_mock, from_env_port_not_integer) {
  const scoped_env_var h("MYAPP_HOST", host);
  const scoped_env_var p("MYAPP_PORT", "https");
  const scoped_env_var t("MYAPP_ACCESS_TOKEN", token);
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_env("MYAPP_", error);
  EXPECT_EQ(error, credential_error_code::invalid_port);
}

TEST_F(credentials_mock, from_env_port_out_of_range) {
  const scoped_env_var h("MYAPP_HOST", host);
  const scoped_env_var p("MYAPP_PORT", "0");
  const scoped_env_var t("MYAPP_ACCESS_TOKEN", token);
  std::error_code error;
  [[maybe_unused]] const auto creds =
    authenticated_credentials::from_env("MYAPP_", error);
  EXPECT_EQ(error, credential_error_code::invalid_port);
}

TEST_F(credentials_mock, print_to_env_order_and_format) {
  const authenticated_credentials creds(host, port, token);
  std::ostringstream out;
  creds.print_to_env("myapp_", out);
  const auto expected = std::format("export MYAPP_HOST={}\n"
                                    "export MYAPP_PORT={}\n"
                                    "export MYAPP_ACCESS_TOKEN={}\n",
                                    host, port, token);
  EXPECT_EQ(out.str(), expected);
}

TEST_F(credentials_mock, print_to_env_then_from_env) {
  const authenticated_credentials creds(host, port, token);
  std::ostringstream out;
  creds.print_to_env("", out);
  EXPECT_NE(out.str().find("export HOST="), std::string::npos);
  const scoped_env_var h("RT_HOST", creds.host());
  const scoped_env_var p("RT_PORT", std::format("{}", creds.port()));
  const scoped_env_var t("RT_ACCESS_TOKEN", creds.access_token());
  std::error_code error;
  const auto restored = authenticated_credentials::from_env("RT_", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(restored, creds);
}

TEST_F(credentials_mock, string_forms_mask_secrets) {
  const authenticated_credentials creds(host, port, token);
  EXPECT_EQ(creds.tostring().find(token), std::string::npos);
  EXPECT_NE(creds.tostring().find("****"), std::string::npos);
  EXPECT_EQ(std::format("{}", creds).find(token), std::string::npos);
  std::ostringstream oss;
  oss << creds;
  EXPECT_EQ(oss.str().find(token), std::string::npos);

  const credentials unauth{host, port, "alice", "hunter2"};
  EXPECT_EQ(unauth.tostring().find("hunter2"), std::string::npos);
  EXPECT_EQ(std::format("{}", unauth).find("hunter2"), std::string::npos);
}

TEST_F(credentials_mock, purge_invokes_hook_every_time) {
  authenticated_credentials creds(host, port, token);
  int n_calls{};
  creds.on_purge([&n_calls] { ++n_calls; });
  static constexpr auto n_purges = 3;
  for (auto i = 0; i < n_purges; ++i)
    creds.purge();
  EXPECT_EQ(n_calls, n_purges);
}

TEST_F(credentials_mock, purge_without_hook_does_nothing) {
  authenticated_credentials creds(host, port, token);
  EXPECT_FALSE(creds.has_purge_hook());
  EXPECT_NO_THROW({
    creds.purge();
    creds.purge();
  });
}

TEST_F(credentials_mock, equality_ignores_purge_hook) {
  authenticated_credentials a(host, port, token);
  const authenticated_credentials b(host, port, token);
  a.on_purge([] {});
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a == authenticated_credentials(host, port, "other"));
}

TEST_F(credentials_mock, authenticate_success) {
  const fake_authenticator auth{token};
  const credentials creds{host, port, "alice", "hunter2"};
  std::error_code error;
  const auto authenticated = creds.authenticate(auth, error);
  ASSERT_FALSE(error);
  EXPECT_EQ(auth.n_calls, 1);
  EXPECT_EQ(auth.last_username, "alice");
  EXPECT_EQ(authenticated, authenticated_credentials(host, port, token));
}

TEST_F(credentials_mock, authenticate_failure) {
  const fake_authenticator auth{
    {}, std::make_error_code(std::errc::connection_refused)};
  const credentials creds{host, port, "alice", "hunter2"};
  std::error_code error;
  [[maybe_unused]] const auto authenticated = creds.authenticate(auth, error);
  EXPECT_EQ(error, credential_error_code::authentication_failed);
  EXPECT_EQ(auth.n_calls, 1);
}

TEST_F(credentials_mock, authenticate_throws_on_failure) {
  const fake_authenticator auth{{}, make_http_status_error(401)};
  const credentials creds{host, port, "alice", "hunter2"};
  EXPECT_THROW({ [[maybe_unused]] const auto a = creds.authenticate(auth); },
               std::system_error);
}

TEST_F(credentials_mock, throwing_from_file_not_found) {
  EXPECT_THROW(
    {
      [[maybe_unused]] const auto c = authenticated_credentials::from_file(
        (std::filesystem::path{test_dir} / "nope").string());
    },
    std::system_error);
}
