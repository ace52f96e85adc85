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

#include <utilities.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

using namespace webapi;  // NOLINT

TEST(utilities_test, split_key_value_success) {
  std::error_code error;
  const auto [key, value] = split_key_value("  Foo : bar: baz ", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(key, "Foo");
  EXPECT_EQ(value, "bar: baz");
}

TEST(utilities_test, split_key_value_keeps_non_ascii) {
  std::error_code error;
  const auto [key, value] = split_key_value("X-User: Jos\xC3\xA9", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(key, "X-User");
  EXPECT_EQ(value, "Jos\xC3\xA9");
  EXPECT_EQ(std::size(value), 5u);
}

TEST(utilities_test, rlstrip_keeps_non_ascii_at_both_ends) {
  EXPECT_EQ(rlstrip(" \xC3\xA9t\xC3\xA9\r\n"), "\xC3\xA9t\xC3\xA9");
  EXPECT_EQ(rlstrip("\f\vx\v"), "x");
}

TEST(utilities_test, split_key_value_no_colon) {
  std::error_code error;
  [[maybe_unused]] const auto kv = split_key_value("Foo bar", error);
  EXPECT_EQ(error, std::errc::invalid_argument);
}

TEST(utilities_test, string_helpers) {
  EXPECT_EQ(rlstrip("\t a b \n"), "a b");
  EXPECT_EQ(rlstrip("   "), "");
  EXPECT_EQ(to_upper("my_app"), "MY_APP");
  EXPECT_EQ(to_lower("GeT"), "get");
  EXPECT_TRUE(iequals("Content-Type", "content-type"));
  EXPECT_FALSE(iequals("Content-Type", "content-typ"));
  EXPECT_EQ(join_with(std::vector<std::string>{"a", "b", "c"}, ','), "a,b,c");
}

TEST(utilities_test, read_inline_text) {
  std::error_code error;
  EXPECT_EQ(read_file_if_starts_with_at(R"({"a": 1})", error), R"({"a": 1})");
  EXPECT_FALSE(error);
}

TEST(utilities_test, read_file_with_at) {
  const auto filename = generate_temp_filename("body", "json");
  write_file_contents(filename, R"({"name": "alice"})");
  std::error_code error;
  const auto text = read_file_if_starts_with_at("@" + filename, error);
  EXPECT_FALSE(error) << error.message();
  EXPECT_EQ(text, R"({"name": "alice"})");
  std::filesystem::remove(filename);
}

TEST(utilities_test, read_missing_file_with_at) {
  const auto filename = generate_temp_filename("missing", "json");
  std::error_code error;
  [[maybe_unused]] const auto text =
    read_file_if_starts_with_at("@" + filename, error);
  EXPECT_EQ(error, std::errc::no_such_file_or_directory);
}

TEST(utilities_test, read_directory_with_at) {
  std::error_code error;
  [[maybe_unused]] const auto text = read_file_if_starts_with_at(
    "@" + std::filesystem::temp_directory_path().string(), error);
  EXPECT_EQ(error, std::errc::is_a_directory);
}
