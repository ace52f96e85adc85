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

#include <config_file_utils.hpp>

#include <boost/describe.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

using namespace webapi;  // NOLINT

struct sample_record {
  std::string name;
  std::int32_t count{};
  std::string note;
};
BOOST_DESCRIBE_STRUCT(sample_record, (), (name, count, note))

TEST(config_file_utils_test, split_equals_success) {
  std::error_code error;
  const auto [k, v] = split_equals(" key =  \"a = b\" ", error);
  EXPECT_FALSE(error);
  EXPECT_EQ(k, "key");
  EXPECT_EQ(v, "\"a = b\"");
}

TEST(config_file_utils_test, split_equals_failure) {
  std::error_code error;
  [[maybe_unused]] const auto kv1 = split_equals("no equals here", error);
  EXPECT_TRUE(error);
  error.clear();
  [[maybe_unused]] const auto kv2 = split_equals("key =", error);
  EXPECT_TRUE(error);
}

TEST(config_file_utils_test, quote_and_unquote) {
  const std::string raw{"say \"hi\"\\\n\t\x01"};
  const auto quoted = quote_value(raw);
  EXPECT_EQ(quoted, R"("say \"hi\"\\\n\t\u0001")");
  std::error_code error;
  EXPECT_EQ(unquote_value(quoted, error), raw);
  EXPECT_FALSE(error);
}

TEST(config_file_utils_test, unquote_bare_and_comments) {
  std::error_code error;
  EXPECT_EQ(unquote_value("443  # https", error), "443");
  EXPECT_EQ(unquote_value("\"x\" # note", error), "x");
  EXPECT_FALSE(error);
}

TEST(config_file_utils_test, unquote_malformed) {
  std::error_code error;
  [[maybe_unused]] const auto a = unquote_value("\"unterminated", error);
  EXPECT_TRUE(error);
  error.clear();
  [[maybe_unused]] const auto b = unquote_value("\"x\" junk", error);
  EXPECT_TRUE(error);
  error.clear();
  [[maybe_unused]] const auto c = unquote_value(R"("\q")", error);
  EXPECT_TRUE(error);
}

TEST(config_file_utils_test, write_then_parse_described_struct) {
  const auto filename = generate_temp_filename("record", "toml");
  const sample_record rec{"alpha beta", 42, "#not a comment"};
  ASSERT_FALSE(write_config_file(rec, filename));

  sample_record restored;
  std::error_code error;
  const auto missing = parse_config_file(restored, filename, error);
  EXPECT_FALSE(error) << error.message();
  EXPECT_TRUE(missing.empty());
  EXPECT_EQ(restored.name, rec.name);
  EXPECT_EQ(restored.count, rec.count);
  EXPECT_EQ(restored.note, rec.note);
  std::filesystem::remove(filename);
}

TEST(config_file_utils_test, parse_reports_missing_members) {
  const auto filename = generate_temp_filename("record", "toml");
  write_file_contents(filename, "# partial\nname = \"n\"\nextra = 1\n");
  sample_record rec;
  std::error_code error;
  const auto missing = parse_config_file(rec, filename, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(rec.name, "n");
  ASSERT_EQ(std::size(missing), 2u);
  EXPECT_EQ(missing[0], "count");
  EXPECT_EQ(missing[1], "note");
  std::filesystem::remove(filename);
}

TEST(config_file_utils_test, parse_rejects_bad_number) {
  const auto filename = generate_temp_filename("record", "toml");
  write_file_contents(filename, "count = 12abc\n");
  sample_record rec;
  std::error_code error;
  [[maybe_unused]] const auto missing = parse_config_file(rec, filename, error);
  EXPECT_EQ(error, std::errc::invalid_argument);
  std::filesystem::remove(filename);
}

TEST(config_file_utils_test, parse_missing_file) {
  sample_record rec;
  std::error_code error;
  [[maybe_unused]] const auto missing = parse_config_file(
    rec, generate_temp_filename("does_not_exist", "toml"), error);
  EXPECT_TRUE(error);
}
