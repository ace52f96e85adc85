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

#include <chrono>
#include <cstdlib>  // for setenv, unsetenv, std::getenv
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

[[nodiscard]] auto
generate_temp_filename(const std::string &prefix,
                       const std::string &suffix) -> std::string {
  static constexpr auto min_fn_suff = 1000;
  static constexpr auto max_fn_suff = 9999;
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(min_fn_suff, max_fn_suff);
  const auto filename =
    std::format("{}_{}_{}{}", prefix, millis, dis(gen),
                (suffix.empty() || suffix[0] == '.') ? suffix : "." + suffix);
  return (std::filesystem::temp_directory_path() / filename).string();
}

[[nodiscard]] auto
generate_unique_dir_name() -> std::string {
  static constexpr auto test_dir_prefix = "test_dir_";
  static constexpr auto min_fn_suff = 1000;
  static constexpr auto max_fn_suff = 9999;
  // Generate a random string based on current time and random numbers
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(min_fn_suff, max_fn_suff);
  return (std::filesystem::temp_directory_path() /
          (test_dir_prefix + std::to_string(now) + "_" +
           std::to_string(dis(gen))))
    .string();
}

auto
remove_directories(const std::string &dirname, std::error_code &error) -> void {
  const auto dir_exists = std::filesystem::exists(dirname, error);
  if (error || !dir_exists)
    return;
  const auto dir_is_dir = std::filesystem::is_directory(dirname, error);
  if (error || !dir_is_dir)
    return;
  [[maybe_unused]] const auto n_removed =
    std::filesystem::remove_all(dirname, error);
}

[[nodiscard]] auto
read_file_contents(const std::string &filename) -> std::string {
  std::ifstream in(filename);
  if (!in)
    throw std::runtime_error(std::format("failed to open: {}", filename));
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

auto
write_file_contents(const std::string &filename,
                    const std::string &contents) -> void {
  std::ofstream out(filename);
  if (!out)
    throw std::runtime_error(std::format("failed to open: {}", filename));
  out << contents;
}

scoped_env_var::scoped_env_var(std::string name, const std::string &value) :
  name{std::move(name)} {
  if (const char *prev = std::getenv(this->name.data()); prev != nullptr) {
    previous = prev;
    had_previous = true;
  }
  setenv(this->name.data(), value.data(), 1);
}

scoped_env_var::~scoped_env_var() {
  if (had_previous)
    setenv(name.data(), previous.data(), 1);
  else
    unsetenv(name.data());
}
