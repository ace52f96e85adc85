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

#ifndef LIB_TESTS_UNIT_TEST_UTILS_HPP_
#define LIB_TESTS_UNIT_TEST_UTILS_HPP_

#include <string>
#include <system_error>

[[nodiscard]] auto
generate_temp_filename(const std::string &prefix,
                       const std::string &suffix = "") -> std::string;

[[nodiscard]] auto
generate_unique_dir_name() -> std::string;

auto
remove_directories(const std::string &dirname, std::error_code &error) -> void;

[[nodiscard]] auto
read_file_contents(const std::string &filename) -> std::string;

auto
write_file_contents(const std::string &filename,
                    const std::string &contents) -> void;

/// Set an environment variable for the lifetime of the object; the
/// previous value (or absence) is restored on destruction
class scoped_env_var {
public:
  scoped_env_var(std::string name, const std::string &value);
  ~scoped_env_var();
  scoped_env_var(const scoped_env_var &) = delete;
  auto
  operator=(const scoped_env_var &) -> scoped_env_var & = delete;

private:
  std::string name;
  std::string previous;
  bool had_previous{false};
};

#endif  // LIB_TESTS_UNIT_TEST_UTILS_HPP_
