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

#ifndef LIB_CREDENTIALS_HPP_
#define LIB_CREDENTIALS_HPP_

#include <boost/describe.hpp>

#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace webapi {

class authenticator;
class authenticated_credentials;

/// Connection target plus username and password. Exists only to be
/// exchanged for an access token; it is never written anywhere.
struct credentials {
  std::string host;
  std::uint16_t port{};
  std::string username;
  std::string password;

  /// Exchange the username and password for an access token through the
  /// given authenticator. Any failure of the authenticator is reported as
  /// credential_error_code::authentication_failed and is not retried.
  [[nodiscard]] auto
  authenticate(const authenticator &auth, std::error_code &error) const
    -> authenticated_credentials;

#ifndef WEBAPI_NOEXCEPT
  [[nodiscard]] auto
  authenticate(const authenticator &auth) const -> authenticated_credentials;
#endif

  /// The password is shown as "****"
  [[nodiscard]] auto
  tostring() const -> std::string;
};

/// Connection target plus an opaque access token. Host and port are fixed at
/// construction. A purge hook, if attached, removes whatever persisted copy
/// this object was read from.
class authenticated_credentials {
public:
  using purge_hook = std::function<void()>;

  static constexpr auto masked_token = "****";
  static constexpr auto default_port = 443;

  authenticated_credentials() = default;
  authenticated_credentials(std::string host, const std::uint16_t port,
                            std::string access_token) :
    host_{std::move(host)}, port_{port}, access_token_{std::move(access_token)} {}

  [[nodiscard]] auto
  host() const noexcept -> const std::string & {
    return host_;
  }

  [[nodiscard]] auto
  port() const noexcept -> std::uint16_t {
    return port_;
  }

  [[nodiscard]] auto
  access_token() const noexcept -> const std::string & {
    return access_token_;
  }

  /// Attach the removal hook (replaces any earlier one)
  auto
  on_purge(purge_hook hook) -> authenticated_credentials & {
    on_purge_ = std::move(hook);
    return *this;
  }

  [[nodiscard]] auto
  has_purge_hook() const noexcept -> bool {
    return static_cast<bool>(on_purge_);
  }

  /// Run the purge hook. Every call runs it again; with no hook attached
  /// this does nothing.
  auto
  purge() -> authenticated_credentials &;

  /// Write host, port and access token as a key/value document readable by
  /// owner only. Without `mkdir` a missing parent directory is an error.
  auto
  write_to_file(const std::string &path, const bool mkdir,
                std::error_code &error) const noexcept -> void;

  /// The result has no purge hook attached
  [[nodiscard]] static auto
  from_file(const std::string &path, std::error_code &error) noexcept
    -> authenticated_credentials;

  /// Read {prefix}HOST, {prefix}PORT and {prefix}ACCESS_TOKEN. The prefix
  /// is upper-cased and must not contain whitespace.
  [[nodiscard]] static auto
  from_env(const std::string &prefix, std::error_code &error) noexcept
    -> authenticated_credentials;

  /// Write "export {prefix}HOST=...", then PORT and ACCESS_TOKEN, one per
  /// line, for use with a shell `eval`
  auto
  print_to_env(const std::string &prefix, std::ostream &out) const
    -> const authenticated_credentials &;

#ifndef WEBAPI_NOEXCEPT
  auto
  write_to_file(const std::string &path, const bool mkdir = false) const
    -> const authenticated_credentials & {
    std::error_code error;
    write_to_file(path, mkdir, error);
    if (error)
      throw std::system_error(error, std::format("[path: {}]", path));
    return *this;
  }

  [[nodiscard]] static auto
  from_file(const std::string &path) -> authenticated_credentials {
    std::error_code error;
    auto obj = from_file(path, error);
    if (error)
      throw std::system_error(error, std::format("[path: {}]", path));
    return obj;
  }

  [[nodiscard]] static auto
  from_env(const std::string &prefix) -> authenticated_credentials {
    std::error_code error;
    auto obj = from_env(prefix, error);
    if (error)
      throw std::system_error(error, std::format("[prefix: {}]", prefix));
    return obj;
  }
#endif

  /// The access token is shown as "****"
  [[nodiscard]] auto
  tostring() const -> std::string;

  /// Compares host, port and access token; the purge hook is not part of
  /// the value
  [[nodiscard]] auto
  operator==(const authenticated_credentials &other) const -> bool {
    return host_ == other.host_ && port_ == other.port_ &&
           access_token_ == other.access_token_;
  }

private:
  std::string host_;
  std::uint16_t port_{};
  std::string access_token_;
  purge_hook on_purge_;
};

/// Layout of the persisted key/value document and of the environment
/// variables; the port is kept wide so out of range values can be reported
struct credential_record {
  std::string host;
  std::int64_t port{};
  std::string access_token;
};
BOOST_DESCRIBE_STRUCT(credential_record, (), (host, port, access_token))

}  // namespace webapi

template <>
struct std::formatter<webapi::authenticated_credentials>
  : std::formatter<std::string> {
  auto
  format(const webapi::authenticated_credentials &c,
         std::format_context &ctx) const {
    return std::formatter<std::string>::format(c.tostring(), ctx);
  }
};

template <>
struct std::formatter<webapi::credentials> : std::formatter<std::string> {
  auto
  format(const webapi::credentials &c, std::format_context &ctx) const {
    return std::formatter<std::string>::format(c.tostring(), ctx);
  }
};

inline auto
operator<<(std::ostream &o, const webapi::authenticated_credentials &c)
  -> std::ostream & {
  return o << c.tostring();
}

/// @brief Enum for error codes related to credentials
enum class credential_error_code : std::uint8_t {
  ok = 0,
  not_authenticated = 1,
  missing_field = 2,
  credential_file_not_found = 3,
  invalid_port = 4,
  parent_directory_missing = 5,
  failed_to_write_credential_file = 6,
  failed_to_parse_credential_file = 7,
  authentication_failed = 8,
};

template <>
struct std::is_error_code_enum<credential_error_code> : public std::true_type {
};

struct credential_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "credentials";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "not yet authenticated; authenticate with the 'auth' command first"s;
    case 2: return "credential is missing a required field"s;
    case 3: return "credential file not found"s;
    case 4: return "port is not an integer in 1-65535"s;
    case 5: return "parent directory of credential file does not exist"s;
    case 6: return "failed to write credential file"s;
    case 7: return "failed to parse credential file"s;
    case 8: return "authentication failed"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(credential_error_code e) -> std::error_code {
  static auto category = credential_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_CREDENTIALS_HPP_
