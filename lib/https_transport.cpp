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

#include "https_transport.hpp"

#include "format_error_code.hpp"  // IWYU pragma: keep
#include "http_error_code.hpp"
#include "logger.hpp"
#include "request_error_code.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>  // IWYU pragma: keep

#include <openssl/ssl.h>

#include <chrono>
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

namespace webapi {

using std::string_view_literals::operator""sv;

class https_exchange {
public:
  https_exchange(asio::ssl::context &ssl_context, std::string host,
                 std::string port, std::string request,
                 const std::chrono::seconds connect_timeout,
                 const std::chrono::seconds read_timeout) :
    resolver{ioc}, sock{ioc, ssl_context}, host{std::move(host)},
    port{std::move(port)}, request{std::move(request)},
    connect_timeout{connect_timeout}, read_timeout{read_timeout},
    watchdog_timer{ioc} {}

  auto
  run(const bool verify_peer) -> void {
    // SNI
    if (!SSL_set_tlsext_host_name(sock.native_handle(), host.c_str())) {
      status = http_error_code::handshake_failed;
      return;
    }
    if (verify_peer) {
      sock.set_verify_mode(asio::ssl::verify_peer);
      sock.set_verify_callback(asio::ssl::host_name_verification(host));
    }
    else
      sock.set_verify_mode(asio::ssl::verify_none);
    resolve();
    ioc.run();
  }

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

  [[nodiscard]] auto
  get_header() const -> const http_header & {
    return header;
  }

  [[nodiscard]] auto
  take_body() -> std::string {
    return std::move(buf);
  }

private:
  auto
  reset_deadline(const std::chrono::seconds d) -> void {
    deadline = std::chrono::steady_clock::now() + d;
  }

  auto
  watchdog() -> void {
    watchdog_timer.expires_at(deadline);
    watchdog_timer.async_wait([this](auto) {
      if (!is_stopped()) {
        if (deadline < std::chrono::steady_clock::now())
          stop(http_error_code::inactive_timeout);
        else
          watchdog();
      }
    });
  }

  [[nodiscard]] auto
  is_stopped() const -> bool {
    return !sock.lowest_layer().is_open();
  }

  auto
  stop(const std::error_code ec) -> void {
    status = ec;
    std::error_code shutdown_ec;
    (void)sock.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both,
                                       shutdown_ec);
    (void)sock.lowest_layer().close(shutdown_ec);
    watchdog_timer.cancel();
  }

  auto
  resolve() -> void {
    reset_deadline(connect_timeout);
    resolver.async_resolve(host, port, [this](const auto ec, const auto res) {
      if (ec)
        stop(http_error_code::connect_failed);
      else
        connect(res);
    });
  }

  auto
  connect(const asio::ip::tcp::resolver::results_type &resolved) -> void {
    asio::async_connect(sock.lowest_layer(), resolved,
                        [this](const auto ec, auto) {
                          if (ec)
                            stop(http_error_code::connect_failed);
                          else
                            handshake();
                        });
    watchdog();
  }

  auto
  handshake() -> void {
    reset_deadline(connect_timeout);
    sock.async_handshake(asio::ssl::stream_base::client, [this](const auto ec) {
      if (ec) {
        logger::instance().debug("TLS handshake with {} failed: {}", host,
                                 ec.message());
        stop(http_error_code::handshake_failed);
      }
      else
        send_request();
    });
  }

  auto
  send_request() -> void {
    reset_deadline(read_timeout);
    asio::async_write(sock, asio::buffer(request), [this](const auto ec, auto) {
      if (ec)
        stop(http_error_code::send_request_failed);
      else
        read_header();
    });
  }

  auto
  read_header() -> void {
    reset_deadline(read_timeout);
    asio::async_read_until(
      sock, asio::dynamic_buffer(buf), "\r\n\r\n",
      [this](const auto ec, const auto n_bytes) { process_header(ec, n_bytes); });
  }

  auto
  process_header(const std::error_code ec, const std::size_t n_bytes) -> void {
    static constexpr auto no_content = 204;
    static constexpr auto not_modified = 304;
    if (ec) {
      stop(http_error_code::receive_header_failed);
      return;
    }
    header = http_header(buf.substr(0, n_bytes));
    buf.erase(0, n_bytes);
    if (!header.is_valid()) {
      stop(http_error_code::malformed_header);
      return;
    }
    if (header.status_code == no_content ||
        header.status_code == not_modified) {
      buf.clear();
      stop(std::error_code{});
      return;
    }
    if (header.has_content_length && !header.chunked) {
      if (std::size(buf) >= header.content_length) {
        buf.resize(header.content_length);
        stop(std::error_code{});
        return;
      }
      read_content(header.content_length - std::size(buf));
    }
    else
      read_to_eof();
  }

  auto
  read_content(const std::size_t remaining) -> void {
    reset_deadline(read_timeout);
    asio::async_read(
      sock, asio::dynamic_buffer(buf),
      [this, remaining](const auto ec, const auto n_bytes) -> std::size_t {
        // custom completion condition updates deadline
        reset_deadline(read_timeout);
        return is_stopped() ? 0 : asio::transfer_exactly(remaining)(ec, n_bytes);
      },
      [this, remaining](const auto ec, const auto n_bytes) {
        if (ec && (!is_end_of_stream(ec) || n_bytes != remaining))
          stop(http_error_code::reading_body_failed);
        else
          stop(std::error_code{});
      });
  }

  auto
  read_to_eof() -> void {
    reset_deadline(read_timeout);
    asio::async_read(
      sock, asio::dynamic_buffer(buf),
      [this](const auto ec, const auto n_bytes) -> std::size_t {
        reset_deadline(read_timeout);
        return is_stopped() ? 0 : asio::transfer_all()(ec, n_bytes);
      },
      [this](const auto ec, auto) {
        if (ec && !is_end_of_stream(ec)) {
          stop(http_error_code::reading_body_failed);
          return;
        }
        if (header.chunked) {
          std::error_code decode_error;
          buf = decode_chunked(buf, decode_error);
          stop(decode_error);
          return;
        }
        stop(std::error_code{});
      });
  }

  // servers that close without close_notify end with stream_truncated
  [[nodiscard]] static auto
  is_end_of_stream(const std::error_code ec) -> bool {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
  }

  asio::io_context ioc;
  asio::ip::tcp::resolver resolver;
  asio::ssl::stream<asio::ip::tcp::socket> sock;

  const std::string host;
  const std::string port;
  const std::string request;
  const std::chrono::seconds connect_timeout;
  const std::chrono::seconds read_timeout;

  std::chrono::steady_clock::time_point deadline{};
  asio::steady_timer watchdog_timer;

  http_header header;
  std::string buf;

  std::error_code status{};
};

static constexpr auto default_port = "443";

[[nodiscard]] auto
parse_https_url(const std::string &url, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string, std::string> {
  static constexpr auto scheme = "https://"sv;
  if (!url.starts_with(scheme)) {
    error = request_error_code::invalid_url;
    return {};
  }
  const auto authority_start = std::size(scheme);
  const auto slash = url.find('/', authority_start);
  const auto authority = url.substr(authority_start, slash - authority_start);
  auto target = slash == std::string::npos ? std::string{"/"} : url.substr(slash);

  std::string host = authority;
  std::string port = default_port;
  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }
  if (host.empty() || port.empty() ||
      port.find_first_not_of("0123456789") != std::string::npos) {
    error = request_error_code::invalid_url;
    return {};
  }
  return {host, port, target};
}

[[nodiscard]] auto
format_http_request(const http_method method, const std::string &host,
                    const std::string &port, const std::string &target,
                    const http_headers &headers,
                    const std::string &body) -> std::string {
  // the port is part of Host unless it is the https default
  const auto authority =
    port == default_port ? host : std::format("{}:{}", host, port);
  auto req =
    std::format("{} {} HTTP/1.1\r\nHost: {}\r\n", method, target, authority);
  for (const auto &[name, value] : headers)
    req += std::format("{}: {}\r\n", name, value);
  if (!body.empty() || method == http_method::post ||
      method == http_method::put || method == http_method::patch)
    req += std::format("Content-Length: {}\r\n", std::size(body));
  req += "Connection: close\r\n\r\n";
  req += body;
  return req;
}

[[nodiscard]] auto
https_transport::send(const http_method method, const std::string &url,
                      const http_headers &headers, const std::string &body,
                      std::error_code &error) -> http_response {
  auto &lgr = logger::instance();
  const auto [host, port, target] = parse_https_url(url, error);
  if (error)
    return {};

  // the context constructor reports OpenSSL failures by throwing
  std::optional<asio::ssl::context> ssl_ctx;
  try {
    ssl_ctx.emplace(asio::ssl::context::tls_client);
  }
  catch (const std::system_error &e) {
    lgr.error("Failed to create TLS context: {}", e.code());
    error = e.code();
    return {};
  }
  auto &ctx = *ssl_ctx;
  if (!insecure) {
    std::error_code ctx_error;
    (void)ctx.set_default_verify_paths(ctx_error);
    if (ctx_error)
      lgr.warning("Failed to load default certificate paths: {}", ctx_error);
  }

  https_exchange exchange(ctx, host, port,
                          format_http_request(method, host, port, target,
                                              headers, body),
                          connect_timeout, read_timeout);
  exchange.run(!insecure);
  error = exchange.get_status();
  if (error)
    return {};
  return http_response(exchange.get_header(), exchange.take_body());
}

}  // namespace webapi
