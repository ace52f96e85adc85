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

#include "credential_applier.hpp"

#include "logger.hpp"
#include "utilities.hpp"

#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace webapi {

[[nodiscard]] auto
bearer_credential_applier::apply(const authenticated_credentials &creds,
                                 http_headers headers) const -> http_headers {
  set_header(headers, "Authorization",
             std::format("Bearer {}", creds.access_token()));
  // names only; values may carry secrets
  auto &lgr = logger::instance();
  if (lgr.get_level() == log_level_t::debug) {
    const auto names = headers | std::views::elements<0> |
                       std::ranges::to<std::vector<std::string>>();
    lgr.debug("Request header fields: {}", join_with(names, ','));
  }
  return headers;
}

}  // namespace webapi
