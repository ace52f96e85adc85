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

#ifndef LIB_CREDENTIAL_APPLIER_HPP_
#define LIB_CREDENTIAL_APPLIER_HPP_

#include "credentials.hpp"
#include "http_header.hpp"

namespace webapi {

/// Stamps the access token onto outbound request headers. Only headers are
/// touched; the request body is never changed.
class credential_applier {
public:
  virtual ~credential_applier() = default;

  [[nodiscard]] virtual auto
  apply(const authenticated_credentials &creds,
        http_headers headers) const -> http_headers = 0;
};

/// Sets "Authorization: Bearer <token>", replacing any Authorization field
class bearer_credential_applier : public credential_applier {
public:
  [[nodiscard]] auto
  apply(const authenticated_credentials &creds,
        http_headers headers) const -> http_headers override;
};

}  // namespace webapi

#endif  // LIB_CREDENTIAL_APPLIER_HPP_
