/** @file
 *
 * Lambda request plugin: request identifier generation.
 *
 *  Licensed to the Apache Software Foundation (ASF) under one
 *  or more contributor license agreements.  See the NOTICE file
 *  distributed with this work for additional information
 *  regarding copyright ownership.  The ASF licenses this file
 *  to you under the Apache License, Version 2.0 (the
 *  "License"); you may not use this file except in compliance
 *  with the License.  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lambda_request
{

using UuidBytes = std::array<unsigned char, 16>;

/** Source of random bytes.
 *
 * Implementations are shared by every transaction of a plugin instance and
 * must tolerate concurrent calls.
 */
class RandomSource
{
public:
  virtual ~RandomSource() = default;

  /** Fill @a buf with @a len random bytes.
   *
   * @return false if the source could not deliver, the buffer content is then unspecified.
   */
  virtual bool fill(unsigned char *buf, std::size_t len) = 0;
};

/// Cryptographically secure bytes from OpenSSL.
class SecureRandomSource : public RandomSource
{
public:
  bool fill(unsigned char *buf, std::size_t len) override;
};

/// Bytes derived from a nanosecond timestamp, used when the random source fails.
UuidBytes fallback_uuid_bytes(int64_t nanos);

/// Force version 4 and the RFC 4122 variant, then render as lower case 8-4-4-4-12 text.
std::string format_request_id(UuidBytes bytes);

/** Generate a version 4 UUID string.
 *
 * Draws 16 bytes from @a source. If that fails the bytes come from
 * fallback_uuid_bytes() with the current time, which is still a well formed
 * version 4 identifier but with far less entropy.
 */
std::string generate_request_id(RandomSource &source);

} // namespace lambda_request
