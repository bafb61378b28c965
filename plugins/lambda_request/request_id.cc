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

#include "request_id.h"

#include <chrono>
#include <climits>

#include <openssl/rand.h>

namespace lambda_request
{

bool
SecureRandomSource::fill(unsigned char *buf, std::size_t len)
{
  if (len > static_cast<std::size_t>(INT_MAX)) {
    return false;
  }
  return 1 == RAND_bytes(buf, static_cast<int>(len));
}

UuidBytes
fallback_uuid_bytes(int64_t nanos)
{
  UuidBytes   bytes{};
  auto const  t = static_cast<uint64_t>(nanos);
  std::size_t i = 0;
  // Only the 8 bytes of the timestamp carry information, the rest stay zero.
  for (; i < sizeof(t); ++i) {
    bytes[i] = static_cast<unsigned char>(t >> (i * 8));
  }
  return bytes;
}

std::string
format_request_id(UuidBytes bytes)
{
  static char const hex[] = "0123456789abcdef";

  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (4 == i || 6 == i || 8 == i || 10 == i) {
      id.push_back('-');
    }
    id.push_back(hex[bytes[i] >> 4]);
    id.push_back(hex[bytes[i] & 0x0F]);
  }
  return id;
}

std::string
generate_request_id(RandomSource &source)
{
  UuidBytes bytes;
  if (!source.fill(bytes.data(), bytes.size())) {
    auto const now = std::chrono::system_clock::now().time_since_epoch();
    bytes          = fallback_uuid_bytes(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  }
  return format_request_id(bytes);
}

} // namespace lambda_request
