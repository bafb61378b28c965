/** @file
 *
 * Lambda request plugin: request timestamp.
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

#include "timestamp.h"

#include <ctime>

namespace lambda_request
{

Timestamp
Timestamp::at(std::chrono::system_clock::time_point when)
{
  using namespace std::chrono;

  auto const  ms   = duration_cast<milliseconds>(when.time_since_epoch()).count();
  auto const  secs = floor<seconds>(when);
  std::time_t tt   = system_clock::to_time_t(secs);
  std::tm     tm{};
  char        buf[32] = {};

  gmtime_r(&tt, &tm);
  std::size_t const len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);

  return {std::string(buf, len), static_cast<int64_t>(ms)};
}

Timestamp
Timestamp::now()
{
  return at(std::chrono::system_clock::now());
}

} // namespace lambda_request
