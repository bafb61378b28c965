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

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lambda_request
{

/** One instant in two renderings.
 *
 * Both members always describe the same instant.
 */
struct Timestamp {
  std::string rfc3339;      ///< "2006-01-02T15:04:05Z", UTC, second precision.
  int64_t     epoch_ms = 0; ///< Milliseconds since the Unix epoch.

  static Timestamp at(std::chrono::system_clock::time_point when);
  static Timestamp now();
};

} // namespace lambda_request
