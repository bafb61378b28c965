/** @file
 *
 * Lambda request plugin: read-only view of the inbound request.
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

#include <string>
#include <utility>
#include <vector>

namespace lambda_request
{

/// One occurrence of a header field, name as received.
using HeaderField = std::pair<std::string, std::string>;

/// Header fields in the order they were received. A name repeats once per occurrence.
using HeaderList = std::vector<HeaderField>;

/** Facts captured from the client request before anything is rewritten.
 *
 * The @a host field is the only place the Host header lives; @a headers never
 * contains Host or Transfer-Encoding.
 */
struct RequestSnapshot {
  std::string method;
  std::string path; ///< Always starts with '/'.
  std::string query;
  std::string host; ///< May carry a ":port" suffix.
  HeaderList  headers;
  std::string remote_addr; ///< "host:port", "[v6]:port" or an opaque value.
  std::string protocol;    ///< e.g. "HTTP/1.1".
};

} // namespace lambda_request
