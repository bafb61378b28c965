/** @file
 *
 * Lambda request plugin: construction of the outbound invocation request.
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

#include "request_snapshot.h"

#include <string>
#include <string_view>
#include <vector>

namespace lambda_request
{

class EventEncoder;
struct InvocationEvent;

/// Target of every rewritten request.
constexpr std::string_view INVOCATION_PATH = "/2015-03-31/functions/function/invocations";

/** What the client request becomes.
 *
 * Fields not mentioned in @a set_fields or @a removed_fields are carried over
 * from the client request unchanged. The target has no query string.
 */
struct OutboundRequest {
  std::string              method;
  std::string              path;
  std::string              body;
  HeaderList               set_fields; ///< Each replaces every field of the same name.
  std::vector<std::string> removed_fields;
};

/** Encode @a event and describe the request that carries it.
 *
 * @param[out] out Filled only on success.
 * @param[out] error Diagnostic when the event could not be encoded.
 * @return false if encoding failed, in which case nothing may be forwarded.
 */
bool rewrite_request(InvocationEvent const &event, EventEncoder const &encoder, OutboundRequest &out, std::string &error);

} // namespace lambda_request
