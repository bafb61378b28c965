/** @file
 *
 * Lambda request plugin: the invocation event and its assembly.
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

#include "header_fold.h"
#include "request_snapshot.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lambda_request
{

class RandomSource;
struct Timestamp;

/// Header carrying the caller's session identifier.
constexpr std::string_view SESSION_ID_FIELD = "x-session-id";

/// Placeholder for accountId, apiId and stage.
constexpr std::string_view LOCAL_PLACEHOLDER = "local";

struct HttpDescription {
  std::string method;
  std::string path;
  std::string protocol;
  std::string source_ip;
  std::string user_agent;
};

struct RequestContext {
  std::string     account_id{LOCAL_PLACEHOLDER};
  std::string     api_id{LOCAL_PLACEHOLDER};
  std::string     domain_name;
  std::string     domain_prefix;
  HttpDescription http;
  std::string     request_id;
  std::string     route_key;
  std::string     stage{LOCAL_PLACEHOLDER};
  std::string     time;
  int64_t         time_epoch = 0;
};

/** API Gateway HTTP API (payload format 2.0) style event.
 *
 * Built fresh for every request and never modified afterwards.
 */
struct InvocationEvent {
  std::string              version{"2.0"};
  std::string              type{"REQUEST"};
  std::string              route_key;
  std::string              raw_path;
  std::string              raw_query_string;
  HeaderMap                headers;
  RequestContext           request_context;
  std::string              body;
  bool                     is_base64_encoded = false;
  std::vector<std::string> identity_source;
};

/** Assemble the event for @a snapshot.
 *
 * Pure: the only inputs besides the snapshot are the identifier and the instant,
 * each of which must be produced once per request.
 */
InvocationEvent assemble_event(RequestSnapshot const &snapshot, std::string request_id, Timestamp const &timestamp);

/// Draw the identifier and the current time, then assemble_event().
InvocationEvent build_event(RequestSnapshot const &snapshot, RandomSource &random);

} // namespace lambda_request
