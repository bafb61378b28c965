/** @file
 *
 * Lambda request plugin: invocation event assembly.
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

#include "invocation_event.h"

#include "client_address.h"
#include "domain.h"
#include "request_id.h"
#include "timestamp.h"

#include <utility>

namespace lambda_request
{

InvocationEvent
assemble_event(RequestSnapshot const &snapshot, std::string request_id, Timestamp const &timestamp)
{
  InvocationEvent event;
  std::string     route_key = snapshot.method + ' ' + snapshot.path;

  event.route_key        = route_key;
  event.raw_path         = snapshot.path;
  event.raw_query_string = snapshot.query;
  event.headers          = fold_headers(snapshot.headers);

  DomainParts     domain = split_domain(snapshot.host);
  RequestContext &ctx    = event.request_context;
  ctx.domain_name        = std::move(domain.name);
  ctx.domain_prefix      = std::move(domain.prefix);
  ctx.http.method        = snapshot.method;
  ctx.http.path          = snapshot.path;
  ctx.http.protocol      = snapshot.protocol;
  ctx.http.source_ip     = resolve_client_ip(snapshot.remote_addr);
  ctx.http.user_agent    = std::string{first_header_value(snapshot.headers, "User-Agent")};
  ctx.request_id         = std::move(request_id);
  ctx.route_key          = std::move(route_key);
  ctx.time               = timestamp.rfc3339;
  ctx.time_epoch         = timestamp.epoch_ms;

  if (auto const session = first_header_value(snapshot.headers, SESSION_ID_FIELD); !session.empty()) {
    event.identity_source.emplace_back(session);
  }

  return event;
}

InvocationEvent
build_event(RequestSnapshot const &snapshot, RandomSource &random)
{
  std::string request_id = generate_request_id(random);
  return assemble_event(snapshot, std::move(request_id), Timestamp::now());
}

} // namespace lambda_request
