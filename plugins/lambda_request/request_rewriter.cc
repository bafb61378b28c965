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

#include "request_rewriter.h"

#include "event_encoder.h"
#include "invocation_event.h"

#include <utility>

namespace lambda_request
{

bool
rewrite_request(InvocationEvent const &event, EventEncoder const &encoder, OutboundRequest &out, std::string &error)
{
  std::string body;
  if (!encoder.encode(event, body, error)) {
    return false;
  }

  OutboundRequest request;
  request.method = "POST";
  request.path   = INVOCATION_PATH;
  request.set_fields.emplace_back("Content-Type", encoder.content_type());
  request.set_fields.emplace_back("Content-Length", std::to_string(body.size()));
  request.removed_fields.emplace_back("Transfer-Encoding");
  request.body = std::move(body);

  out = std::move(request);
  return true;
}

} // namespace lambda_request
