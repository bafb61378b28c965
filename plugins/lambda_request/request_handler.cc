/** @file
 *
 * Lambda request plugin: per request decision between forwarding and failing.
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

#include "request_handler.h"

#include "invocation_event.h"
#include "request_rewriter.h"

#include <utility>

namespace lambda_request
{

namespace
{
  constexpr int STATUS_INTERNAL_SERVER_ERROR = 500;
}

HandleResult
handle_request(RequestSnapshot const &snapshot, RandomSource &random, EventEncoder const &encoder, ForwardFunc const &forward)
{
  HandleResult result;

  InvocationEvent const event = build_event(snapshot, random);
  result.request_id           = event.request_context.request_id;

  OutboundRequest request;
  if (!rewrite_request(event, encoder, request, result.message)) {
    result.outcome = Outcome::FAILED;
    result.status  = STATUS_INTERNAL_SERVER_ERROR;
    return result;
  }

  if (forward(std::move(request))) {
    result.outcome = Outcome::FORWARDED;
  } else {
    result.message = "forwarding was not set up";
  }
  return result;
}

} // namespace lambda_request
