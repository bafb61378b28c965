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

#pragma once

#include "request_snapshot.h"

#include <functional>
#include <string>
#include <string_view>

namespace lambda_request
{

class EventEncoder;
class RandomSource;
struct OutboundRequest;

enum class Outcome {
  PASSED,    ///< Left to traffic server unchanged.
  FORWARDED, ///< Handed to the forwarder.
  FAILED,    ///< Answered locally with an error.
};

/// Media type of the error body.
constexpr std::string_view ERROR_CONTENT_TYPE = "text/plain";

struct HandleResult {
  Outcome     outcome = Outcome::PASSED;
  int         status  = 0; ///< HTTP status to answer with, 0 unless FAILED.
  std::string message;     ///< Error body or diagnostic.
  std::string request_id;
};

/// Sends the rewritten request on. Returns false if nothing was sent.
using ForwardFunc = std::function<bool(OutboundRequest &&)>;

/** Build, encode and forward the invocation for @a snapshot.
 *
 * If the event cannot be encoded @a forward is not called and the result is
 * FAILED with status 500 and the encoder's diagnostic. If @a forward declines
 * the result is PASSED.
 */
HandleResult handle_request(RequestSnapshot const &snapshot, RandomSource &random, EventEncoder const &encoder,
                            ForwardFunc const &forward);

} // namespace lambda_request
