/** @file
  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#pragma once

#include "ts/ts.h"

namespace lambda_request
{

struct OutboundRequest;

/** Apply @a request to the HTTP request header @a hdr_loc.
 *
 * Method and path are replaced, the query string is cleared and the version
 * is forced to HTTP/1.1. All other fields survive unless named by the request.
 */
bool apply_outbound_request(TSMBuffer bufp, TSMLoc hdr_loc, OutboundRequest const &request);

/** Take over the server side of @a txnp.
 *
 * A copy of the client request header (@a bufp, @a hdr_loc) rewritten by
 * @a request is sent back into traffic server through a plugin tagged
 * loopback connection, and the response of that connection is relayed to the
 * client. Transactions arriving on the loopback are recognized by
 * is_loopback() and must not be forwarded again.
 *
 * @return false if nothing was set up, the transaction is untouched.
 */
bool start_forwarding(TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc, OutboundRequest &&request);

/// True for transactions created by start_forwarding().
bool is_loopback(TSHttpTxn txnp);

} // namespace lambda_request
