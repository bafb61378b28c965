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

#include "request_snapshot.h"

#include "ts/ts.h"

namespace lambda_request
{

/** Capture the client request of @a txnp.
 *
 * @a bufp / @a hdr_loc is the client request header (from the remap request
 * info or TSHttpTxnClientReqGet()). Path and query come from the pristine URL
 * so that earlier remapping does not leak into the event.
 *
 * @return false if the request could not be read.
 */
bool snapshot_from_txn(TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc, RequestSnapshot &snapshot);

} // namespace lambda_request
