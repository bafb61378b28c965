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

#include "txn_snapshot.h"

#include "client_address.h"
#include "lambda_request.h"

#include <strings.h>

namespace lambda_request
{

namespace
{
  bool
  same_name(char const *name, int len, char const *field, int field_len)
  {
    return len == field_len && 0 == strncasecmp(name, field, len);
  }

  // Fields which HTTP/1.1 framing owns rather than the application.
  bool
  excluded_field(char const *name, int len)
  {
    return same_name(name, len, TS_MIME_FIELD_HOST, TS_MIME_LEN_HOST) ||
           same_name(name, len, TS_MIME_FIELD_TRANSFER_ENCODING, TS_MIME_LEN_TRANSFER_ENCODING);
  }

  std::string
  protocol_name(TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc)
  {
    if (nullptr != TSHttpTxnClientProtocolStackContains(txnp, TS_PROTO_TAG_HTTP_2_0)) {
      return "HTTP/2.0";
    }
    if (nullptr != TSHttpTxnClientProtocolStackContains(txnp, TS_PROTO_TAG_HTTP_3)) {
      return "HTTP/3.0";
    }

    int const version = TSHttpHdrVersionGet(bufp, hdr_loc);
    return "HTTP/" + std::to_string(TS_HTTP_MAJOR(version)) + "." + std::to_string(TS_HTTP_MINOR(version));
  }

  void
  collect_fields(TSMBuffer bufp, TSMLoc hdr_loc, RequestSnapshot &snapshot)
  {
    TSMLoc field = TSMimeHdrFieldGet(bufp, hdr_loc, 0);
    while (TS_NULL_MLOC != field) {
      int         name_len = 0;
      char const *name     = TSMimeHdrFieldNameGet(bufp, hdr_loc, field, &name_len);

      if (nullptr != name && 0 < name_len) {
        int         value_len = 0;
        char const *value     = TSMimeHdrFieldValueStringGet(bufp, hdr_loc, field, -1, &value_len);

        if (same_name(name, name_len, TS_MIME_FIELD_HOST, TS_MIME_LEN_HOST)) {
          if (snapshot.host.empty() && nullptr != value) {
            snapshot.host.assign(value, value_len);
          }
        } else if (!excluded_field(name, name_len)) {
          snapshot.headers.emplace_back(std::string(name, name_len), nullptr != value ? std::string(value, value_len) : std::string());
        }
      }

      TSMLoc const next = TSMimeHdrFieldNext(bufp, hdr_loc, field);
      TSHandleMLocRelease(bufp, hdr_loc, field);
      field = next;
    }
  }

  bool
  collect_url(TSHttpTxn txnp, RequestSnapshot &snapshot)
  {
    TSMBuffer url_buf = nullptr;
    TSMLoc    url_loc = TS_NULL_MLOC;
    if (TS_SUCCESS != TSHttpTxnPristineUrlGet(txnp, &url_buf, &url_loc)) {
      return false;
    }

    int         len  = 0;
    char const *path = TSUrlPathGet(url_buf, url_loc, &len);
    snapshot.path    = "/";
    if (nullptr != path && 0 < len) {
      snapshot.path.append(path, len);
    }

    char const *query = TSUrlHttpQueryGet(url_buf, url_loc, &len);
    if (nullptr != query && 0 < len) {
      snapshot.query.assign(query, len);
    }

    if (snapshot.host.empty()) {
      char const *host = TSUrlHostGet(url_buf, url_loc, &len);
      if (nullptr != host && 0 < len) {
        snapshot.host.assign(host, len);
      }
    }

    TSHandleMLocRelease(url_buf, TS_NULL_MLOC, url_loc);
    return true;
  }
} // namespace

bool
snapshot_from_txn(TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc, RequestSnapshot &snapshot)
{
  int         len    = 0;
  char const *method = TSHttpHdrMethodGet(bufp, hdr_loc, &len);
  if (nullptr == method || 0 == len) {
    DEBUG_LOG("client request has no method");
    return false;
  }
  snapshot.method.assign(method, len);

  collect_fields(bufp, hdr_loc, snapshot);

  if (!collect_url(txnp, snapshot)) {
    DEBUG_LOG("unable to get the pristine url");
    return false;
  }

  snapshot.remote_addr = format_sockaddr(TSHttpTxnClientAddrGet(txnp));
  snapshot.protocol    = protocol_name(txnp, bufp, hdr_loc);

  DEBUG_LOG("snapshot: %s %s host=%s remote=%s %s fields=%zu", snapshot.method.c_str(), snapshot.path.c_str(),
            snapshot.host.c_str(), snapshot.remote_addr.c_str(), snapshot.protocol.c_str(), snapshot.headers.size());
  return true;
}

} // namespace lambda_request
