/** @file

  Rewrites client requests into function invocations.

  Every request is turned into a POST of an API gateway style JSON event
  to the function runtime invocation path. The rewritten request is sent
  back through traffic server, so remap.config decides where the function
  runtime lives.

  @section license License

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

#include "lambda_request.h"

#include "event_encoder.h"
#include "forwarder.h"
#include "request_handler.h"
#include "request_id.h"
#include "request_rewriter.h"
#include "txn_snapshot.h"

#include "ts/remap.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace lambda_request
{
DbgCtl dbg_ctl{PLUGIN_NAME};
}

using namespace lambda_request;

namespace
{

// Collaborators shared by every transaction of one plugin instance.
struct Instance {
  std::unique_ptr<RandomSource> random{std::make_unique<SecureRandomSource>()};
  std::unique_ptr<EventEncoder> encoder{std::make_unique<JsonEventEncoder>()};
};

Instance *global_instance = nullptr;

void
ignore_arguments(int argc, char const *const argv[])
{
  for (int i = 0; i < argc; ++i) {
    DEBUG_LOG("ignoring argument '%s'", argv[i]);
  }
}

void
send_error(TSHttpTxn txnp, HandleResult const &result)
{
  std::string const content_type{ERROR_CONTENT_TYPE};
  TSHttpTxnStatusSet(txnp, static_cast<TSHttpStatus>(result.status));
  TSHttpTxnErrorBodySet(txnp, TSstrdup(result.message.c_str()), result.message.size(), TSstrdup(content_type.c_str()));
}

Outcome
transform_request(Instance const &instance, TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc)
{
  if (is_loopback(txnp)) {
    DEBUG_LOG("passing loopback request through");
    return Outcome::PASSED;
  }

  RequestSnapshot snapshot;
  if (!snapshot_from_txn(txnp, bufp, hdr_loc, snapshot)) {
    ERROR_LOG("unable to read the client request, not transforming");
    return Outcome::PASSED;
  }

  auto const forward = [&](OutboundRequest &&request) -> bool {
    DEBUG_LOG("%s %s -> %s %s (%zu bytes)", snapshot.method.c_str(), snapshot.path.c_str(), request.method.c_str(),
              request.path.c_str(), request.body.size());
    return start_forwarding(txnp, bufp, hdr_loc, std::move(request));
  };

  HandleResult const result = handle_request(snapshot, *instance.random, *instance.encoder, forward);
  switch (result.outcome) {
  case Outcome::FAILED:
    ERROR_LOG("unable to encode the invocation event for request %s: %s", result.request_id.c_str(), result.message.c_str());
    send_error(txnp, result);
    break;
  case Outcome::PASSED:
    ERROR_LOG("unable to forward request %s, not transforming", result.request_id.c_str());
    break;
  case Outcome::FORWARDED:
    DEBUG_LOG("forwarding request %s", result.request_id.c_str());
    break;
  }

  return result.outcome;
}

int
global_read_request_hook(TSCont /* contp ATS_UNUSED */, TSEvent /* event ATS_UNUSED */, void *edata)
{
  TSHttpTxn const txnp    = static_cast<TSHttpTxn>(edata);
  TSMBuffer       bufp    = nullptr;
  TSMLoc          hdr_loc = TS_NULL_MLOC;
  TSEvent         reenable{TS_EVENT_HTTP_CONTINUE};

  if (TS_SUCCESS == TSHttpTxnClientReqGet(txnp, &bufp, &hdr_loc)) {
    if (Outcome::FAILED == transform_request(*global_instance, txnp, bufp, hdr_loc)) {
      reenable = TS_EVENT_HTTP_ERROR;
    }
    TSHandleMLocRelease(bufp, TS_NULL_MLOC, hdr_loc);
  } else {
    ERROR_LOG("unable to get the client request");
  }

  TSHttpTxnReenable(txnp, reenable);
  return 0;
}

} // namespace

///// remap plugin engine

TSReturnCode
TSRemapInit(TSRemapInterface *api_info, char *errbuf, int errbuf_size)
{
  if (!api_info) {
    strncpy(errbuf, "[tsremap_init] - Invalid TSRemapInterface argument", errbuf_size - 1);
    return TS_ERROR;
  }

  if (api_info->tsremap_version < TSREMAP_VERSION) {
    snprintf(errbuf, errbuf_size, "[TSRemapInit] - Incorrect API version %ld.%ld", api_info->tsremap_version >> 16,
             (api_info->tsremap_version & 0xffff));
    return TS_ERROR;
  }

  DEBUG_LOG("plugin is successfully initialized");
  return TS_SUCCESS;
}

TSReturnCode
TSRemapNewInstance(int argc, char *argv[], void **ih, char * /* errbuf ATS_UNUSED */, int /* errbuf_size ATS_UNUSED */)
{
  // argv[0] and argv[1] are the from and to URLs of the rule
  if (2 < argc) {
    ignore_arguments(argc - 2, argv + 2);
  }

  *ih = new Instance;
  return TS_SUCCESS;
}

void
TSRemapDeleteInstance(void *ih)
{
  delete static_cast<Instance *>(ih);
}

TSRemapStatus
TSRemapDoRemap(void *ih, TSHttpTxn txnp, TSRemapRequestInfo *rri)
{
  Instance const *const instance = static_cast<Instance *>(ih);
  if (nullptr == instance) {
    ERROR_LOG("No remap context available, check code / config");
    TSHttpTxnStatusSet(txnp, TS_HTTP_STATUS_INTERNAL_SERVER_ERROR);
    return TSREMAP_NO_REMAP;
  }

  switch (transform_request(*instance, txnp, rri->requestBufp, rri->requestHdrp)) {
  case Outcome::FORWARDED:
    return TSREMAP_DID_REMAP_STOP;
  case Outcome::FAILED:
  case Outcome::PASSED:
    break;
  }

  return TSREMAP_NO_REMAP;
}

///// global plugin

void
TSPluginInit(int argc, char const *argv[])
{
  TSPluginRegistrationInfo info;
  info.plugin_name   = PLUGIN_NAME;
  info.vendor_name   = "Apache Software Foundation";
  info.support_email = "dev@trafficserver.apache.org";

  if (TS_SUCCESS != TSPluginRegister(&info)) {
    ERROR_LOG("Plugin registration failed.");
    return;
  }

  if (1 < argc) {
    ignore_arguments(argc - 1, argv + 1);
  }

  global_instance = new Instance;

  TSCont const contp = TSContCreate(global_read_request_hook, nullptr);

  // Called immediately after the request header is read from the client
  TSHttpHookAdd(TS_HTTP_READ_REQUEST_HDR_HOOK, contp);
}
