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

#include "forwarder.h"

#include "client_address.h"
#include "lambda_request.h"
#include "request_rewriter.h"

#include <cinttypes>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <netinet/in.h>
#include <sys/socket.h>

namespace lambda_request
{

namespace
{
  // Directional IO state of one side of a TSVConn.
  struct IOChannel {
    TSVIO            vio    = nullptr;
    TSIOBuffer       iobuf  = nullptr;
    TSIOBufferReader reader = nullptr;

    IOChannel() : iobuf(TSIOBufferSizedCreate(TS_IOBUFFER_SIZE_INDEX_32K)), reader(TSIOBufferReaderAlloc(iobuf)) {}
    ~IOChannel()
    {
      if (nullptr != reader) {
        TSIOBufferReaderFree(reader);
      }
      if (nullptr != iobuf) {
        TSIOBufferDestroy(iobuf);
      }
    }

    IOChannel(IOChannel const &)            = delete;
    IOChannel &operator=(IOChannel const &) = delete;

    void
    read(TSVConn vc, TSCont contp)
    {
      vio = TSVConnRead(vc, contp, iobuf, INT64_MAX);
    }

    void
    write(TSVConn vc, TSCont contp, int64_t nbytes = INT64_MAX)
    {
      vio = TSVConnWrite(vc, contp, reader, nbytes);
    }
  };

  struct Endpoint {
    TSVConn   vc = nullptr;
    IOChannel readio;
    IOChannel writeio;

    void
    close()
    {
      if (nullptr != vc) {
        TSVConnClose(vc);
      }
      vc         = nullptr;
      readio.vio = writeio.vio = nullptr;
    }

    void
    abort()
    {
      if (nullptr != vc) {
        TSVConnAbort(vc, TS_VC_CLOSE_ABORT);
      }
      vc         = nullptr;
      readio.vio = writeio.vio = nullptr;
    }

    bool
    owns(TSVIO vio) const
    {
      return nullptr != vc && nullptr != vio && TSVIOVConnGet(vio) == vc;
    }
  };

  // Private copy of the client request header.
  struct OutboundHeader {
    TSMBuffer buffer = nullptr;
    TSMLoc    header = TS_NULL_MLOC;

    OutboundHeader() : buffer(TSMBufferCreate()) {}
    ~OutboundHeader()
    {
      if (TS_NULL_MLOC != header) {
        TSHttpHdrDestroy(buffer, header);
        TSHandleMLocRelease(buffer, TS_NULL_MLOC, header);
      }
      TSMBufferDestroy(buffer);
    }

    OutboundHeader(OutboundHeader const &)            = delete;
    OutboundHeader &operator=(OutboundHeader const &) = delete;

    bool
    clone_from(TSMBuffer bufp, TSMLoc hdr_loc)
    {
      return TS_SUCCESS == TSHttpHdrClone(buffer, bufp, hdr_loc, &header);
    }
  };

  // Per transaction state, owned by the intercept continuation.
  struct ForwardState {
    OutboundHeader   header;
    std::string      body;
    sockaddr_storage client_addr;
    Endpoint         downstream; // traffic server side of the intercept
    Endpoint         upstream;   // loopback connection carrying the invocation

    ForwardState() { memset(&client_addr, 0, sizeof(client_addr)); }
  };

  void
  remove_fields(TSMBuffer bufp, TSMLoc hdr_loc, std::string_view name)
  {
    TSMLoc field = TSMimeHdrFieldFind(bufp, hdr_loc, name.data(), name.size());
    while (TS_NULL_MLOC != field) {
      TSMimeHdrFieldDestroy(bufp, hdr_loc, field);
      TSHandleMLocRelease(bufp, hdr_loc, field);
      field = TSMimeHdrFieldFind(bufp, hdr_loc, name.data(), name.size());
    }
  }

  bool
  set_field(TSMBuffer bufp, TSMLoc hdr_loc, std::string_view name, std::string_view value)
  {
    remove_fields(bufp, hdr_loc, name);

    TSMLoc field = TS_NULL_MLOC;
    if (TS_SUCCESS != TSMimeHdrFieldCreateNamed(bufp, hdr_loc, name.data(), name.size(), &field)) {
      return false;
    }

    bool const status = TS_SUCCESS == TSMimeHdrFieldValueStringSet(bufp, hdr_loc, field, -1, value.data(), value.size()) &&
                        TS_SUCCESS == TSMimeHdrFieldAppend(bufp, hdr_loc, field);
    TSHandleMLocRelease(bufp, hdr_loc, field);
    return status;
  }

  bool
  set_target(TSMBuffer bufp, TSMLoc hdr_loc, std::string_view path)
  {
    TSMLoc url_loc = TS_NULL_MLOC;
    if (TS_SUCCESS != TSHttpHdrUrlGet(bufp, hdr_loc, &url_loc)) {
      return false;
    }

    // URL paths are stored without the leading slash
    if (!path.empty() && '/' == path.front()) {
      path.remove_prefix(1);
    }

    bool const status = TS_SUCCESS == TSUrlPathSet(bufp, url_loc, path.data(), path.size()) &&
                        TS_SUCCESS == TSUrlHttpQuerySet(bufp, url_loc, "", 0);
    TSHandleMLocRelease(bufp, hdr_loc, url_loc);
    return status;
  }

  void
  destroy_if_done(ForwardState *state, TSCont contp)
  {
    if (nullptr == state->downstream.vc && nullptr == state->upstream.vc) {
      DEBUG_LOG("destroying forward state %p contp=%p", state, contp);
      TSContDataSet(contp, nullptr);
      TSContDestroy(contp);
      delete state;
    }
  }

  // Bound the downstream write to what has been produced so far.
  void
  finish_downstream(ForwardState *state)
  {
    Endpoint &down = state->downstream;
    if (nullptr == down.vc) {
      return;
    }

    int64_t const pending = TSIOBufferReaderAvail(down.writeio.reader);
    if (0 == pending) {
      down.close();
      return;
    }

    TSVIONBytesSet(down.writeio.vio, TSVIONDoneGet(down.writeio.vio) + pending);
    TSVIOReenable(down.writeio.vio);
  }

  void
  relay_response(ForwardState *state)
  {
    Endpoint     &up    = state->upstream;
    Endpoint     &down  = state->downstream;
    int64_t const avail = TSIOBufferReaderAvail(up.readio.reader);
    if (avail <= 0) {
      return;
    }

    if (nullptr != down.vc) {
      TSIOBufferCopy(down.writeio.iobuf, up.readio.reader, avail, 0);
      TSVIOReenable(down.writeio.vio);
    }

    // Without a client the response is dropped.
    TSIOBufferReaderConsume(up.readio.reader, avail);
    TSVIOReenable(up.readio.vio);
  }

  // Traffic server writes the client request into the intercept, it is not needed.
  void
  drain_downstream(ForwardState *state, TSVIO vio)
  {
    int64_t const avail = TSIOBufferReaderAvail(state->downstream.readio.reader);
    if (0 < avail) {
      TSIOBufferReaderConsume(state->downstream.readio.reader, avail);
    }
    TSVIOReenable(vio);
  }

  bool
  handle_accept(TSCont contp, ForwardState *state, TSVConn vc)
  {
    state->downstream.vc = vc;
    state->downstream.readio.read(vc, contp);
    state->downstream.writeio.write(vc, contp);

    TSVConn const upvc = TSHttpConnectWithPluginId(reinterpret_cast<sockaddr const *>(&state->client_addr), PLUGIN_NAME, 0);
    if (nullptr == upvc) {
      ERROR_LOG("unable to open the loopback connection");
      return false;
    }
    state->upstream.vc = upvc;

    TSHttpHdrPrint(state->header.buffer, state->header.header, state->upstream.writeio.iobuf);
    if (!state->body.empty()) {
      TSIOBufferWrite(state->upstream.writeio.iobuf, state->body.data(), state->body.size());
    }

    int64_t const nbytes = TSIOBufferReaderAvail(state->upstream.writeio.reader);
    DEBUG_LOG("sending %" PRId64 " bytes (body %zu) on the loopback", nbytes, state->body.size());

    state->upstream.writeio.write(upvc, contp, nbytes);
    state->upstream.readio.read(upvc, contp);
    return true;
  }

  int
  intercept_hook(TSCont contp, TSEvent event, void *edata)
  {
    ForwardState *const state = static_cast<ForwardState *>(TSContDataGet(contp));
    if (nullptr == state) {
      ERROR_LOG("event %s (%d) after teardown", TSHttpEventNameLookup(event), event);
      return TS_EVENT_ERROR;
    }

    switch (event) {
    case TS_EVENT_NET_ACCEPT:
      if (!handle_accept(contp, state, static_cast<TSVConn>(edata))) {
        state->downstream.abort();
        state->upstream.abort();
      }
      break;

    case TS_EVENT_NET_ACCEPT_FAILED:
      DEBUG_LOG("intercept accept failed");
      break;

    case TS_EVENT_VCONN_READ_READY:
    case TS_EVENT_VCONN_READ_COMPLETE: {
      TSVIO const vio = static_cast<TSVIO>(edata);
      if (state->upstream.owns(vio)) {
        relay_response(state);
      } else if (state->downstream.owns(vio)) {
        drain_downstream(state, vio);
      }
    } break;

    case TS_EVENT_VCONN_WRITE_READY:
      break;

    case TS_EVENT_VCONN_WRITE_COMPLETE: {
      TSVIO const vio = static_cast<TSVIO>(edata);
      if (state->downstream.owns(vio)) {
        DEBUG_LOG("response delivered");
        state->downstream.close();
        state->upstream.close();
      } else if (state->upstream.owns(vio)) {
        DEBUG_LOG("invocation request sent");
      }
    } break;

    case TS_EVENT_VCONN_EOS: {
      TSVIO const vio = static_cast<TSVIO>(edata);
      if (state->upstream.owns(vio)) {
        relay_response(state);
        state->upstream.close();
        finish_downstream(state);
      } else {
        DEBUG_LOG("client side closed");
        state->downstream.close();
        state->upstream.close();
      }
    } break;

    case TS_EVENT_ERROR:
    case TS_EVENT_VCONN_INACTIVITY_TIMEOUT:
    case TS_EVENT_VCONN_ACTIVE_TIMEOUT:
      DEBUG_LOG("aborting on %s (%d)", TSHttpEventNameLookup(event), event);
      state->downstream.abort();
      state->upstream.abort();
      break;

    default:
      ERROR_LOG("unexpected event %s (%d)", TSHttpEventNameLookup(event), event);
      break;
    }

    destroy_if_done(state, contp);
    return TS_EVENT_NONE;
  }
} // namespace

bool
apply_outbound_request(TSMBuffer bufp, TSMLoc hdr_loc, OutboundRequest const &request)
{
  if (TS_SUCCESS != TSHttpHdrMethodSet(bufp, hdr_loc, request.method.data(), request.method.size())) {
    return false;
  }
  if (!set_target(bufp, hdr_loc, request.path)) {
    return false;
  }
  if (TS_SUCCESS != TSHttpHdrVersionSet(bufp, hdr_loc, TS_HTTP_VERSION(1, 1))) {
    return false;
  }

  for (auto const &name : request.removed_fields) {
    remove_fields(bufp, hdr_loc, name);
  }
  for (auto const &[name, value] : request.set_fields) {
    if (!set_field(bufp, hdr_loc, name, value)) {
      return false;
    }
  }

  // The loopback response is delimited by the connection close.
  return set_field(bufp, hdr_loc, {TS_MIME_FIELD_CONNECTION, static_cast<std::size_t>(TS_MIME_LEN_CONNECTION)},
                   {TS_HTTP_VALUE_CLOSE, static_cast<std::size_t>(TS_HTTP_LEN_CLOSE)});
}

bool
start_forwarding(TSHttpTxn txnp, TSMBuffer bufp, TSMLoc hdr_loc, OutboundRequest &&request)
{
  auto state = std::make_unique<ForwardState>();

  sockaddr const *const addr = TSHttpTxnClientAddrGet(txnp);
  loopback_source_address(addr, state->client_addr);
  if (nullptr == addr || (AF_INET != addr->sa_family && AF_INET6 != addr->sa_family)) {
    DEBUG_LOG("client address is not IP, the loopback comes from 127.0.0.1");
  }

  if (!state->header.clone_from(bufp, hdr_loc)) {
    ERROR_LOG("unable to copy the client request header");
    return false;
  }
  if (!apply_outbound_request(state->header.buffer, state->header.header, request)) {
    ERROR_LOG("unable to rewrite the request header");
    return false;
  }
  state->body = std::move(request.body);

  TSHttpTxnServerRespNoStoreSet(txnp, 1);

  TSCont const contp = TSContCreate(intercept_hook, TSMutexCreate());
  TSContDataSet(contp, state.release());
  TSHttpTxnIntercept(contp, txnp);
  return true;
}

bool
is_loopback(TSHttpTxn txnp)
{
  if (0 == TSHttpTxnIsInternal(txnp)) {
    return false;
  }
  char const *const tag = TSHttpTxnPluginTagGet(txnp);
  return nullptr != tag && 0 == strcmp(tag, PLUGIN_NAME);
}

} // namespace lambda_request
