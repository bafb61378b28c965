/** @file test_request_handler.cc

  Unit tests for the forward or fail decision.

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

#include "event_encoder.h"
#include "request_handler.h"
#include "request_id.h"
#include "request_rewriter.h"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace lambda_request;

namespace
{
RequestSnapshot
sample_request()
{
  RequestSnapshot snapshot;
  snapshot.method      = "PUT";
  snapshot.path        = "/items/7";
  snapshot.host        = "fn.example.com";
  snapshot.headers     = {{"x-session-id", "sess-9"}};
  snapshot.remote_addr = "192.0.2.10:40000";
  snapshot.protocol    = "HTTP/1.1";
  return snapshot;
}

class CountingSource : public RandomSource
{
public:
  bool
  fill(unsigned char *buf, std::size_t len) override
  {
    std::fill(buf, buf + len, 0x11);
    return true;
  }
};

class RefusingEncoder : public EventEncoder
{
public:
  std::string_view
  content_type() const override
  {
    return "application/json";
  }

  bool
  encode(InvocationEvent const &, std::string &, std::string &error) const override
  {
    error = "json: unsupported value";
    return false;
  }
};

// Records every forwarded request.
struct Recorder {
  int             calls  = 0;
  bool            accept = true;
  OutboundRequest last;

  ForwardFunc
  func()
  {
    return [this](OutboundRequest &&request) -> bool {
      ++calls;
      last = std::move(request);
      return accept;
    };
  }
};
} // namespace

TEST_CASE("encoding failure answers 500 without forwarding")
{
  CountingSource        random;
  RefusingEncoder const encoder;
  Recorder              recorder;

  HandleResult const result{handle_request(sample_request(), random, encoder, recorder.func())};

  CHECK(0 == recorder.calls);
  CHECK(Outcome::FAILED == result.outcome);
  CHECK(500 == result.status);
  CHECK("json: unsupported value" == result.message);
  CHECK("text/plain" == ERROR_CONTENT_TYPE);
  CHECK_FALSE(result.request_id.empty());
}

TEST_CASE("successful encoding forwards once")
{
  CountingSource         random;
  JsonEventEncoder const encoder;
  Recorder               recorder;

  SECTION("forwarded")
  {
    HandleResult const result{handle_request(sample_request(), random, encoder, recorder.func())};

    CHECK(1 == recorder.calls);
    CHECK(Outcome::FORWARDED == result.outcome);
    CHECK(0 == result.status);
    CHECK("11111111-1111-4111-9111-111111111111" == result.request_id);

    CHECK("POST" == recorder.last.method);
    CHECK(INVOCATION_PATH == recorder.last.path);
    CHECK(std::string::npos != recorder.last.body.find(R"("routeKey":"PUT /items/7")"));
    CHECK(std::string::npos != recorder.last.body.find(result.request_id));
  }

  SECTION("forwarder declines")
  {
    recorder.accept = false;
    HandleResult const result{handle_request(sample_request(), random, encoder, recorder.func())};

    CHECK(1 == recorder.calls);
    CHECK(Outcome::PASSED == result.outcome);
    CHECK(0 == result.status);
  }
}
