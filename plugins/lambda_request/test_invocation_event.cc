/** @file test_invocation_event.cc

  Unit tests for event assembly, encoding and the request rewrite.

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
#include "invocation_event.h"
#include "request_id.h"
#include "request_rewriter.h"
#include "timestamp.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <regex>

using namespace lambda_request;

namespace
{
Timestamp const FIXED_TIME{Timestamp::at(std::chrono::system_clock::time_point{std::chrono::milliseconds{1700000000123}})};

RequestSnapshot
sample_request()
{
  RequestSnapshot snapshot;
  snapshot.method      = "GET";
  snapshot.path        = "/hello";
  snapshot.query       = "a=1&b=2";
  snapshot.host        = "api.example.com:8443";
  snapshot.headers     = {{"user-agent", "curl/8.0"}, {"x-session-id", "sess-42"}, {"Accept", "a"}, {"accept", "b"}};
  snapshot.remote_addr = "10.0.0.7:51234";
  snapshot.protocol    = "HTTP/1.1";
  return snapshot;
}

std::string
json_string(std::string_view value)
{
  std::string out;
  append_json_string(out, value);
  return out;
}

class ZeroSource : public RandomSource
{
public:
  bool
  fill(unsigned char *buf, std::size_t len) override
  {
    std::fill(buf, buf + len, 0);
    return true;
  }
};

class FailingEncoder : public EventEncoder
{
public:
  std::string_view
  content_type() const override
  {
    return "application/json";
  }

  bool
  encode(InvocationEvent const &, std::string &out, std::string &error) const override
  {
    out   = "partial";
    error = "unsupported value";
    return false;
  }
};

HeaderField const *
find_field(HeaderList const &fields, std::string_view name)
{
  auto const spot =
    std::find_if(fields.begin(), fields.end(), [name](HeaderField const &field) -> bool { return field.first == name; });
  return spot == fields.end() ? nullptr : &*spot;
}
} // namespace

TEST_CASE("event assembly")
{
  InvocationEvent const event{assemble_event(sample_request(), "req-1", FIXED_TIME)};

  SECTION("request level fields")
  {
    CHECK("2.0" == event.version);
    CHECK("REQUEST" == event.type);
    CHECK("GET /hello" == event.route_key);
    CHECK("/hello" == event.raw_path);
    CHECK("a=1&b=2" == event.raw_query_string);
    CHECK("" == event.body);
    CHECK_FALSE(event.is_base64_encoded);
    CHECK("a,b" == event.headers.at("Accept"));
    CHECK("sess-42" == event.headers.at("X-Session-Id"));
  }

  SECTION("request context")
  {
    RequestContext const &ctx = event.request_context;
    CHECK("local" == ctx.account_id);
    CHECK("local" == ctx.api_id);
    CHECK("local" == ctx.stage);
    CHECK("api.example.com" == ctx.domain_name);
    CHECK("api" == ctx.domain_prefix);
    CHECK("req-1" == ctx.request_id);
    CHECK(event.route_key == ctx.route_key);
    CHECK("2023-11-14T22:13:20Z" == ctx.time);
    CHECK(1700000000123 == ctx.time_epoch);

    CHECK("GET" == ctx.http.method);
    CHECK("/hello" == ctx.http.path);
    CHECK("HTTP/1.1" == ctx.http.protocol);
    CHECK("10.0.0.7" == ctx.http.source_ip);
    CHECK("curl/8.0" == ctx.http.user_agent);
  }

  SECTION("identity source")
  {
    REQUIRE(1 == event.identity_source.size());
    CHECK("sess-42" == event.identity_source.front());
  }
}

TEST_CASE("event assembly without optional fields")
{
  RequestSnapshot snapshot;
  snapshot.method      = "POST";
  snapshot.path        = "/";
  snapshot.host        = "localhost";
  snapshot.remote_addr = "[::1]:40000";
  snapshot.protocol    = "HTTP/2.0";

  SECTION("no session, no agent")
  {
    InvocationEvent const event{assemble_event(snapshot, "req-2", FIXED_TIME)};
    CHECK(event.identity_source.empty());
    CHECK(event.headers.empty());
    CHECK("" == event.request_context.http.user_agent);
    CHECK("::1" == event.request_context.http.source_ip);
    CHECK("localhost" == event.request_context.domain_prefix);
    CHECK("POST /" == event.route_key);
    CHECK("" == event.raw_query_string);
  }

  SECTION("empty session value")
  {
    snapshot.headers = {{"X-Session-Id", ""}};
    InvocationEvent const event{assemble_event(snapshot, "req-3", FIXED_TIME)};
    CHECK(event.identity_source.empty());
    CHECK("" == event.headers.at("X-Session-Id"));
  }

  SECTION("unparseable remote address")
  {
    snapshot.remote_addr = "pipe";
    InvocationEvent const event{assemble_event(snapshot, "req-4", FIXED_TIME)};
    CHECK("pipe" == event.request_context.http.source_ip);
  }
}

TEST_CASE("percent-encoded paths are carried as received")
{
  RequestSnapshot snapshot{sample_request()};
  snapshot.path = "/a%20b/c%2Fd";

  InvocationEvent const event{assemble_event(snapshot, "req-5", FIXED_TIME)};
  CHECK("/a%20b/c%2Fd" == event.raw_path);
  CHECK("/a%20b/c%2Fd" == event.request_context.http.path);
  CHECK("GET /a%20b/c%2Fd" == event.route_key);
}

TEST_CASE("event built from a random source")
{
  ZeroSource            source;
  InvocationEvent const event{build_event(sample_request(), source)};

  CHECK("00000000-0000-4000-8000-000000000000" == event.request_context.request_id);
  CHECK(0 < event.request_context.time_epoch);
  CHECK(20 == event.request_context.time.size());
}

TEST_CASE("json strings")
{
  CHECK(R"("plain")" == json_string("plain"));
  CHECK(R"("")" == json_string(""));
  CHECK(R"("a\"b\\c")" == json_string("a\"b\\c"));
  CHECK(R"("\n\r\t\b\f")" == json_string("\n\r\t\b\f"));
  CHECK(R"("\u0001\u001f")" == json_string("\x01\x1f"));

  SECTION("html sensitive characters")
  {
    CHECK(R"("\u003cb\u003e\u0026")" == json_string("<b>&"));
  }

  SECTION("utf-8")
  {
    CHECK("\"caf\xc3\xa9 \xf0\x9f\x99\x82\"" == json_string("caf\xc3\xa9 \xf0\x9f\x99\x82"));
    CHECK(R"("\u2028\u2029")" == json_string("\xe2\x80\xa8\xe2\x80\xa9"));
  }

  SECTION("invalid utf-8")
  {
    CHECK(R"("a\ufffdb")" == json_string("a\xff"
                                         "b"));
    CHECK(R"("\ufffd\ufffd")" == json_string("\xc0\xaf"));
    CHECK(R"("\ufffd\ufffd")" == json_string("\xe2\x80"));
  }
}

TEST_CASE("json event encoding")
{
  JsonEventEncoder const encoder;
  InvocationEvent const  event{assemble_event(sample_request(), "req-1", FIXED_TIME)};
  std::string            body;
  std::string            error;

  CHECK("application/json" == encoder.content_type());
  REQUIRE(encoder.encode(event, body, error));
  CHECK(error.empty());

  std::string const expected{
    R"({"body":"","headers":{"Accept":"a,b","User-Agent":"curl/8.0","X-Session-Id":"sess-42"},)"
    R"("identitySource":["sess-42"],"isBase64Encoded":false,"rawPath":"/hello","rawQueryString":"a=1\u0026b=2",)"
    R"("requestContext":{"accountId":"local","apiId":"local","domainName":"api.example.com","domainPrefix":"api",)"
    R"("http":{"method":"GET","path":"/hello","protocol":"HTTP/1.1","sourceIp":"10.0.0.7","userAgent":"curl/8.0"},)"
    R"("requestId":"req-1","routeKey":"GET /hello","stage":"local","time":"2023-11-14T22:13:20Z","timeEpoch":1700000000123},)"
    R"("routeKey":"GET /hello","type":"REQUEST","version":"2.0"})"};
  CHECK(expected == body);

  SECTION("empty identity source is an empty array")
  {
    RequestSnapshot snapshot{sample_request()};
    snapshot.headers.clear();
    REQUIRE(encoder.encode(assemble_event(snapshot, "req-1", FIXED_TIME), body, error));
    CHECK(std::string::npos != body.find(R"("headers":{},"identitySource":[],)"));
  }
}

TEST_CASE("request rewrite")
{
  InvocationEvent const event{assemble_event(sample_request(), "req-1", FIXED_TIME)};

  SECTION("json encoder")
  {
    JsonEventEncoder const encoder;
    OutboundRequest        out;
    std::string            error;

    REQUIRE(rewrite_request(event, encoder, out, error));
    CHECK("POST" == out.method);
    CHECK("/2015-03-31/functions/function/invocations" == out.path);
    CHECK(INVOCATION_PATH == out.path);

    std::string expected_body;
    REQUIRE(encoder.encode(event, expected_body, error));
    CHECK(expected_body == out.body);

    HeaderField const *content_type = find_field(out.set_fields, "Content-Type");
    REQUIRE(nullptr != content_type);
    CHECK("application/json" == content_type->second);

    HeaderField const *content_length = find_field(out.set_fields, "Content-Length");
    REQUIRE(nullptr != content_length);
    CHECK(std::to_string(out.body.size()) == content_length->second);

    REQUIRE(1 == out.removed_fields.size());
    CHECK("Transfer-Encoding" == out.removed_fields.front());
  }

  SECTION("encoding failure")
  {
    FailingEncoder const encoder;
    OutboundRequest      out;
    out.method = "GET";
    out.path   = "/untouched";
    std::string error;

    CHECK_FALSE(rewrite_request(event, encoder, out, error));
    CHECK("unsupported value" == error);
    CHECK("GET" == out.method);
    CHECK("/untouched" == out.path);
    CHECK(out.body.empty());
    CHECK(out.set_fields.empty());
    CHECK(out.removed_fields.empty());
  }
}
