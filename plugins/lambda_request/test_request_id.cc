/** @file test_request_id.cc

  Unit tests for request identifiers and timestamps.

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

#include "request_id.h"
#include "timestamp.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <regex>

using namespace lambda_request;

namespace
{
std::regex const UUID_V4{"^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"};

// Delivers 0x00, 0x01, ... or a constant byte.
class FixedSource : public RandomSource
{
public:
  explicit FixedSource(int fill_byte = -1) : _fill_byte(fill_byte) {}

  bool
  fill(unsigned char *buf, std::size_t len) override
  {
    for (std::size_t i = 0; i < len; ++i) {
      buf[i] = _fill_byte < 0 ? static_cast<unsigned char>(i) : static_cast<unsigned char>(_fill_byte);
    }
    ++calls;
    return true;
  }

  int calls = 0;

private:
  int _fill_byte;
};

class BrokenSource : public RandomSource
{
public:
  bool
  fill(unsigned char *, std::size_t) override
  {
    return false;
  }
};
} // namespace

TEST_CASE("request id from random bytes")
{
  SECTION("sequential bytes")
  {
    FixedSource source;
    CHECK("00010203-0405-4607-8809-0a0b0c0d0e0f" == generate_request_id(source));
    CHECK(1 == source.calls);
  }

  SECTION("version and variant bits are forced")
  {
    FixedSource       ones{0xFF};
    std::string const id{generate_request_id(ones)};
    CHECK("ffffffff-ffff-4fff-bfff-ffffffffffff" == id);
    CHECK(std::regex_match(id, UUID_V4));

    FixedSource zeros{0x00};
    CHECK("00000000-0000-4000-8000-000000000000" == generate_request_id(zeros));
  }

  SECTION("secure source")
  {
    SecureRandomSource source;
    std::string const  first{generate_request_id(source)};
    std::string const  second{generate_request_id(source)};

    CHECK(36 == first.size());
    CHECK(std::regex_match(first, UUID_V4));
    CHECK(std::regex_match(second, UUID_V4));
    CHECK(first != second);
  }
}

TEST_CASE("request id fallback")
{
  SECTION("timestamp bytes")
  {
    UuidBytes const bytes{fallback_uuid_bytes(0x0102030405060708)};
    CHECK(0x08 == bytes[0]);
    CHECK(0x01 == bytes[7]);
    CHECK(0x00 == bytes[8]);
    CHECK(0x00 == bytes[15]);
    CHECK("08070605-0403-4201-8000-000000000000" == format_request_id(bytes));
  }

  SECTION("failing source still yields a version 4 id")
  {
    BrokenSource      source;
    std::string const id{generate_request_id(source)};
    CHECK(std::regex_match(id, UUID_V4));
    CHECK("8000-000000000000" == id.substr(19));
  }
}

TEST_CASE("timestamps")
{
  using namespace std::chrono;

  SECTION("known instant")
  {
    Timestamp const got{Timestamp::at(system_clock::time_point{milliseconds{1700000000123}})};
    CHECK("2023-11-14T22:13:20Z" == got.rfc3339);
    CHECK(1700000000123 == got.epoch_ms);
  }

  SECTION("default constructed")
  {
    Timestamp const got;
    CHECK(got.rfc3339.empty());
    CHECK(0 == got.epoch_ms);
  }

  SECTION("epoch")
  {
    Timestamp const got{Timestamp::at(system_clock::time_point{})};
    CHECK("1970-01-01T00:00:00Z" == got.rfc3339);
    CHECK(0 == got.epoch_ms);
  }

  SECTION("text and milliseconds agree")
  {
    Timestamp const got{Timestamp::now()};
    Timestamp const again{Timestamp::at(system_clock::time_point{milliseconds{got.epoch_ms}})};
    CHECK(again.rfc3339 == got.rfc3339);
    CHECK(again.epoch_ms == got.epoch_ms);
  }
}
