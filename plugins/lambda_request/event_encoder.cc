/** @file
 *
 * Lambda request plugin: JSON encoding of the invocation event.
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

#include "event_encoder.h"
#include "invocation_event.h"

#include <cstdint>

namespace lambda_request
{

namespace
{
  constexpr std::string_view JSON_CONTENT_TYPE = "application/json";

  char const HEX[] = "0123456789abcdef";

  /** Length of the well formed UTF-8 sequence starting at @a pos.
   *
   * @return 0 if the bytes at @a pos are not a valid, shortest form encoding
   * of a scalar value.
   */
  std::size_t
  utf8_sequence_length(std::string_view s, std::size_t pos, uint32_t &cp)
  {
    auto const c0 = static_cast<unsigned char>(s[pos]);
    if (c0 < 0xC2 || c0 > 0xF4) {
      return 0;
    }

    std::size_t const len = c0 < 0xE0 ? 2 : c0 < 0xF0 ? 3 : 4;
    if (pos + len > s.size()) {
      return 0;
    }

    // The second byte range excludes overlong forms, surrogates and values past U+10FFFF.
    unsigned char lo = 0x80, hi = 0xBF;
    switch (c0) {
    case 0xE0:
      lo = 0xA0;
      break;
    case 0xED:
      hi = 0x9F;
      break;
    case 0xF0:
      lo = 0x90;
      break;
    case 0xF4:
      hi = 0x8F;
      break;
    default:
      break;
    }

    auto const c1 = static_cast<unsigned char>(s[pos + 1]);
    if (c1 < lo || hi < c1) {
      return 0;
    }
    cp = (c0 & (0xFF >> (len + 1))) << 6 | (c1 & 0x3F);

    for (std::size_t i = 2; i < len; ++i) {
      auto const cn = static_cast<unsigned char>(s[pos + i]);
      if (cn < 0x80 || 0xBF < cn) {
        return 0;
      }
      cp = cp << 6 | (cn & 0x3F);
    }
    return len;
  }

  void
  append_key(std::string &out, std::string_view key)
  {
    append_json_string(out, key);
    out.push_back(':');
  }

  void
  append_headers(std::string &out, HeaderMap const &headers)
  {
    out.push_back('{');
    bool first = true;
    for (auto const &[name, value] : headers) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      append_key(out, name);
      append_json_string(out, value);
    }
    out.push_back('}');
  }

  void
  append_string_array(std::string &out, std::vector<std::string> const &values)
  {
    out.push_back('[');
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      append_json_string(out, values[i]);
    }
    out.push_back(']');
  }

  void
  append_http(std::string &out, HttpDescription const &http)
  {
    out.push_back('{');
    append_key(out, "method");
    append_json_string(out, http.method);
    out.push_back(',');
    append_key(out, "path");
    append_json_string(out, http.path);
    out.push_back(',');
    append_key(out, "protocol");
    append_json_string(out, http.protocol);
    out.push_back(',');
    append_key(out, "sourceIp");
    append_json_string(out, http.source_ip);
    out.push_back(',');
    append_key(out, "userAgent");
    append_json_string(out, http.user_agent);
    out.push_back('}');
  }

  void
  append_request_context(std::string &out, RequestContext const &ctx)
  {
    out.push_back('{');
    append_key(out, "accountId");
    append_json_string(out, ctx.account_id);
    out.push_back(',');
    append_key(out, "apiId");
    append_json_string(out, ctx.api_id);
    out.push_back(',');
    append_key(out, "domainName");
    append_json_string(out, ctx.domain_name);
    out.push_back(',');
    append_key(out, "domainPrefix");
    append_json_string(out, ctx.domain_prefix);
    out.push_back(',');
    append_key(out, "http");
    append_http(out, ctx.http);
    out.push_back(',');
    append_key(out, "requestId");
    append_json_string(out, ctx.request_id);
    out.push_back(',');
    append_key(out, "routeKey");
    append_json_string(out, ctx.route_key);
    out.push_back(',');
    append_key(out, "stage");
    append_json_string(out, ctx.stage);
    out.push_back(',');
    append_key(out, "time");
    append_json_string(out, ctx.time);
    out.push_back(',');
    append_key(out, "timeEpoch");
    out.append(std::to_string(ctx.time_epoch));
    out.push_back('}');
  }
} // namespace

void
append_json_string(std::string &out, std::string_view value)
{
  out.push_back('"');
  std::size_t i = 0;
  while (i < value.size()) {
    auto const c = static_cast<unsigned char>(value[i]);

    if (c < 0x80) {
      switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '<':
      case '>':
      case '&':
        out.append("\\u00");
        out.push_back(HEX[c >> 4]);
        out.push_back(HEX[c & 0x0F]);
        break;
      default:
        if (c < 0x20) {
          out.append("\\u00");
          out.push_back(HEX[c >> 4]);
          out.push_back(HEX[c & 0x0F]);
        } else {
          out.push_back(static_cast<char>(c));
        }
        break;
      }
      ++i;
      continue;
    }

    uint32_t          cp  = 0;
    std::size_t const len = utf8_sequence_length(value, i, cp);
    if (0 == len) {
      out.append("\\ufffd");
      ++i;
    } else if (0x2028 == cp || 0x2029 == cp) {
      out.append("\\u202");
      out.push_back(HEX[cp & 0x0F]);
      i += len;
    } else {
      out.append(value.substr(i, len));
      i += len;
    }
  }
  out.push_back('"');
}

std::string_view
JsonEventEncoder::content_type() const
{
  return JSON_CONTENT_TYPE;
}

bool
JsonEventEncoder::encode(InvocationEvent const &event, std::string &out, std::string & /* error ATS_UNUSED */) const
{
  out.clear();
  out.reserve(1024);

  out.push_back('{');
  append_key(out, "body");
  append_json_string(out, event.body);
  out.push_back(',');
  append_key(out, "headers");
  append_headers(out, event.headers);
  out.push_back(',');
  append_key(out, "identitySource");
  append_string_array(out, event.identity_source);
  out.push_back(',');
  append_key(out, "isBase64Encoded");
  out.append(event.is_base64_encoded ? "true" : "false");
  out.push_back(',');
  append_key(out, "rawPath");
  append_json_string(out, event.raw_path);
  out.push_back(',');
  append_key(out, "rawQueryString");
  append_json_string(out, event.raw_query_string);
  out.push_back(',');
  append_key(out, "requestContext");
  append_request_context(out, event.request_context);
  out.push_back(',');
  append_key(out, "routeKey");
  append_json_string(out, event.route_key);
  out.push_back(',');
  append_key(out, "type");
  append_json_string(out, event.type);
  out.push_back(',');
  append_key(out, "version");
  append_json_string(out, event.version);
  out.push_back('}');

  return true;
}

} // namespace lambda_request
