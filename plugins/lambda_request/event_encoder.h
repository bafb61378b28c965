/** @file
 *
 * Lambda request plugin: invocation event encoding.
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

#include <string>
#include <string_view>

namespace lambda_request
{

struct InvocationEvent;

/** Serializes an invocation event into a request body.
 *
 * Shared by every transaction of a plugin instance, so encode() must not keep state.
 */
class EventEncoder
{
public:
  virtual ~EventEncoder() = default;

  /// Media type of the encoded body.
  virtual std::string_view content_type() const = 0;

  /** Encode @a event into @a out.
   *
   * @param[out] error Diagnostic when encoding fails.
   * @return false on failure, @a out must then be ignored.
   */
  virtual bool encode(InvocationEvent const &event, std::string &out, std::string &error) const = 0;
};

/** Compact UTF-8 JSON.
 *
 * Object keys are written in sorted order. Strings are escaped for safe
 * embedding in HTML: '<', '>' and '&' become \\u003c, \\u003e and \\u0026,
 * U+2028 and U+2029 are escaped, and bytes that are not valid UTF-8 are
 * replaced with U+FFFD.
 */
class JsonEventEncoder : public EventEncoder
{
public:
  std::string_view content_type() const override;
  bool             encode(InvocationEvent const &event, std::string &out, std::string &error) const override;
};

/// Append @a value to @a out as a quoted JSON string.
void append_json_string(std::string &out, std::string_view value);

} // namespace lambda_request
