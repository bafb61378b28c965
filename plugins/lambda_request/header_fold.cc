/** @file
 *
 * Lambda request plugin: header folding implementation.
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

#include "header_fold.h"

#include <strings.h>

namespace lambda_request
{

namespace
{
  // RFC 7230 tchar.
  bool
  is_token_char(unsigned char c)
  {
    if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9')) {
      return true;
    }
    switch (c) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
    }
  }
} // namespace

std::string
canonical_header_key(std::string_view name)
{
  for (char const c : name) {
    if (!is_token_char(static_cast<unsigned char>(c))) {
      return std::string{name};
    }
  }

  std::string key{name};
  bool        upper = true;
  for (char &c : key) {
    if (upper && 'a' <= c && c <= 'z') {
      c -= 'a' - 'A';
    } else if (!upper && 'A' <= c && c <= 'Z') {
      c += 'a' - 'A';
    }
    upper = ('-' == c);
  }
  return key;
}

HeaderMap
fold_headers(HeaderList const &headers)
{
  HeaderMap folded;
  for (auto const &[name, value] : headers) {
    auto [it, inserted] = folded.try_emplace(canonical_header_key(name), value);
    if (!inserted) {
      it->second.push_back(',');
      it->second.append(value);
    }
  }
  return folded;
}

std::string_view
first_header_value(HeaderList const &headers, std::string_view name)
{
  for (auto const &[field, value] : headers) {
    if (field.size() == name.size() && 0 == strncasecmp(field.data(), name.data(), name.size())) {
      return value;
    }
  }
  return {};
}

} // namespace lambda_request
