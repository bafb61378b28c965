/** @file
 *
 * Lambda request plugin: header folding.
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

#include "request_snapshot.h"

#include <map>
#include <string>
#include <string_view>

namespace lambda_request
{

/// Single value per header name, ordered by name.
using HeaderMap = std::map<std::string, std::string>;

/** Canonical MIME spelling of a header name.
 *
 * The first letter and every letter following a '-' are upper cased, all
 * other letters are lower cased: "x-session-ID" becomes "X-Session-Id".
 * Names containing a space or a control character are returned unchanged.
 */
std::string canonical_header_key(std::string_view name);

/** Fold repeated header fields into one value per name.
 *
 * Names are canonicalised with canonical_header_key(). Values of the same
 * name are joined with ',' in the order they appear in @a headers.
 */
HeaderMap fold_headers(HeaderList const &headers);

/** Value of the first field named @a name (case insensitive).
 *
 * @return The value, or an empty view if there is no such field.
 */
std::string_view first_header_value(HeaderList const &headers, std::string_view name);

} // namespace lambda_request
