/** @file
 *
 * Lambda request plugin: domain name and prefix derivation.
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

struct DomainParts {
  std::string name;
  std::string prefix;
};

/** Split a Host header value into domain name and prefix.
 *
 * Everything from the first ':' on is dropped to form the name. The prefix is
 * the first '.' separated label of the name, or the whole name if it has a
 * single label. No validation is done, so "[::1]:80" yields "[" for both.
 */
DomainParts split_domain(std::string_view host);

} // namespace lambda_request
