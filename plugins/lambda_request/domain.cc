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

#include "domain.h"

namespace lambda_request
{

DomainParts
split_domain(std::string_view host)
{
  std::string_view name = host;
  if (auto const colon = name.find(':'); std::string_view::npos != colon) {
    name = name.substr(0, colon);
  }

  std::string_view prefix = name;
  if (auto const dot = name.find('.'); std::string_view::npos != dot) {
    prefix = name.substr(0, dot);
  }

  return {std::string{name}, std::string{prefix}};
}

} // namespace lambda_request
