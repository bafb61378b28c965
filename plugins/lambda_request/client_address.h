/** @file
 *
 * Lambda request plugin: client address resolution.
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

#include <optional>
#include <string>
#include <string_view>

struct sockaddr;
struct sockaddr_storage;

namespace lambda_request
{

struct HostPort {
  std::string_view host;
  std::string_view port;
};

/** Split "host:port", "[ipv6]:port" or "[ipv6%zone]:port".
 *
 * The views refer into @a address. The port may be empty ("host:").
 *
 * @return Nothing if there is no port separator, if an unbracketed host has
 * more than one colon, or if brackets are misplaced.
 */
std::optional<HostPort> split_host_port(std::string_view address);

/** Source IP of the client.
 *
 * @return The host part of @a remote_addr if it splits, otherwise @a remote_addr itself.
 */
std::string resolve_client_ip(std::string_view remote_addr);

/** Render a socket address as "ip:port", or "[ip]:port" for IPv6.
 *
 * @return An empty string for an unsupported address family.
 */
std::string format_sockaddr(sockaddr const *addr);

/** Source address for a loopback connection made on behalf of @a client.
 *
 * IPv4 and IPv6 client addresses are copied into @a out. Anything else
 * (no address, unix sockets) becomes 127.0.0.1 with port 0.
 */
void loopback_source_address(sockaddr const *client, sockaddr_storage &out);

} // namespace lambda_request
