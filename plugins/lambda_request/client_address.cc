/** @file
 *
 * Lambda request plugin: client address resolution implementation.
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

#include "client_address.h"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lambda_request
{

std::optional<HostPort>
split_host_port(std::string_view address)
{
  auto const colon = address.rfind(':');
  if (std::string_view::npos == colon) {
    return std::nullopt; // missing port
  }

  std::string_view host;
  std::size_t      host_begin = 0; // where stray brackets are not allowed
  std::size_t      port_begin = 0;

  if (!address.empty() && '[' == address.front()) {
    auto const close = address.find(']');
    if (std::string_view::npos == close) {
      return std::nullopt; // missing ']'
    }
    if (close + 1 != colon) {
      // Either "[::1]" with no port or garbage between ']' and ':'.
      return std::nullopt;
    }
    host       = address.substr(1, close - 1);
    host_begin = 1;
    port_begin = close + 1;
  } else {
    host = address.substr(0, colon);
    if (std::string_view::npos != host.find(':')) {
      return std::nullopt; // too many colons
    }
  }

  if (std::string_view::npos != address.find('[', host_begin)) {
    return std::nullopt;
  }
  if (std::string_view::npos != address.find(']', port_begin)) {
    return std::nullopt;
  }

  return HostPort{host, address.substr(colon + 1)};
}

std::string
resolve_client_ip(std::string_view remote_addr)
{
  if (auto const parts = split_host_port(remote_addr); parts) {
    return std::string{parts->host};
  }
  return std::string{remote_addr};
}

std::string
format_sockaddr(sockaddr const *addr)
{
  char ip[INET6_ADDRSTRLEN];

  if (nullptr == addr) {
    return {};
  }

  if (AF_INET == addr->sa_family) {
    auto const *sin = reinterpret_cast<sockaddr_in const *>(addr);
    if (nullptr == inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip))) {
      return {};
    }
    return std::string{ip} + ':' + std::to_string(ntohs(sin->sin_port));
  } else if (AF_INET6 == addr->sa_family) {
    auto const *sin6 = reinterpret_cast<sockaddr_in6 const *>(addr);
    if (nullptr == inet_ntop(AF_INET6, &sin6->sin6_addr, ip, sizeof(ip))) {
      return {};
    }
    return std::string{"["} + ip + "]:" + std::to_string(ntohs(sin6->sin6_port));
  }

  return {};
}

void
loopback_source_address(sockaddr const *client, sockaddr_storage &out)
{
  memset(&out, 0, sizeof(out));

  if (nullptr != client && AF_INET == client->sa_family) {
    memcpy(&out, client, sizeof(sockaddr_in));
  } else if (nullptr != client && AF_INET6 == client->sa_family) {
    memcpy(&out, client, sizeof(sockaddr_in6));
  } else {
    auto *const sin      = reinterpret_cast<sockaddr_in *>(&out);
    sin->sin_family      = AF_INET;
    sin->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  }
}

} // namespace lambda_request
