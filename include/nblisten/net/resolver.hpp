#pragma once

/**
 * @file
 * @brief Host name resolution through the system resolver.
 */

#include "nblisten/core/result.hpp"
#include "nblisten/net/endpoint.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace nblisten::net {

/**
 * @brief Resolve a host and service into TCP endpoints.
 *
 * Calls `getaddrinfo` for both address families and keeps the order the
 * resolver returned. Resolver failures are mapped to errno values:
 * `EAI_AGAIN` to EAGAIN, `EAI_NONAME` to ENOENT, `EAI_MEMORY` to ENOMEM,
 * `EAI_SYSTEM` to the errno it left behind, anything else to EHOSTUNREACH.
 *
 * @param host Host name or numeric literal.
 * @param service Port number or service name.
 * @return At least one endpoint, or ENOENT when nothing usable came back.
 */
[[nodiscard]] result<std::vector<endpoint>> resolve(const std::string& host,
                                                    const std::string& service);

/**
 * @brief Resolve `host:port` or `[v6-host]:port` text.
 * @return Candidate endpoints, or EINVAL for malformed text.
 */
[[nodiscard]] result<std::vector<endpoint>> resolve(std::string_view address);

} // namespace nblisten::net
