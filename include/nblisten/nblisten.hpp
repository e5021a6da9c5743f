#pragma once

/**
 * @file
 * @brief Umbrella include for the complete nblisten public API.
 */

#include "nblisten/core/error.hpp"
#include "nblisten/core/result.hpp"
#include "nblisten/core/unique_fd.hpp"
#include "nblisten/net/endpoint.hpp"
#include "nblisten/net/resolver.hpp"
#include "nblisten/net/tcp_listener.hpp"
#include "nblisten/net/tcp_stream.hpp"
#include "nblisten/platform/invalidate.hpp"
