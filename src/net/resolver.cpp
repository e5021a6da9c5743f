#include "nblisten/net/resolver.hpp"

#include "address_text.hpp"
#include "socket_helpers.hpp"

#include <algorithm>
#include <cerrno>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace {

struct addrinfo_deleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};

int map_resolver_status(int status, int saved_errno) noexcept {
    switch (status) {
    case EAI_AGAIN:
        return EAGAIN;
    case EAI_NONAME:
        return ENOENT;
    case EAI_MEMORY:
        return ENOMEM;
    case EAI_SYSTEM:
        return saved_errno != 0 ? saved_errno : EHOSTUNREACH;
    default:
        return EHOSTUNREACH;
    }
}

} // namespace

namespace nblisten::net {

result<std::vector<endpoint>> resolve(const std::string& host,
                                      const std::string& service) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* raw_result = nullptr;
    errno = 0;
    const int status =
        ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw_result);
    if (status != 0) {
        return err<std::vector<endpoint>>(
            make_error_from_errno(map_resolver_status(status, errno)));
    }
    const std::unique_ptr<addrinfo, addrinfo_deleter> owned{raw_result};

    std::vector<endpoint> endpoints;
    for (const addrinfo* cursor = owned.get(); cursor != nullptr;
         cursor = cursor->ai_next) {
        if (cursor->ai_addr == nullptr ||
            (cursor->ai_family != AF_INET && cursor->ai_family != AF_INET6)) {
            continue;
        }

        detail::socket_address addr{};
        const auto length = std::min<std::size_t>(cursor->ai_addrlen,
                                                  sizeof(addr.storage));
        std::copy_n(reinterpret_cast<const unsigned char*>(cursor->ai_addr),
                    length, reinterpret_cast<unsigned char*>(&addr.storage));
        addr.length = static_cast<socklen_t>(length);

        auto converted = detail::from_sockaddr(addr);
        if (!converted.has_value()) {
            continue;
        }
        if (std::find(endpoints.begin(), endpoints.end(), converted.value()) ==
            endpoints.end()) {
            endpoints.push_back(std::move(converted.value()));
        }
    }

    if (endpoints.empty()) {
        return err<std::vector<endpoint>>(make_error_from_errno(ENOENT));
    }
    return endpoints;
}

result<std::vector<endpoint>> resolve(std::string_view address) {
    const auto parts = detail::split_host_port(address);
    if (!parts.has_value()) {
        return err<std::vector<endpoint>>(parts.error());
    }
    return resolve(std::string{parts->host}, std::string{parts->port});
}

} // namespace nblisten::net
