#include "nblisten/nblisten.hpp"

#include <cerrno>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::byte> to_bytes(std::string_view value) {
    std::vector<std::byte> bytes;
    bytes.reserve(value.size());
    for (const char ch : value) {
        bytes.push_back(static_cast<std::byte>(ch));
    }
    return bytes;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "usage: nblisten_echo_client [address] [payload]\n";
        return 2;
    }

    const std::string address = argc > 1 ? argv[1] : "127.0.0.1:8080";
    const std::string payload = argc > 2 ? argv[2] : "hello nblisten";

    const auto candidates = nblisten::net::resolve(address);
    if (!candidates.has_value()) {
        std::cerr << "resolve " << address
                  << " failed: " << candidates.error() << '\n';
        return 1;
    }

    nblisten::result<nblisten::net::tcp_stream> client_result =
        nblisten::err<nblisten::net::tcp_stream>(
            nblisten::make_error_from_errno(EHOSTUNREACH));
    for (const auto& candidate : candidates.value()) {
        client_result = nblisten::net::tcp_stream::connect(candidate);
        if (client_result.has_value()) {
            break;
        }
    }
    if (!client_result.has_value()) {
        std::cerr << "connect failed: " << client_result.error() << '\n';
        return 1;
    }

    auto client = std::move(client_result.value());
    const auto request = to_bytes(payload);
    const auto write_result = nblisten::net::write_all(client, request);
    if (!write_result.has_value()) {
        std::cerr << "write failed: " << write_result.error() << '\n';
        return 1;
    }

    std::vector<std::byte> response(request.size());
    const auto read_result = nblisten::net::read_exact(client, response);
    if (!read_result.has_value()) {
        std::cerr << "read failed: " << read_result.error() << '\n';
        return 1;
    }
    if (response != request) {
        std::cerr << "echo mismatch\n";
        return 1;
    }

    std::cout << "echoed " << response.size() << " byte(s)\n";
    return 0;
}
