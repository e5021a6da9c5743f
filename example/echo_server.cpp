#include "nblisten/nblisten.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <thread>

namespace {

std::atomic<std::size_t> handled_connections{0};

void echo_connection(nblisten::net::tcp_stream stream) {
    handled_connections.fetch_add(1, std::memory_order_relaxed);

    const auto peer = stream.peer_endpoint();
    if (peer.has_value()) {
        std::cout << "connection from "
                  << nblisten::net::format_endpoint(peer.value()) << '\n';
    }

    std::array<std::byte, 4096> buffer{};
    while (true) {
        const auto read_result = stream.read_some(buffer);
        if (!read_result.has_value()) {
            std::cerr << "read failed: " << read_result.error() << '\n';
            return;
        }
        if (read_result.value() == 0) {
            return;
        }

        const auto write_result = nblisten::net::write_all(
            stream, std::span<const std::byte>{buffer.data(), read_result.value()});
        if (!write_result.has_value()) {
            std::cerr << "write failed: " << write_result.error() << '\n';
            return;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "usage: nblisten_echo_server [address] [seconds]\n";
        return 2;
    }

    const std::string address = argc > 1 ? argv[1] : "127.0.0.1:8080";
    unsigned long seconds = 5;
    if (argc > 2) {
        try {
            std::size_t consumed = 0;
            const auto text = std::string{argv[2]};
            seconds = std::stoul(text, &consumed);
            if (consumed != text.size()) {
                std::cerr << "invalid seconds argument\n";
                return 2;
            }
        } catch (const std::exception&) {
            std::cerr << "invalid seconds argument\n";
            return 2;
        }
    }

    auto listener_result = nblisten::net::tcp_listener::bind_shared(address);
    if (!listener_result.has_value()) {
        std::cerr << "bind " << address
                  << " failed: " << listener_result.error() << '\n';
        return 1;
    }
    auto listener = listener_result.value();

    const auto local = listener->local_endpoint();
    if (local.has_value()) {
        std::cout << "listening on "
                  << nblisten::net::format_endpoint(local.value()) << " for "
                  << seconds << "s\n";
    }

    std::thread controller([listener, seconds]() {
        std::this_thread::sleep_for(std::chrono::seconds{seconds});
        listener->close();
    });

    const auto status =
        listener->handle_incoming(echo_connection, std::chrono::milliseconds{10});
    controller.join();

    if (!status.has_value()) {
        std::cerr << "terminated with: " << status.error() << '\n';
        return 1;
    }
    std::cout << "stopped after "
              << handled_connections.load(std::memory_order_relaxed)
              << " connection(s)\n";
    return 0;
}
