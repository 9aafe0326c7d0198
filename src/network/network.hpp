#pragma once

#include "io_context_pool.hpp"
#include "use_asio.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace network
{
struct network_data_reference {
    bool is_valid() const {
        return !__has_released;
    }
    operator bool() const {
        return is_valid();
    }
    bool operator!() const {
        return !is_valid();
    }
    // return true only for the first call
    bool release() {
        auto expected_value = false;
        return __has_released.compare_exchange_strong(expected_value, true);
    }
    std::atomic_bool __has_released = false;
};

struct protocal_helper {
    // throw asio::system_error when address is not an ip literal
    static asio::ip::tcp::endpoint make_endpoint(const std::string& address, std::uint16_t port) {
        return asio::ip::tcp::endpoint(asio::ip::make_address(address), port);
    }
    // throw asio::system_error when open/bind/listen failed
    static void init_acceptor(asio::ip::tcp::acceptor& acceptor, const asio::ip::tcp::endpoint& end_point) {
        acceptor.open(end_point.protocol());
        acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        if (end_point.address().is_v6() && end_point.address().is_unspecified()) {
            // "::" accepts both ipv4 and ipv6 connections
            acceptor.set_option(asio::ip::v6_only(false));
        }
        acceptor.bind(end_point);
        acceptor.listen();
    }
};
} // namespace network
