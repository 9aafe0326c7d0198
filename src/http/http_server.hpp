#pragma once

#include "http_connection.h"
#include "http_definitions.hpp"

#include <atomic>
#include <memory>

#include "network/network.hpp"

namespace network
{
namespace http
{

class http_server : private asio::noncopyable, public std::enable_shared_from_this<http_server> {
public:
    template <typename... Args>
    static decltype(auto) make_shared(Args&&... args) {
        return std::make_shared<http_server>(std::forward<Args>(args)...);
    }
    // throw asio::system_error when the address is invalid or it can't listen on it
    http_server(const http_server_config& config, io_context_pool& pool);
    ~http_server();

    // set the handler every complete request is passed to, call it before start
    void set_handler(http_handler handler);

    void start();

    void stop() {
        release_obj();
    }

    void release_obj();

    // the bound endpoint, its port is the real one when config.port is 0
    asio::ip::tcp::endpoint local_endpoint() const;

    const http_server_config& config() const {
        return config_;
    }

private:
    void do_accept();

    http_server_config config_;
    io_context_pool& pool_;
    network_data_reference reference_;
    std::atomic_bool has_started_ = false;
    tcp::acceptor acceptor_;
    asio::ip::tcp::endpoint local_endpoint_;
    std::shared_ptr<const http_handler> handler_;
};
} // namespace http
} // namespace network
