#include "http_server.hpp"

namespace network::http
{

http_server::http_server(const http_server_config& config, io_context_pool& pool) :
config_(config), pool_(pool), acceptor_(pool.get_io_context()),
handler_(std::make_shared<const http_handler>([](http_response& response, const http_request&) {
    response.stock_response(http_response::not_implemented);
})) {
    protocal_helper::init_acceptor(acceptor_, protocal_helper::make_endpoint(config_.bind_address, config_.port));
    local_endpoint_ = acceptor_.local_endpoint();
}

http_server::~http_server() {
    STRACE("release http_server");
}

void http_server::set_handler(http_handler handler) {
    if (has_started_) {
        SWARN("http_server handler can't be changed after start");
        return;
    }
    handler_ = std::make_shared<const http_handler>(std::move(handler));
}

void http_server::start() {
    bool expected_value = false;
    if (!has_started_.compare_exchange_strong(expected_value, true)) return;
    SINFO("start http server on {}:{}", local_endpoint_.address().to_string(), local_endpoint_.port());
    do_accept();
}

void http_server::release_obj() {
    reference_.release();
    bool expected_value = true;
    if (!has_started_.compare_exchange_strong(expected_value, false)) return;
    asio::post(acceptor_.get_executor(), [this, ref = shared_from_this()] {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) SDEBUG("close http acceptor failed {}", ec.message());
    });
}

asio::ip::tcp::endpoint http_server::local_endpoint() const {
    return local_endpoint_;
}

void http_server::do_accept() {
    acceptor_.async_accept(pool_.get_io_context(),
                           [this, ptr = shared_from_this()](asio::error_code ec, asio::ip::tcp::socket socket) {
                               if (!reference_.is_valid()) {
                                   return;
                               }
                               if (!acceptor_.is_open()) {
                                   return;
                               }

                               if (ec) {
                                   // a failed accept doesn't stop the server
                                   SDEBUG("http accept failed {}", ec.message());
                               } else {
                                   auto new_conn = http_connection::make_shared(
                                       std::move(socket), handler_, config_.timeout_msec);
                                   new_conn->start();
                                   STRACE("start http_connection {:p}", (void*)(new_conn.get()));
                               }

                               do_accept();
                           });
}

} // namespace network::http
