#pragma once
#include "http_definitions.hpp"
#include "http_request.hpp"
#include "http_response.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include "network/network.hpp"
#include "svgserve/basic/log.h"

using asio::ip::tcp;

namespace network
{
namespace http
{
// fill the response for a complete request. exceptions become 500 responses
using http_handler = std::function<void(http_response&, const http_request&)>;

class http_connection : public std::enable_shared_from_this<http_connection>, private asio::noncopyable {
public:
    template <typename... Args>
    static decltype(auto) make_shared(Args&&... args) {
        return std::make_shared<http_connection>(std::forward<Args>(args)...);
    }
    http_connection(tcp::socket socket,
                    std::shared_ptr<const http_handler> handler,
                    std::size_t timeout_msec) :
    handler_(std::move(handler)), socket_(std::move(socket)), timeout_check_timer_(socket_.get_executor()),
    timeout_msec_(timeout_msec) {
    }
    ~http_connection() {
        STRACE("release http_connection {:p}", (void*)this);
    }

    void start() {
        asio::error_code ec;
        auto remote = socket_.remote_endpoint(ec);
        if (ec) {
            SDEBUG("http_connection get remote endpoint failed {}", ec.message());
            release_obj();
            return;
        }
        request_.ip_   = remote.address().to_string();
        request_.port_ = remote.port();
        reset_timer();
        handle_read();
    }

    void release_obj() {
        if (!reference_.release()) return;
        asio::post(socket_.get_executor(), [this, ref = shared_from_this()] { close(); });
    }

    bool has_closed() const {
        return !reference_.is_valid();
    }

private:
    void reset_timer() {
        if (timeout_msec_ == 0) {
            return;
        }

        auto self(shared_from_this());
        timeout_check_timer_.expires_after(std::chrono::milliseconds(timeout_msec_));
        timeout_check_timer_.async_wait([this, self](const asio::error_code& ec) {
            if (!reference_.is_valid()) {
                return;
            }

            if (ec || b_responding_) {
                return;
            }
            // no data moved during a whole period
            if (b_waiting_process_any_data) {
                SDEBUG("http_connection {}:{} idle timeout", request_.get_ip(), request_.get_port());
                release_obj();
            } else {
                b_waiting_process_any_data.exchange(true);
                reset_timer();
            }
        });
    }

    void handle_read() {
        auto self(shared_from_this());
        socket_.async_read_some(
            asio::buffer(buffer_), [this, self](asio::error_code ec, std::size_t length) {
                if (!reference_.is_valid()) {
                    return;
                }
                if (ec) {
                    if (ec != asio::error::eof) SDEBUG("http_connection read failed {}", ec.message());
                    release_obj();
                    return;
                }
                // reset timeout
                b_waiting_process_any_data.exchange(false);
                std::optional<bool> result;
                std::tie(result, std::ignore) = request_.parse(buffer_.data(), buffer_.data() + length);

                auto resultHasVal = result.has_value();
                // all data finished
                if (resultHasVal && result.value()) {
                    process_http_request();
                } else if (resultHasVal && !result.value()) {
                    process_bad_request();
                } else {
                    // read more data
                    handle_read();
                }
            });
    }

    void process_http_request() {
        try {
            (*handler_)(response_, request_);
        } catch (const std::exception& e) {
            SERR("handle {} {} failed:{}", request_.get_method_str(), request_.get_uri(), e.what());
            response_.stock_response(http_response::internal_server_error);
        }
        perform_response();
    }

    void process_bad_request() {
        response_.stock_response(http_response::bad_request);
        perform_response();
    }

    void perform_response() {
        SDEBUG("{}:{} \"{} {}\" {}", request_.get_ip(), request_.get_port(), request_.get_method_str(),
               request_.get_uri(), static_cast<int>(response_.get_status()));
        // the idle timer guards reads only, a slow reader must still get the whole response
        b_responding_ = true;
        cancel_timer();
        asio::async_write(socket_, response_.to_buffers(),
                          [this, self = shared_from_this()](asio::error_code ec, std::size_t) {
                              if (!reference_.is_valid()) {
                                  return;
                              }
                              if (ec) {
                                  SDEBUG("http_connection write response failed {}", ec.message());
                              }
                              release_obj();
                          });
    }

    void cancel_timer() {
        if (timeout_msec_ == 0) {
            return;
        }
        try {
            timeout_check_timer_.cancel();
        } catch (const std::exception& e) {
            STRACE("cancel timer failed {}", e.what());
        }
    }

    void close() {
        cancel_timer();
        asio::error_code ignored_ec;
        socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);
        socket_.close(ignored_ec);
    }

    std::shared_ptr<const http_handler> handler_;
    network_data_reference reference_;
    tcp::socket socket_;

    std::atomic_bool b_waiting_process_any_data = false;
    bool b_responding_                          = false;
    asio::steady_timer timeout_check_timer_;
    std::size_t timeout_msec_;

    /// Buffer for incoming data.
    std::array<char, kHttpReadBufferSize> buffer_;
    // http data
    http_request request_;
    http_response response_;
};

} // namespace http
} // namespace network
