#include "io_context_pool.hpp"

#include <csignal>

#include "svgserve/basic/log.h"

namespace network
{

namespace
{
std::vector<std::shared_ptr<asio::io_context>> make_io_contexts(std::size_t pool_size) {
    if (pool_size == 0) pool_size = 1;
    std::vector<std::shared_ptr<asio::io_context>> io_contexts;
    for (std::size_t i = 0; i < pool_size; ++i)
        io_contexts.emplace_back(std::make_shared<asio::io_context>(1));
    return io_contexts;
}
} // namespace

io_context_pool::io_context_pool(std::size_t pool_size) :
io_contexts_(make_io_contexts(pool_size)), signals_(*io_contexts_[0]) {
    // Give all the io_contexts work to do so that their run() functions will not
    // exit until they are explicitly stopped.
    for (auto& io_context : io_contexts_)
        work_.push_back(asio::make_work_guard(*io_context));
}

io_context_pool::~io_context_pool() {
    stop();
    join();
}

void io_context_pool::enable_signal_stop() {
    // It is safe to register for the same signal multiple times in a program,
    // provided all registration for the specified signal is made through Asio.
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
#if defined(SIGQUIT)
    signals_.add(SIGQUIT);
#endif // defined(SIGQUIT)
    signals_.async_wait([this](std::error_code ec, int signo) {
        if (ec) return;
        SINFO("quit because of signal:{}", signo);
        stop();
    });
}

void io_context_pool::start() {
    if (!threads_.empty()) return;
    for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
        threads_.emplace_back([this, i] {
            SvgServe::Utils::SetThreadName(SvgServe::StringFormat("io_loop_{}", i));
            try {
                io_contexts_[i]->run();
            } catch (const std::exception& e) {
                SERR("asio context err:{}", e.what());
            }
        });
    }
}

void io_context_pool::run() {
    start();
    join();
}

void io_context_pool::stop() {
    work_.clear();
    // Explicitly stop all io_contexts.
    for (auto& io_context : io_contexts_)
        io_context->stop();
}

void io_context_pool::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) thread.join();
    }
    threads_.clear();
}

asio::io_context& io_context_pool::get_io_context() {
    return *io_contexts_[next_io_context_.fetch_add(1) % io_contexts_.size()];
}

} // namespace network
