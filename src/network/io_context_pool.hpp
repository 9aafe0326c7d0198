#pragma once

#include "use_asio.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <thread>
#include <vector>

#include "svgserve/basic/utils.hpp"

namespace network
{
/// A pool of io_context objects, every io_context is run by its own thread.
class io_context_pool : private SvgServe::NonCopyable {
public:
    /// Construct the io_context pool, pool_size 0 is treated as 1.
    explicit io_context_pool(std::size_t pool_size = std::thread::hardware_concurrency());
    ~io_context_pool();

    /// Stop the pool when SIGINT/SIGTERM/SIGQUIT is received.
    void enable_signal_stop();

    /// Start one thread per io_context and return immediately.
    void start();

    /// Start and block until the pool is stopped.
    void run();

    /// Stop all io_context objects in the pool.
    void stop();

    /// Wait for all running threads.
    void join();

    /// Get an io_context to use, round-robin.
    asio::io_context& get_io_context();

    std::size_t size() const {
        return io_contexts_.size();
    }

private:
    typedef std::shared_ptr<asio::io_context> io_context_ptr;
    typedef asio::executor_work_guard<asio::io_context::executor_type> io_context_work;

    /// The pool of io_contexts.
    std::vector<io_context_ptr> io_contexts_;

    /// The work that keeps the io_contexts running.
    std::list<io_context_work> work_;

    std::vector<std::thread> threads_;

    /// The next io_context to use for a connection.
    std::atomic<std::size_t> next_io_context_ = 0;

    /// The signal_set is used to register for process termination notifications.
    asio::signal_set signals_;
};

} // namespace network
