/**
 * PORTWAY - API Gateway Request Kernel
 * Server component - Async I/O foundation with graceful shutdown
 */

#ifndef PORTWAY_SERVER_SERVER_HPP
#define PORTWAY_SERVER_SERVER_HPP

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

namespace portway::server {

namespace asio = boost::asio;

/**
 * Server configuration for async I/O foundation
 */
struct ServerConfig {
    std::size_t thread_count{std::thread::hardware_concurrency()};
};

/**
 * Called on SIGHUP
 */
using ReloadHandler = std::function<void()>;

/**
 * Called once when shutdown begins (SIGINT, SIGTERM or stop())
 */
using StopHandler = std::function<void()>;

/**
 * Main server class - manages io_context, thread pool and signals
 *
 * Listeners and upstream exchanges share the io_context. Uses std::jthread
 * with stop_token for graceful shutdown.
 */
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    // Non-copyable, non-movable (owns threads and io_context)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * Install signal handling and start the worker threads
     */
    void start(ReloadHandler reload_handler, StopHandler stop_handler);

    /**
     * Request graceful shutdown
     */
    void stop();

    /**
     * Block until server stops
     */
    void wait();

    /**
     * Check if server is running
     */
    bool is_running() const noexcept;

    /**
     * Get the io_context (for scheduling async work)
     */
    asio::io_context& get_io_context() noexcept;

private:
    void run_io_context(std::stop_token stop_token);
    void setup_signal_handling();

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    ReloadHandler reload_handler_;
    StopHandler stop_handler_;

    std::atomic<bool> running_{false};
};

} // namespace portway::server

#endif // PORTWAY_SERVER_SERVER_HPP
