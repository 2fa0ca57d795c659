/**
 * PORTWAY - API Gateway Request Kernel
 * Server implementation - Async I/O foundation with graceful shutdown
 */

#include "server/server.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace portway::server {

Server::Server(const ServerConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(config.thread_count))
    , work_guard_(asio::make_work_guard(io_context_))
    , signals_(io_context_)
{
    if (config_.thread_count == 0) {
        config_.thread_count = 1;
    }
    spdlog::debug("Server: Initializing with {} threads", config_.thread_count);
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(ReloadHandler reload_handler, StopHandler stop_handler) {
    if (running_.exchange(true)) {
        spdlog::warn("Server: Already running, ignoring start request");
        return;
    }

    reload_handler_ = std::move(reload_handler);
    stop_handler_ = std::move(stop_handler);

    // Setup signal handling for graceful shutdown
    setup_signal_handling();

    // Start worker threads
    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        thread_pool_.emplace_back([this](std::stop_token st) {
            run_io_context(st);
        });
    }

    spdlog::info("Server: Started with {} worker threads", config_.thread_count);
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }

    spdlog::info("Server: Initiating graceful shutdown...");

    // Stop accepting new connections
    if (stop_handler_) {
        try {
            stop_handler_();
        } catch (const std::exception& e) {
            spdlog::error("Server: Stop handler failed: {}", e.what());
        }
    }

    // Cancel signal handling
    boost::system::error_code ec;
    signals_.cancel(ec);

    // Release the work guard to allow io_context to complete
    work_guard_.reset();

    // Request stop on all threads
    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }

    // Stop io_context (interrupts any waiting async operations)
    io_context_.stop();

    spdlog::info("Server: Shutdown initiated, waiting for threads...");
}

void Server::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
    thread_pool_.clear();
    spdlog::info("Server: All worker threads terminated");
}

bool Server::is_running() const noexcept {
    return running_.load();
}

asio::io_context& Server::get_io_context() noexcept {
    return io_context_;
}

void Server::run_io_context(std::stop_token stop_token) {
    spdlog::debug("Server: Worker thread started");

    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break; // Normal exit when io_context runs out of work
        } catch (const std::exception& e) {
            spdlog::error("Server: Exception in worker thread: {}", e.what());
        }
    }

    spdlog::debug("Server: Worker thread exiting");
}

void Server::setup_signal_handling() {
    // Handle SIGINT (Ctrl+C) and SIGTERM for shutdown
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    // SIGHUP for config reload
    signals_.add(SIGHUP);

    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::debug("Server: Signal handler error: {}", ec.message());
            }
            return;
        }

        // SIGHUP triggers config reload, not shutdown
        if (signal_number == SIGHUP) {
            spdlog::info("Server: Received SIGHUP - reloading configuration");
            if (reload_handler_) {
                try {
                    reload_handler_();
                } catch (const std::exception& e) {
                    spdlog::error("Server: Config reload failed: {}", e.what());
                }
            } else {
                spdlog::warn("Server: No reload handler configured, ignoring SIGHUP");
            }
            // Re-register for next signal
            setup_signal_handling();
            return;
        }

        spdlog::info("Server: Received signal {} - initiating shutdown", signal_number);
        stop();
    });

    spdlog::debug("Server: Signal handlers installed (SIGINT, SIGTERM, SIGHUP)");
}

} // namespace portway::server
