/**
 * PORTWAY - API Gateway Request Kernel
 * Listener implementation - plain or TLS acceptor feeding HTTP sessions
 */

#include "server/listener.hpp"

#include "server/ssl_connection.hpp"
#include "server/tls_context.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <stdexcept>

namespace portway::server {

Listener::Listener(asio::io_context& io_context,
                   const config::ListenerSettings& settings,
                   RequestHandler handler,
                   TlsResolver* resolver)
    : settings_(settings)
    , io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , acceptor_(strand_)
    , backoff_timer_(strand_)
    , handler_(std::move(handler))
{
    spdlog::debug("Listener: Initializing '{}' on {}:{}{}",
                  settings_.name, settings_.bind_address, settings_.port,
                  settings_.tls ? " (TLS)" : "");

    if (settings_.tls) {
        if (!resolver) {
            throw std::runtime_error("TLS listener '" + settings_.name + "' requires a certificate resolver");
        }
        tls_context_ = make_listener_context();
        resolver->attach(*tls_context_, settings_.name, settings_.default_certificate);
    }
}

Listener::~Listener() {
    running_ = false;
    close_acceptor();
}

void Listener::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Listener: '{}' already running, ignoring start request", settings_.name);
        return;
    }

    // Configure and open the acceptor
    tcp::endpoint endpoint(
        asio::ip::make_address(settings_.bind_address),
        settings_.port
    );

    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("Listener: Failed to open acceptor: {}", ec.message());
        running_ = false;
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    // Set socket options
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("Listener: Failed to set reuse_address: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        spdlog::error("Listener: Failed to bind to {}:{}: {}",
                      settings_.bind_address, settings_.port, ec.message());
        running_ = false;
        throw std::runtime_error("Failed to bind listener '" + settings_.name + "': " + ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("Listener: Failed to listen: {}", ec.message());
        running_ = false;
        throw std::runtime_error("Failed to listen on '" + settings_.name + "': " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();

    spdlog::info("Listener: '{}' listening on {}:{} ({})",
                 settings_.name, settings_.bind_address, bound_port_.load(),
                 settings_.tls ? "HTTPS" : "HTTP");

    // Start accepting connections
    do_accept();
}

void Listener::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("Listener: Stopping '{}'...", settings_.name);

    // Accept handlers run on the strand; the acceptor is closed there too
    asio::post(strand_, [this]() { close_acceptor(); });
}

void Listener::close_acceptor() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Listener: Error closing acceptor: {}", ec.message());
    }
    backoff_timer_.cancel();
}

bool Listener::is_running() const noexcept {
    return running_.load();
}

std::uint16_t Listener::get_port() const noexcept {
    return bound_port_.load();
}

void Listener::do_accept() {
    if (!running_) {
        return;
    }

    // Each session runs on its own strand
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        beast::bind_front_handler(&Listener::on_accept, this)
    );
}

void Listener::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (!running_) {
        return;
    }

    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }

        if (ec == asio::error::no_descriptors ||
            ec.value() == ENFILE) {
            // Out of file descriptors: back off rather than spin
            spdlog::critical("Listener: '{}' out of file descriptors ({}), pausing accept for 1s",
                             settings_.name, ec.message());
            backoff_timer_.expires_after(std::chrono::seconds(1));
            backoff_timer_.async_wait([this](boost::system::error_code timer_ec) {
                if (!timer_ec) {
                    do_accept();
                }
            });
            return;
        }

        spdlog::error("Listener: Accept error: {}", ec.message());
        do_accept();
        return;
    }

    ++connections_accepted_;
    boost::system::error_code ep_ec;
    auto remote = socket.remote_endpoint(ep_ec);
    if (!ep_ec) {
        spdlog::debug("Listener: Connection #{} on '{}' accepted from {}:{}",
                      connections_accepted_.load(), settings_.name,
                      remote.address().to_string(), remote.port());
    }

    ConnectionSettings session{.listener = settings_.name};

    try {
        if (tls_context_) {
            handle_ssl_connection(std::move(socket), *tls_context_, std::move(session), handler_);
        } else {
            handle_connection(std::move(socket), std::move(session), handler_);
        }
    } catch (const std::exception& e) {
        spdlog::error("Listener: Connection handler exception: {}", e.what());
    }

    // Continue accepting
    do_accept();
}

} // namespace portway::server
