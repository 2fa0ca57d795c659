/**
 * PORTWAY - API Gateway Request Kernel
 * Listener - plain or TLS acceptor feeding HTTP sessions
 */

#ifndef PORTWAY_SERVER_LISTENER_HPP
#define PORTWAY_SERVER_LISTENER_HPP

#include "config/config.hpp"
#include "server/connection.hpp"
#include "server/http_message.hpp"
#include "server/tls_resolver.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace portway::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

/**
 * Listener class - accepts connections on one address and hands each to
 * a plain or TLS session
 *
 * Every accepted socket gets its own strand. A TLS listener owns a
 * certificate-less context whose server-name callback asks the TLS
 * resolver for the certificate of the current configuration snapshot.
 * When the process runs out of descriptors, accepting pauses for a
 * second instead of spinning.
 */
class Listener {
public:
    /**
     * Create a listener
     * @param io_context Shared io_context from the server
     * @param settings Listener configuration
     * @param handler Request handler for every session
     * @param resolver Certificate resolver, required when settings.tls is set
     * @throws std::runtime_error if the TLS context cannot be created
     */
    Listener(asio::io_context& io_context,
             const config::ListenerSettings& settings,
             RequestHandler handler,
             TlsResolver* resolver = nullptr);

    // Closes the acceptor directly; no io thread may still run its handlers
    ~Listener();

    // Non-copyable, non-movable
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
    Listener(Listener&&) = delete;
    Listener& operator=(Listener&&) = delete;

    /**
     * Bind, listen and start accepting
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * Stop accepting new connections. Safe from any thread; the acceptor
     * closes on its strand.
     */
    void stop();

    bool is_running() const noexcept;

    /**
     * Bound port (useful when configured with port 0)
     */
    std::uint16_t get_port() const noexcept;

    const std::string& name() const noexcept { return settings_.name; }

private:
    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void close_acceptor();

    config::ListenerSettings settings_;
    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    asio::steady_timer backoff_timer_;
    RequestHandler handler_;
    std::shared_ptr<ssl::context> tls_context_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace portway::server

#endif // PORTWAY_SERVER_LISTENER_HPP
