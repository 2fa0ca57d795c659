/**
 * PORTWAY - API Gateway Request Kernel
 * SSL Connection handler - HTTPS sessions with TLS termination
 */

#ifndef PORTWAY_SERVER_SSL_CONNECTION_HPP
#define PORTWAY_SERVER_SSL_CONNECTION_HPP

#include "server/connection.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <functional>
#include <memory>
#include <string>

namespace portway::server {

namespace ssl = asio::ssl;

/**
 * SSL stream type used for connections
 */
using ssl_stream = ssl::stream<beast::tcp_stream>;

/**
 * SSL Connection class - manages a single HTTPS client connection
 *
 * The certificate is chosen during the handshake by the listener's SNI
 * callback; the server name the client offered is passed on with every
 * request of the session.
 */
class SslConnection : public BasicConnection<SslConnection>
                    , public std::enable_shared_from_this<SslConnection> {
public:
    /**
     * Create a new SSL connection
     * @param socket The accepted TCP socket
     * @param ssl_ctx Listener SSL context (SNI callback attached)
     * @param settings Listener session settings
     * @param handler The request handler callback
     */
    SslConnection(tcp::socket socket, ssl::context& ssl_ctx,
                  ConnectionSettings settings, RequestHandler handler);

    ~SslConnection() = default;

    // Non-copyable, non-movable
    SslConnection(const SslConnection&) = delete;
    SslConnection& operator=(const SslConnection&) = delete;
    SslConnection(SslConnection&&) = delete;
    SslConnection& operator=(SslConnection&&) = delete;

    /**
     * Start processing the connection asynchronously
     * Initiates SSL handshake followed by HTTP request handling
     */
    void start();

    ssl_stream& stream() { return stream_; }
    bool tls() const { return true; }
    const std::string& sni() const { return sni_; }

    /**
     * Close the connection gracefully with SSL shutdown
     */
    void do_close();

private:
    void do_handshake();
    void on_handshake(beast::error_code ec);
    void on_shutdown(beast::error_code ec);

    ssl_stream stream_;
    std::string sni_;
};

/**
 * Create and start an SSL connection
 */
void handle_ssl_connection(tcp::socket socket, ssl::context& ssl_ctx,
                           ConnectionSettings settings, RequestHandler handler);

} // namespace portway::server

#endif // PORTWAY_SERVER_SSL_CONNECTION_HPP
