/**
 * PORTWAY - API Gateway Request Kernel
 * SSL Connection implementation - HTTPS sessions with TLS termination
 */

#include "server/ssl_connection.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace portway::server {

SslConnection::SslConnection(tcp::socket socket, ssl::context& ssl_ctx,
                             ConnectionSettings settings, RequestHandler handler)
    : BasicConnection<SslConnection>(std::move(settings), std::move(handler))
    , stream_(beast::tcp_stream(std::move(socket)), ssl_ctx)
{
    // Capture client endpoint before starting handshake
    capture_endpoint();
}

void SslConnection::start() {
    // Start with SSL handshake
    asio::dispatch(
        beast::get_lowest_layer(stream_).get_executor(),
        beast::bind_front_handler(&SslConnection::do_handshake, shared_from_this())
    );
}

void SslConnection::do_handshake() {
    // Set timeout for handshake
    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(10));

    stream_.async_handshake(
        ssl::stream_base::server,
        beast::bind_front_handler(&SslConnection::on_handshake, shared_from_this())
    );
}

void SslConnection::on_handshake(beast::error_code ec) {
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            spdlog::debug("SSL Connection: Handshake aborted");
            return;
        }

        // Log handshake failures for debugging
        if (ec.category() == asio::error::get_ssl_category()) {
            spdlog::warn("SSL Connection: Handshake failed from {}:{} - SSL error: {}",
                         client_ip_.empty() ? "(unknown)" : client_ip_,
                         client_port_,
                         ec.message());
        } else if (ec == beast::error::timeout) {
            spdlog::debug("SSL Connection: Handshake timeout from {}:{}",
                          client_ip_.empty() ? "(unknown)" : client_ip_,
                          client_port_);
        } else {
            spdlog::debug("SSL Connection: Handshake error from {}:{} - {}",
                          client_ip_.empty() ? "(unknown)" : client_ip_,
                          client_port_,
                          ec.message());
        }
        return;
    }

    if (const char* name = SSL_get_servername(stream_.native_handle(), TLSEXT_NAMETYPE_host_name)) {
        sni_ = name;
    }

    spdlog::debug("SSL Connection: Handshake complete from {}:{} (SNI: {})",
                  client_ip_.empty() ? "(unknown)" : client_ip_,
                  client_port_,
                  sni_.empty() ? "(none)" : sni_);

    // Start reading HTTP requests
    do_read();
}

void SslConnection::do_close() {
    // Set timeout for shutdown
    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));

    // Perform SSL shutdown
    stream_.async_shutdown(
        beast::bind_front_handler(&SslConnection::on_shutdown, shared_from_this())
    );
}

void SslConnection::on_shutdown(beast::error_code ec) {
    // These errors are expected and not problematic:
    // - stream_truncated: Client closed connection without proper SSL shutdown
    // - operation_aborted: We're shutting down
    // - eof: Connection ended normally
    if (ec && ec != asio::ssl::error::stream_truncated &&
        ec != asio::error::operation_aborted &&
        ec != asio::error::eof) {
        spdlog::debug("SSL Connection: Shutdown error - {}", ec.message());
    }
    beast::get_lowest_layer(stream_).close();
}

void handle_ssl_connection(tcp::socket socket, ssl::context& ssl_ctx,
                           ConnectionSettings settings, RequestHandler handler) {
    std::make_shared<SslConnection>(std::move(socket), ssl_ctx,
                                    std::move(settings), std::move(handler))->start();
}

} // namespace portway::server
