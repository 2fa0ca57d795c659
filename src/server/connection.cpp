/**
 * PORTWAY - API Gateway Request Kernel
 * Connection implementation - plain HTTP/1.1 sessions
 */

#include "server/connection.hpp"

#include <spdlog/spdlog.h>

namespace portway::server {

Connection::Connection(tcp::socket socket, ConnectionSettings settings, RequestHandler handler)
    : BasicConnection<Connection>(std::move(settings), std::move(handler))
    , stream_(std::move(socket))
{
    // Capture client endpoint before any I/O
    capture_endpoint();
}

void Connection::start() {
    // We need to be executing within a strand to perform async operations
    // on the I/O objects in this session.
    asio::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Connection::do_read, shared_from_this())
    );
}

void Connection::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    // Ignore errors on shutdown - socket may already be closed
}

void handle_connection(tcp::socket socket, ConnectionSettings settings, RequestHandler handler) {
    std::make_shared<Connection>(std::move(socket), std::move(settings), std::move(handler))->start();
}

} // namespace portway::server
