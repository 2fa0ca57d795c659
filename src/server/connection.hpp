/**
 * PORTWAY - API Gateway Request Kernel
 * Connection handler - HTTP/1.1 sessions with Boost.Beast
 */

#ifndef PORTWAY_SERVER_CONNECTION_HPP
#define PORTWAY_SERVER_CONNECTION_HPP

#include "proxy/tunnel.hpp"
#include "server/http_message.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace portway::server {

/**
 * Per-listener session settings
 */
struct ConnectionSettings {
    std::string listener{"http"};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
    std::uint64_t body_limit{10 * 1024 * 1024};
};

/**
 * Session logic shared by plain and TLS connections
 *
 * Derived provides:
 *   stream()        the HTTP stream (tcp_stream or ssl stream)
 *   do_close()      graceful close for its transport
 *   tls(), sni()    transport information for the request
 *
 * One request is in flight at a time. While the handler works, the
 * session watches the socket: a peer that closes its side cancels the
 * request. Responses may complete on any thread and are posted back to
 * the session strand.
 */
template <class Derived>
class BasicConnection {
public:
    BasicConnection(ConnectionSettings settings, RequestHandler handler)
        : settings_(std::move(settings))
        , handler_(std::move(handler))
    {
    }

protected:
    Derived& derived() { return static_cast<Derived&>(*this); }

    auto& socket() { return beast::get_lowest_layer(derived().stream()).socket(); }

    void capture_endpoint() {
        beast::error_code ec;
        auto endpoint = socket().remote_endpoint(ec);
        if (!ec) {
            client_ip_ = endpoint.address().to_string();
            client_port_ = endpoint.port();
        }
    }

    void do_read() {
        parser_.emplace();
        parser_->body_limit(settings_.body_limit);

        // Set timeout for this read operation
        beast::get_lowest_layer(derived().stream()).expires_after(settings_.read_timeout);

        http::async_read(
            derived().stream(),
            buffer_,
            *parser_,
            beast::bind_front_handler(&BasicConnection::on_read, derived().shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        // Client closed connection
        if (ec == http::error::end_of_stream) {
            spdlog::debug("Connection: Client closed connection");
            derived().do_close();
            return;
        }

        if (ec) {
            if (ec == beast::error::timeout) {
                spdlog::debug("Connection: Read timeout");
            } else if (ec != asio::error::operation_aborted) {
                if (ec == http::error::body_limit) {
                    spdlog::warn("Connection: Request body too large from {}", client_ip_);
                    send_local(make_error_response(http::status::payload_too_large, 11,
                                                   "Request body too large"));
                    return;
                }
                // Parsing errors get 400 Bad Request
                if (ec.category() == http::make_error_code(http::error::bad_method).category()) {
                    spdlog::warn("Connection: Malformed request - {}", ec.message());
                    send_local(make_error_response(http::status::bad_request, 11,
                                                   "Malformed HTTP request: " + ec.message()));
                    return;
                }
                spdlog::debug("Connection: Read error - {}", ec.message());
            }
            derived().do_close();
            return;
        }

        auto message = parser_->release();
        parser_.reset();

        spdlog::debug("Connection: {} {} HTTP/{}.{}",
                      std::string(http::to_string(message.method())),
                      std::string(message.target()),
                      message.version() / 10,
                      message.version() % 10);

        // Validate HTTP version (require HTTP/1.0 or HTTP/1.1)
        if (message.version() != 10 && message.version() != 11) {
            spdlog::warn("Connection: Unsupported HTTP version {}.{}",
                         message.version() / 10, message.version() % 10);
            send_local(make_error_response(http::status::http_version_not_supported, 11,
                                           "Only HTTP/1.0 and HTTP/1.1 are supported"));
            return;
        }

        keep_alive_ = message.keep_alive();
        request_version_ = message.version();
        head_request_ = message.method() == http::verb::head;

        HttpRequest request{
            .message = std::move(message),
            .client_ip = client_ip_,
            .client_port = client_port_,
            .listener = settings_.listener,
            .tls = derived().tls(),
            .sni = derived().sni()
        };

        awaiting_response_ = true;
        client_gone_ = false;

        auto self = derived().shared_from_this();
        auto executor = beast::get_lowest_layer(derived().stream()).get_executor();
        ResponseCallback respond = [self, executor](HttpResponse response) {
            asio::post(executor, [self, response = std::move(response)]() mutable {
                self->on_response(std::move(response));
            });
        };

        try {
            cancel_ = handler_(std::move(request), std::move(respond));
        } catch (const std::exception& e) {
            spdlog::error("Connection: Handler exception - {}", e.what());
            awaiting_response_ = false;
            send_local(make_error_response(http::status::internal_server_error, request_version_,
                                           "Internal server error"));
            return;
        }

        if (awaiting_response_) {
            watch_disconnect();
        }
    }

    /**
     * Wait for readability while the request is in flight. EOF means the
     * client closed its side; any data (a pipelined request, TLS records)
     * ends the watch.
     */
    void watch_disconnect() {
        socket().async_wait(
            tcp::socket::wait_read,
            beast::bind_front_handler(&BasicConnection::on_readable, derived().shared_from_this())
        );
    }

    void on_readable(beast::error_code ec) {
        if (ec || !awaiting_response_) {
            return;
        }

        char byte = 0;
        beast::error_code peek_ec;
        auto n = socket().receive(asio::buffer(&byte, 1), tcp::socket::message_peek, peek_ec);
        if (peek_ec == asio::error::would_block || peek_ec == asio::error::try_again) {
            watch_disconnect();
            return;
        }
        if (!peek_ec && n > 0) {
            return;
        }

        spdlog::debug("Connection: Client {}:{} disconnected before the response",
                      client_ip_, client_port_);
        client_gone_ = true;
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    void on_response(HttpResponse response) {
        if (!awaiting_response_) {
            return;
        }
        awaiting_response_ = false;
        cancel_ = nullptr;

        // Stop the disconnect watch
        beast::error_code ec;
        socket().cancel(ec);

        if (client_gone_) {
            derived().do_close();
            return;
        }

        if (response.upgraded && response.message.result() == http::status::switching_protocols) {
            upgraded_ = std::move(response.upgraded);
            response_ = std::move(response.message);
            response_.version(request_version_);

            beast::get_lowest_layer(derived().stream()).expires_after(settings_.write_timeout);
            http::async_write(
                derived().stream(),
                response_,
                beast::bind_front_handler(&BasicConnection::on_upgrade_written,
                                          derived().shared_from_this())
            );
            return;
        }

        response_ = std::move(response.message);
        do_write();
    }

    void send_local(HttpResponse response) {
        keep_alive_ = false;
        response_ = std::move(response.message);
        do_write();
    }

    void do_write() {
        response_.version(request_version_);
        response_.keep_alive(keep_alive_);

        // Ensure content-length is set; HEAD responses keep the upstream length
        if (!(head_request_ && response_.has_content_length())) {
            response_.prepare_payload();
        }

        beast::get_lowest_layer(derived().stream()).expires_after(settings_.write_timeout);

        http::async_write(
            derived().stream(),
            response_,
            beast::bind_front_handler(&BasicConnection::on_write, derived().shared_from_this())
        );
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::debug("Connection: Write error - {}", ec.message());
            }
            derived().do_close();
            return;
        }

        spdlog::debug("Connection: Sent {} response", response_.result_int());

        if (!keep_alive_) {
            derived().do_close();
            return;
        }

        // Clear for next request
        response_ = {};
        head_request_ = false;

        // Read another request (keep-alive)
        do_read();
    }

    void on_upgrade_written(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        auto upstream = std::move(upgraded_);
        if (ec) {
            spdlog::debug("Connection: Upgrade write error - {}", ec.message());
            upstream->stream.close();
            derived().do_close();
            return;
        }

        // Bytes the client sent after its upgrade request belong to the tunnel
        auto pending = buffer_.data();
        std::string leftover(static_cast<const char*>(pending.data()), pending.size());
        buffer_.consume(buffer_.size());

        using ClientStream = std::remove_reference_t<decltype(derived().stream())>;
        std::make_shared<proxy::Tunnel<ClientStream>>(
            derived().shared_from_this(), derived().stream(), std::move(leftover), std::move(upstream)
        )->start();
    }

    ConnectionSettings settings_;
    RequestHandler handler_;

    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    std::shared_ptr<UpgradedStream> upgraded_;
    CancelHandle cancel_;

    bool keep_alive_{false};
    bool head_request_{false};
    bool awaiting_response_{false};
    bool client_gone_{false};
    unsigned request_version_{11};

    // Client connection info (captured at connection time)
    std::string client_ip_;
    std::uint16_t client_port_{0};
};

/**
 * Connection class - manages a single plain HTTP/1.1 client connection
 */
class Connection : public BasicConnection<Connection>
                 , public std::enable_shared_from_this<Connection> {
public:
    /**
     * Create a new connection
     * @param socket The accepted TCP socket
     * @param settings Listener session settings
     * @param handler The request handler callback
     */
    Connection(tcp::socket socket, ConnectionSettings settings, RequestHandler handler);

    ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    /**
     * Start processing the connection asynchronously
     */
    void start();

    beast::tcp_stream& stream() { return stream_; }
    bool tls() const { return false; }
    std::string sni() const { return {}; }

    /**
     * Close the connection gracefully
     */
    void do_close();

private:
    beast::tcp_stream stream_;
};

/**
 * Create and start a connection
 */
void handle_connection(tcp::socket socket, ConnectionSettings settings, RequestHandler handler);

} // namespace portway::server

#endif // PORTWAY_SERVER_CONNECTION_HPP
