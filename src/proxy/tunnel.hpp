/**
 * PORTWAY - API Gateway Request Kernel
 * Tunnel - raw byte relay between a client and an upgraded upstream connection
 */

#ifndef PORTWAY_PROXY_TUNNEL_HPP
#define PORTWAY_PROXY_TUNNEL_HPP

#include "server/http_message.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <memory>
#include <string>

namespace portway::proxy {

namespace asio = boost::asio;
namespace beast = boost::beast;

/**
 * Tunnel - relays bytes in both directions after 101 Switching Protocols
 *
 * The client stream belongs to the session (kept alive through owner) and
 * the upstream stream to the finished exchange; each keeps its own strand,
 * so every operation is dispatched onto the executor of the stream it
 * touches. Bytes already buffered on either side are written first. The
 * first error or EOF in either direction closes both streams.
 */
template <class ClientStream>
class Tunnel : public std::enable_shared_from_this<Tunnel<ClientStream>> {
public:
    static constexpr std::size_t buffer_size = 16 * 1024;

    Tunnel(std::shared_ptr<void> owner,
           ClientStream& client,
           std::string client_leftover,
           std::shared_ptr<server::UpgradedStream> upstream)
        : owner_(std::move(owner))
        , client_(client)
        , client_leftover_(std::move(client_leftover))
        , upstream_(std::move(upstream))
    {
    }

    // Non-copyable
    Tunnel(const Tunnel&) = delete;
    Tunnel& operator=(const Tunnel&) = delete;

    void start() {
        spdlog::debug("Tunnel: Started ({} client bytes, {} upstream bytes pending)",
                      client_leftover_.size(), upstream_->leftover.size());

        asio::dispatch(client_executor(), [self = this->shared_from_this()]() {
            beast::get_lowest_layer(self->client_).expires_never();
            if (self->upstream_->leftover.empty()) {
                self->read_client();
            } else {
                asio::async_write(self->client_, asio::buffer(self->upstream_->leftover),
                    [self](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->close("client write", ec);
                            return;
                        }
                        self->read_client();
                    });
            }
        });

        asio::dispatch(upstream_executor(), [self = this->shared_from_this()]() {
            self->upstream_->stream.expires_never();
            if (self->client_leftover_.empty()) {
                self->read_upstream();
            } else {
                asio::async_write(self->upstream_->stream, asio::buffer(self->client_leftover_),
                    [self](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->close("upstream write", ec);
                            return;
                        }
                        self->read_upstream();
                    });
            }
        });
    }

    /**
     * Close both sides, once
     */
    void close(const char* where, beast::error_code ec) {
        if (closed_.exchange(true)) {
            return;
        }

        if (ec == asio::error::eof || ec == asio::error::operation_aborted) {
            spdlog::debug("Tunnel: Closed ({} ended)", where);
        } else {
            spdlog::debug("Tunnel: Closed ({} failed: {})", where, ec.message());
        }

        asio::dispatch(client_executor(), [self = this->shared_from_this()]() {
            beast::error_code ignored;
            auto& socket = beast::get_lowest_layer(self->client_).socket();
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            socket.close(ignored);
        });
        asio::dispatch(upstream_executor(), [self = this->shared_from_this()]() {
            self->upstream_->stream.close();
        });
    }

private:
    auto client_executor() { return beast::get_lowest_layer(client_).get_executor(); }
    auto upstream_executor() { return upstream_->stream.get_executor(); }

    // client -> upstream

    void read_client() {
        client_.async_read_some(asio::buffer(to_upstream_),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                if (ec) {
                    self->close("client read", ec);
                    return;
                }
                asio::dispatch(self->upstream_executor(), [self, bytes]() {
                    self->write_upstream(bytes);
                });
            });
    }

    void write_upstream(std::size_t bytes) {
        asio::async_write(upstream_->stream, asio::buffer(to_upstream_.data(), bytes),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    self->close("upstream write", ec);
                    return;
                }
                asio::dispatch(self->client_executor(), [self]() { self->read_client(); });
            });
    }

    // upstream -> client

    void read_upstream() {
        upstream_->stream.async_read_some(asio::buffer(to_client_),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                if (ec) {
                    self->close("upstream read", ec);
                    return;
                }
                asio::dispatch(self->client_executor(), [self, bytes]() {
                    self->write_client(bytes);
                });
            });
    }

    void write_client(std::size_t bytes) {
        asio::async_write(client_, asio::buffer(to_client_.data(), bytes),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    self->close("client write", ec);
                    return;
                }
                asio::dispatch(self->upstream_executor(), [self]() { self->read_upstream(); });
            });
    }

    std::shared_ptr<void> owner_;
    ClientStream& client_;
    std::string client_leftover_;
    std::shared_ptr<server::UpgradedStream> upstream_;

    std::array<char, buffer_size> to_upstream_{};
    std::array<char, buffer_size> to_client_{};
    std::atomic<bool> closed_{false};
};

} // namespace portway::proxy

#endif // PORTWAY_PROXY_TUNNEL_HPP
