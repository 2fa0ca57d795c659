/**
 * PORTWAY - API Gateway Request Kernel
 * Redis Client implementation
 */

#include "store/redis_client.hpp"

#include <spdlog/spdlog.h>

namespace portway::store {

RedisClient::RedisClient(asio::io_context& io_context, const ClientConfig& config)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , resolver_(strand_)
    , config_(config)
{
}

void RedisClient::async_command(std::vector<std::string> args, ReplyHandler handler) {
    Pending pending{
        .payload = resp::encode_command(args),
        .handler = std::move(handler)
    };
    asio::post(strand_, [self = shared_from_this(), pending = std::move(pending)]() mutable {
        self->enqueue(std::move(pending));
    });
}

void RedisClient::close() {
    asio::post(strand_, [self = shared_from_this()]() {
        if (self->closed_) {
            return;
        }
        self->closed_ = true;
        self->fail_all(errc::closed);
    });
}

void RedisClient::enqueue(Pending pending) {
    if (closed_) {
        complete(std::move(pending.handler), errc::closed);
        return;
    }

    if (state_ == State::disconnected) {
        if (std::chrono::steady_clock::now() < retry_at_) {
            complete(std::move(pending.handler), errc::backoff);
            return;
        }
        queue_.push_back(std::move(pending));
        connect();
        return;
    }

    queue_.push_back(std::move(pending));
    flush();
}

void RedisClient::connect() {
    state_ = State::connecting;
    spdlog::debug("RedisClient: Connecting to {}:{}", config_.host, config_.port);

    resolver_.async_resolve(
        config_.host, std::to_string(config_.port),
        beast::bind_front_handler(&RedisClient::on_resolve, shared_from_this(), generation_));
}

void RedisClient::on_resolve(std::uint64_t generation, beast::error_code ec,
                             tcp::resolver::results_type results) {
    if (generation != generation_) {
        return;
    }
    if (ec) {
        fail_all(ec);
        return;
    }

    stream_.emplace(strand_);
    stream_->expires_after(config_.timeout);
    stream_->async_connect(
        results,
        beast::bind_front_handler(&RedisClient::on_connect, shared_from_this(), generation_));
}

void RedisClient::on_connect(std::uint64_t generation, beast::error_code ec,
                             tcp::endpoint endpoint) {
    if (generation != generation_) {
        return;
    }
    if (ec) {
        fail_all(ec);
        return;
    }

    stream_->socket().set_option(tcp::no_delay(true), ec);
    state_ = State::connected;
    replies_ = 0;
    idle_write_ = false;
    spdlog::info("RedisClient: Connected to {}:{}", endpoint.address().to_string(), endpoint.port());

    if (!config_.password.empty()) {
        queue_.push_front(Pending{
            .payload = resp::encode_command({"AUTH", config_.password}),
            .handler = nullptr,
            .auth = true
        });
    }
    flush();
}

void RedisClient::flush() {
    if (state_ != State::connected || writing_ || queue_.empty()) {
        return;
    }

    // A store may drop a connection that sat idle; that shows up on this write
    if (inflight_.empty() && replies_ > 0) {
        idle_write_ = true;
    }

    write_buffer_.clear();
    while (!queue_.empty()) {
        write_buffer_ += queue_.front().payload;
        inflight_.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }

    writing_ = true;
    stream_->expires_after(config_.timeout);
    asio::async_write(
        *stream_, asio::buffer(write_buffer_),
        beast::bind_front_handler(&RedisClient::on_write, shared_from_this(), generation_));
}

void RedisClient::on_write(std::uint64_t generation, beast::error_code ec, std::size_t /*bytes*/) {
    if (generation != generation_) {
        return;
    }
    writing_ = false;
    if (ec) {
        fail_all(ec);
        return;
    }

    start_read();
    flush();
}

void RedisClient::start_read() {
    if (reading_ || inflight_.empty()) {
        return;
    }

    reading_ = true;
    stream_->expires_after(config_.timeout);
    stream_->async_read_some(
        asio::buffer(read_buffer_),
        beast::bind_front_handler(&RedisClient::on_read, shared_from_this(), generation_));
}

void RedisClient::on_read(std::uint64_t generation, beast::error_code ec, std::size_t bytes) {
    if (generation != generation_) {
        return;
    }
    reading_ = false;
    if (ec) {
        fail_all(ec);
        return;
    }

    parser_.feed(std::string_view(read_buffer_.data(), bytes));

    try {
        while (!inflight_.empty()) {
            auto value = parser_.next();
            if (!value) {
                break;
            }

            Pending pending = std::move(inflight_.front());
            inflight_.pop_front();
            ++replies_;
            idle_write_ = false;

            if (pending.auth) {
                if (value->is_error()) {
                    spdlog::error("RedisClient: AUTH rejected: {}", value->str);
                    fail_all(errc::server_error);
                    return;
                }
                continue;
            }
            complete(std::move(pending.handler), {}, std::move(*value));
        }
    } catch (const resp::ProtocolError& e) {
        spdlog::warn("RedisClient: {}", e.what());
        fail_all(errc::protocol_error);
        return;
    }

    if (inflight_.empty() && parser_.buffered() > 0) {
        spdlog::warn("RedisClient: Unsolicited data from store");
        fail_all(errc::protocol_error);
        return;
    }

    start_read();
}

void RedisClient::fail_all(boost::system::error_code ec) {
    const bool was_connected = state_ == State::connected;
    const bool peer_closed = was_connected &&
        (ec == asio::error::eof || ec == asio::error::connection_reset ||
         ec == asio::error::broken_pipe);
    const bool stale_connection = peer_closed && idle_write_;

    ++generation_;
    state_ = State::disconnected;
    writing_ = false;
    reading_ = false;
    resolver_.cancel();
    if (stream_) {
        beast::error_code ignored;
        stream_->socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_->close();
        stream_.reset();
    }
    parser_.reset();
    replies_ = 0;
    idle_write_ = false;

    if (stale_connection && resend_once()) {
        return;
    }

    if (ec != errc::closed) {
        if (peer_closed) {
            spdlog::info("RedisClient: Store closed the connection");
        } else {
            retry_at_ = std::chrono::steady_clock::now() + config_.reconnect_backoff;
            spdlog::warn("RedisClient: {}:{} unavailable ({}), backing off {}ms",
                         config_.host, config_.port, ec.message(),
                         config_.reconnect_backoff.count());
        }
    }

    auto inflight = std::move(inflight_);
    auto queued = std::move(queue_);
    inflight_.clear();
    queue_.clear();

    for (auto& pending : inflight) {
        if (!pending.auth) {
            complete(std::move(pending.handler), ec);
        }
    }
    for (auto& pending : queued) {
        if (!pending.auth) {
            complete(std::move(pending.handler), ec);
        }
    }
}

bool RedisClient::resend_once() {
    std::deque<Pending> resend;
    std::deque<Pending> failed;
    for (auto* source : {&inflight_, &queue_}) {
        for (auto& pending : *source) {
            if (pending.auth) {
                continue;
            }
            if (pending.resent) {
                failed.push_back(std::move(pending));
            } else {
                pending.resent = true;
                resend.push_back(std::move(pending));
            }
        }
        source->clear();
    }

    for (auto& pending : failed) {
        complete(std::move(pending.handler), asio::error::eof);
    }
    if (resend.empty()) {
        return !failed.empty();
    }

    spdlog::info("RedisClient: Store closed an idle connection, resending {} commands", resend.size());
    queue_ = std::move(resend);
    connect();
    return true;
}

void RedisClient::complete(ReplyHandler handler, boost::system::error_code ec, resp::Value value) {
    if (!handler) {
        return;
    }
    asio::post(io_context_, [handler = std::move(handler), ec, value = std::move(value)]() mutable {
        handler(ec, std::move(value));
    });
}

} // namespace portway::store
