/**
 * PORTWAY - API Gateway Request Kernel
 * Redis Client - pipelined RESP client with reconnect back-off
 */

#ifndef PORTWAY_STORE_REDIS_CLIENT_HPP
#define PORTWAY_STORE_REDIS_CLIENT_HPP

#include "store/error.hpp"
#include "store/resp.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace portway::store {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

/**
 * Connection settings for the store
 */
struct ClientConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{6379};
    std::string password;                                // AUTH on connect if set
    std::chrono::milliseconds timeout{100};              // Per connect, write and read
    std::chrono::milliseconds reconnect_backoff{1000};   // Fail fast for this long after an error
};

/**
 * Redis Client
 *
 * A single connection shared by every caller. Commands are queued on a
 * strand, written in batches and answered in FIFO order. The connection is
 * opened lazily on the first command.
 *
 * Any connect, I/O, timeout or protocol failure fails every queued and
 * in-flight command with the same error and starts the back-off window,
 * during which commands fail immediately with errc::backoff. A peer that
 * closes an established connection does not start the back-off. When it
 * closed a connection that sat idle, the commands written to it are resent
 * once on a fresh connection.
 *
 * Handlers run on the io_context, never inline with async_command().
 */
class RedisClient : public std::enable_shared_from_this<RedisClient> {
public:
    using Ptr = std::shared_ptr<RedisClient>;
    using ReplyHandler = std::function<void(boost::system::error_code, resp::Value)>;

    RedisClient(asio::io_context& io_context, const ClientConfig& config);

    // Non-copyable
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /**
     * Queue a command. An error reply from the store is delivered as a
     * value with is_error() set, not as an error_code.
     */
    void async_command(std::vector<std::string> args, ReplyHandler handler);

    /**
     * Fail everything pending with errc::closed and refuse further commands
     */
    void close();

    const ClientConfig& config() const { return config_; }

private:
    struct Pending {
        std::string payload;
        ReplyHandler handler;
        bool auth{false};
        bool resent{false};  // Already resent once after a stale connection
    };

    void enqueue(Pending pending);
    void connect();
    void on_resolve(std::uint64_t generation, beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(std::uint64_t generation, beast::error_code ec, tcp::endpoint endpoint);
    void flush();
    void on_write(std::uint64_t generation, beast::error_code ec, std::size_t bytes);
    void start_read();
    void on_read(std::uint64_t generation, beast::error_code ec, std::size_t bytes);
    void fail_all(boost::system::error_code ec);
    bool resend_once();
    void complete(ReplyHandler handler, boost::system::error_code ec, resp::Value value = {});

    enum class State { disconnected, connecting, connected };

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> stream_;
    ClientConfig config_;

    State state_{State::disconnected};
    bool closed_{false};
    bool writing_{false};
    bool reading_{false};
    std::uint64_t generation_{0};  // Bumped on every failure; stale handlers compare against it
    std::uint64_t replies_{0};     // Replies on the current connection
    bool idle_write_{false};       // Last write went out on an idle connection, no reply yet
    std::chrono::steady_clock::time_point retry_at_{};

    std::deque<Pending> queue_;     // Not yet written
    std::deque<Pending> inflight_;  // Written, awaiting reply
    std::string write_buffer_;
    std::array<char, 4096> read_buffer_{};
    resp::Parser parser_;
};

} // namespace portway::store

#endif // PORTWAY_STORE_REDIS_CLIENT_HPP
