/**
 * PORTWAY - API Gateway Request Kernel
 * Request Forwarder implementation
 */

#include "proxy/forwarder.hpp"

#include "balancer/load_balancer.hpp"
#include "config/snapshot.hpp"
#include "routing/route.hpp"

#include <spdlog/spdlog.h>

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/beast/core/string.hpp>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace portway::proxy {

namespace {

/**
 * Remove hop-by-hop headers, including every header named in Connection.
 * With keep_upgrade, Connection/Upgrade survive for protocol switches.
 */
template <class Fields>
void strip_hop_by_hop(Fields& fields, bool keep_upgrade) {
    std::vector<std::string> named;
    for (auto token : http::token_list(fields[http::field::connection])) {
        named.emplace_back(token.data(), token.size());
    }
    for (const auto& name : named) {
        if (keep_upgrade && beast::iequals(name, "upgrade")) {
            continue;
        }
        fields.erase(beast::string_view(name.data(), name.size()));
    }

    fields.erase(http::field::keep_alive);
    fields.erase(http::field::proxy_authenticate);
    fields.erase(http::field::proxy_authorization);
    fields.erase(http::field::te);
    fields.erase(http::field::trailer);
    fields.erase(http::field::transfer_encoding);
    // Not standard, but sent by some clients as a hop-by-hop header
    fields.erase("Proxy-Connection");

    if (!keep_upgrade) {
        fields.erase(http::field::connection);
        fields.erase(http::field::upgrade);
    }
}

std::string backend_address(const config::BackendConfig& backend) {
    return backend.host + ":" + std::to_string(backend.port);
}

} // anonymous namespace

/**
 * One upstream exchange: select, connect, write, read, maybe retry.
 * All handlers run on the exchange's strand.
 */
class Forwarder::Exchange : public std::enable_shared_from_this<Forwarder::Exchange> {
public:
    Exchange(asio::io_context& io_context,
             const ForwarderConfig& config,
             std::shared_ptr<RetryBudget> budget,
             std::shared_ptr<pipeline::RequestContext> ctx,
             std::shared_ptr<balancer::LoadBalancer> balancer,
             pipeline::UpstreamCallback done)
        : strand_(asio::make_strand(io_context))
        , resolver_(strand_)
        , timer_(strand_)
        , config_(config)
        , budget_(std::move(budget))
        , ctx_(std::move(ctx))
        , balancer_(std::move(balancer))
        , done_(std::move(done))
        , upgrade_(is_upgrade_request(ctx_->request.message))
        , idempotent_(is_idempotent(ctx_->request.message.method()))
    {
    }

    void start() {
        budget_->deposit();

        ctx_->on_cancel([weak = weak_from_this()]() {
            if (auto self = weak.lock()) {
                asio::post(self->strand_, [self]() { self->abort(Abort::cancelled); });
            }
        });

        asio::dispatch(strand_, [self = shared_from_this()]() { self->attempt(); });
    }

private:
    enum class Abort { none, cancelled, deadline, attempt_timeout };
    enum class Phase { connect, exchange };

    void attempt() {
        if (completed_) {
            return;
        }
        if (ctx_->cancelled()) {
            complete_error(pipeline::ErrorKind::cancelled, "client disconnected");
            return;
        }
        if (ctx_->expired()) {
            complete_error(pipeline::ErrorKind::upstream_timeout, "upstream request timed out");
            return;
        }

        auto selection = balancer_->select_backend(tried_);
        if (!selection) {
            complete_error(pipeline::ErrorKind::no_healthy_backend,
                           "no healthy backend in group '" + balancer_->name() + "'");
            return;
        }
        selection_ = std::move(*selection);
        ctx_->backend = backend_address(selection_.backend);
        abort_ = Abort::none;

        request_ = build_backend_request(*ctx_, selection_.backend);
        arm_timer();

        spdlog::debug("Forwarder: Attempt {} for request {} -> {}",
                      attempts_ + 1, ctx_->request_id, ctx_->backend);

        resolver_.async_resolve(
            selection_.backend.host, std::to_string(selection_.backend.port),
            beast::bind_front_handler(&Exchange::on_resolve, shared_from_this(), attempts_));
    }

    void arm_timer() {
        auto deadline = ctx_->deadline;
        attempt_limited_ = false;
        if (selection_.backend.timeout_ms) {
            auto attempt_deadline = std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(*selection_.backend.timeout_ms);
            if (attempt_deadline < deadline) {
                deadline = attempt_deadline;
                attempt_limited_ = true;
            }
        }

        timer_.expires_at(deadline);
        timer_.async_wait([self = shared_from_this(), attempt = attempts_](beast::error_code ec) {
            if (ec || attempt != self->attempts_ || self->completed_) {
                return;
            }
            self->abort(self->attempt_limited_ && !self->ctx_->expired()
                        ? Abort::attempt_timeout : Abort::deadline);
        });
    }

    std::chrono::milliseconds bounded(std::chrono::milliseconds timeout) const {
        return std::max(std::min(timeout, ctx_->time_left()), std::chrono::milliseconds{1});
    }

    void on_resolve(std::size_t attempt, beast::error_code ec, tcp::resolver::results_type results) {
        if (stale(attempt)) {
            return;
        }
        if (ec) {
            fail(ec, Phase::connect);
            return;
        }

        stream_.emplace(strand_);
        stream_->expires_after(bounded(config_.connect_timeout));
        stream_->async_connect(
            results,
            beast::bind_front_handler(&Exchange::on_connect, shared_from_this(), attempt));
    }

    void on_connect(std::size_t attempt, beast::error_code ec, tcp::endpoint /*endpoint*/) {
        if (stale(attempt)) {
            return;
        }
        if (ec) {
            fail(ec, Phase::connect);
            return;
        }

        stream_->expires_after(bounded(config_.io_timeout));
        http::async_write(
            *stream_, request_,
            beast::bind_front_handler(&Exchange::on_write, shared_from_this(), attempt));
    }

    void on_write(std::size_t attempt, beast::error_code ec, std::size_t /*bytes*/) {
        if (stale(attempt)) {
            return;
        }
        if (ec) {
            fail(ec, Phase::exchange);
            return;
        }

        buffer_.clear();
        parser_.emplace();
        parser_->body_limit(config_.body_limit);
        if (ctx_->request.message.method() == http::verb::head) {
            parser_->skip(true);
        }

        stream_->expires_after(bounded(config_.io_timeout));
        http::async_read(
            *stream_, buffer_, *parser_,
            beast::bind_front_handler(&Exchange::on_read, shared_from_this(), attempt));
    }

    void on_read(std::size_t attempt, beast::error_code ec, std::size_t /*bytes*/) {
        if (stale(attempt)) {
            return;
        }
        if (ec) {
            fail(ec, Phase::exchange);
            return;
        }

        server::HttpResponse response;
        response.message = parser_->release();
        const auto status = response.message.result_int();

        balancer_->report_status(selection_.index, status);

        const bool switching = status == 101 && upgrade_;
        strip_hop_by_hop(response.message, switching);
        prepare_client_response(response.message);

        if (switching) {
            stream_->expires_never();
            auto leftover = buffer_.data();
            response.upgraded = std::make_shared<server::UpgradedStream>(server::UpgradedStream{
                .stream = std::move(*stream_),
                .leftover = std::string(static_cast<const char*>(leftover.data()), leftover.size())
            });
            stream_.reset();
        }

        spdlog::debug("Forwarder: Received {} from {} for request {} in {}ms",
                      status, ctx_->backend, ctx_->request_id,
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - ctx_->started).count());

        complete(pipeline::UpstreamResult{.response = std::move(response), .error = std::nullopt});
    }

    void fail(beast::error_code ec, Phase phase) {
        if (completed_) {
            return;
        }

        if (abort_ == Abort::cancelled) {
            complete_error(pipeline::ErrorKind::cancelled, "client disconnected");
            return;
        }
        if (abort_ == Abort::deadline) {
            balancer_->report_failure(selection_.index);
            complete_error(pipeline::ErrorKind::upstream_timeout, "upstream request timed out");
            return;
        }

        const bool timed_out = abort_ == Abort::attempt_timeout || ec == beast::error::timeout;
        balancer_->report_failure(selection_.index);

        spdlog::warn("Forwarder: {} {} for request {} ({})",
                     phase == Phase::connect ? "Connect to" : "Exchange with",
                     ctx_->backend, ctx_->request_id,
                     timed_out ? "timeout" : ec.message());

        if (should_retry(phase)) {
            tried_.push_back(selection_.index);
            ++attempts_;
            reset_stream();
            attempt();
            return;
        }

        if (timed_out) {
            complete_error(pipeline::ErrorKind::upstream_timeout, "upstream request timed out");
        } else {
            complete_error(pipeline::ErrorKind::upstream,
                           std::string(phase == Phase::connect ? "upstream connect failed: "
                                                               : "upstream exchange failed: ")
                           + ec.message());
        }
    }

    bool should_retry(Phase phase) {
        if (attempts_ >= config_.max_retries || upgrade_ || ctx_->cancelled() || ctx_->expired()) {
            return false;
        }
        if (phase != Phase::connect && !idempotent_) {
            return false;
        }
        if (!budget_->withdraw()) {
            spdlog::debug("Forwarder: Retry budget exhausted for request {}", ctx_->request_id);
            return false;
        }
        return true;
    }

    void abort(Abort reason) {
        if (completed_) {
            return;
        }
        abort_ = reason;
        spdlog::debug("Forwarder: Aborting request {} ({})", ctx_->request_id,
                      reason == Abort::cancelled ? "cancelled" : "timeout");
        resolver_.cancel();
        if (stream_) {
            stream_->cancel();
        }
    }

    bool stale(std::size_t attempt) const {
        return completed_ || attempt != attempts_;
    }

    void reset_stream() {
        if (stream_) {
            beast::error_code ignored;
            stream_->socket().shutdown(tcp::socket::shutdown_both, ignored);
            stream_->close();
            stream_.reset();
        }
    }

    void complete_error(pipeline::ErrorKind kind, std::string message) {
        complete(pipeline::UpstreamResult{
            .response = std::nullopt,
            .error = pipeline::Error{.kind = kind, .message = std::move(message)}
        });
    }

    void complete(pipeline::UpstreamResult result) {
        if (completed_) {
            return;
        }
        completed_ = true;
        timer_.cancel();
        resolver_.cancel();
        reset_stream();
        ctx_->clear_cancel_hook();

        auto done = std::move(done_);
        done(std::move(result));
    }

    asio::strand<asio::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    asio::steady_timer timer_;
    std::optional<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::string_body>> parser_;
    http::request<http::string_body> request_;

    ForwarderConfig config_;
    std::shared_ptr<RetryBudget> budget_;
    std::shared_ptr<pipeline::RequestContext> ctx_;
    std::shared_ptr<balancer::LoadBalancer> balancer_;
    pipeline::UpstreamCallback done_;

    const bool upgrade_;
    const bool idempotent_;
    balancer::BackendSelection selection_{};
    std::vector<std::size_t> tried_;
    std::size_t attempts_{0};
    Abort abort_{Abort::none};
    bool attempt_limited_{false};
    bool completed_{false};
};

Forwarder::Forwarder(asio::io_context& io_context,
                     const ForwarderConfig& config,
                     std::shared_ptr<RetryBudget> budget)
    : io_context_(io_context)
    , config_(config)
    , budget_(std::move(budget))
{
    spdlog::debug("Forwarder: Created with connect_timeout={}ms, io_timeout={}ms, max_retries={}",
                  config_.connect_timeout.count(), config_.io_timeout.count(), config_.max_retries);
}

void Forwarder::forward(const std::shared_ptr<pipeline::RequestContext>& ctx,
                        pipeline::UpstreamCallback done) {
    std::shared_ptr<balancer::LoadBalancer> balancer;
    if (ctx->snapshot && ctx->route) {
        balancer = ctx->snapshot->find_backend_group(ctx->route->backend_group);
    }
    if (!balancer) {
        done(pipeline::UpstreamResult{
            .response = std::nullopt,
            .error = pipeline::Error{.kind = pipeline::ErrorKind::no_healthy_backend,
                                     .message = "no backend group for route"}
        });
        return;
    }

    std::make_shared<Exchange>(io_context_, config_, budget_, ctx, std::move(balancer), std::move(done))->start();
}

http::request<http::string_body> Forwarder::build_backend_request(
    const pipeline::RequestContext& ctx,
    const config::BackendConfig& backend)
{
    const auto& original = ctx.request.message;

    // Copy method, target, headers and body, then rewrite per hop
    http::request<http::string_body> backend_request = original;
    backend_request.version(11);

    const bool upgrade = is_upgrade_request(original);
    strip_hop_by_hop(backend_request, upgrade);

    if (upgrade) {
        backend_request.set(http::field::connection, "Upgrade");
    } else {
        // No connection reuse towards backends
        backend_request.set(http::field::connection, "close");
    }

    // Set the Host header to the backend
    backend_request.set(http::field::host, backend_address(backend));

    // X-Forwarded-For - append to existing if present
    const auto& client_ip = ctx.client_ip();
    if (!client_ip.empty()) {
        std::string forwarded_for = client_ip;
        if (auto it = original.find("X-Forwarded-For"); it != original.end()) {
            forwarded_for = std::string(it->value()) + ", " + client_ip;
        }
        backend_request.set("X-Forwarded-For", forwarded_for);

        // X-Real-IP - keep the first proxy's value
        if (original.find("X-Real-IP") == original.end()) {
            backend_request.set("X-Real-IP", client_ip);
        }
    }

    if (auto it = original.find(http::field::host); it != original.end()) {
        backend_request.set("X-Forwarded-Host", it->value());
    }
    backend_request.set("X-Forwarded-Proto", ctx.request.tls ? "https" : "http");

    if (!ctx.request_id.empty()) {
        backend_request.set("X-Request-ID", ctx.request_id);
    }

    // Prepare the payload (sets Content-Length)
    backend_request.prepare_payload();

    return backend_request;
}

void Forwarder::prepare_client_response(http::response<http::string_body>& response) {
    // Set our own Server header
    response.set(http::field::server, server::server_name);

    // Body is fully buffered; let the session compute the length
    if (response.result_int() != 101 && response.find(http::field::content_length) == response.end()) {
        response.prepare_payload();
    }
}

bool Forwarder::is_upgrade_request(const http::request<http::string_body>& request) {
    return request.version() >= 11
        && request.find(http::field::upgrade) != request.end()
        && http::token_list(request[http::field::connection]).exists("upgrade");
}

bool Forwarder::is_idempotent(http::verb method) {
    switch (method) {
        case http::verb::get:
        case http::verb::head:
        case http::verb::options:
        case http::verb::put:
        case http::verb::delete_:
            return true;
        default:
            return false;
    }
}

std::string Forwarder::generate_request_id() {
    // Generate a UUID-like request ID
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t part1 = dis(gen);
    std::uint64_t part2 = dis(gen);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (part1 & 0xFFFF) << "-";
    ss << std::setw(4) << ((part2 >> 48) & 0xFFFF) << "-";
    ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

} // namespace portway::proxy
