/**
 * PORTWAY - API Gateway Request Kernel
 * Pipeline Executor implementation
 */

#include "pipeline/executor.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <string>
#include <string_view>

namespace portway::pipeline {

/**
 * State of one pipeline run. Kept alive by the callbacks it hands out.
 */
class Executor::Run : public std::enable_shared_from_this<Executor::Run> {
public:
    Run(UpstreamCall upstream, std::shared_ptr<RequestContext> ctx,
        std::vector<PluginPtr> chain, PipelineCallback done)
        : upstream_(std::move(upstream))
        , ctx_(std::move(ctx))
        , chain_(std::move(chain))
        , done_(std::move(done))
    {
    }

    void start() {
        next_request_hook();
    }

private:
    enum class Stage { request, response };

    unsigned version() const { return ctx_->request.message.version(); }

    // Wraps a hook callback so a plugin calling it twice is ignored
    using Flag = std::shared_ptr<std::atomic<bool>>;

    HookCallback once(Stage stage, const Flag& called) {
        return [self = shared_from_this(), called, stage,
                plugin = std::string(chain_[index_]->type())](HookResult result) {
            if (called->exchange(true)) {
                spdlog::error("Executor: Plugin '{}' completed a hook twice", plugin);
                return;
            }
            if (stage == Stage::request) {
                self->on_request_hook(std::move(result));
            } else {
                self->on_response_hook(std::move(result));
            }
        };
    }

    bool interrupted() {
        if (ctx_->cancelled()) {
            finish_with(Error{.kind = ErrorKind::cancelled, .message = "client disconnected"});
            return true;
        }
        if (ctx_->expired()) {
            finish_with(Error{.kind = ErrorKind::upstream_timeout, .message = "request deadline exceeded"});
            return true;
        }
        return false;
    }

    void next_request_hook() {
        if (interrupted()) {
            return;
        }
        if (index_ >= chain_.size()) {
            call_upstream();
            return;
        }

        auto plugin = chain_[index_];
        auto called = std::make_shared<std::atomic<bool>>(false);
        try {
            plugin->on_request(ctx_, once(Stage::request, called));
        } catch (const std::exception& e) {
            hook_threw(e, plugin->type(), called);
        }
    }

    void on_request_hook(HookResult result) {
        switch (result.action) {
            case HookResult::Action::proceed:
                ++index_;
                next_request_hook();
                return;

            case HookResult::Action::respond:
                spdlog::debug("Executor: Plugin '{}' short-circuited request {}",
                              chain_[index_]->type(), ctx_->request_id);
                finish(std::move(*result.response));
                return;

            case HookResult::Action::fail:
                if (skip_failure(result)) {
                    ++index_;
                    next_request_hook();
                    return;
                }
                finish_with(std::move(*result.error));
                return;
        }
    }

    void call_upstream() {
        try {
            upstream_(ctx_, [self = shared_from_this()](UpstreamResult result) {
                self->on_upstream(std::move(result));
            });
        } catch (const std::exception& e) {
            spdlog::error("Executor: Upstream call threw for request {}: {}", ctx_->request_id, e.what());
            finish_with(Error{.kind = ErrorKind::upstream, .message = e.what()});
        }
    }

    void on_upstream(UpstreamResult result) {
        if (result.error || !result.response) {
            finish_with(result.error ? std::move(*result.error)
                                     : Error{.kind = ErrorKind::upstream, .message = "no response"});
            return;
        }

        response_ = std::move(*result.response);
        index_ = 0;
        upstream_done_ = true;
        next_response_hook();
    }

    void next_response_hook() {
        if (index_ >= chain_.size()) {
            finish(std::move(response_));
            return;
        }
        if (ctx_->cancelled()) {
            finish_with(Error{.kind = ErrorKind::cancelled, .message = "client disconnected"});
            return;
        }

        auto plugin = chain_[index_];
        auto called = std::make_shared<std::atomic<bool>>(false);
        try {
            plugin->on_response(ctx_, response_, once(Stage::response, called));
        } catch (const std::exception& e) {
            hook_threw(e, plugin->type(), called);
        }
    }

    void on_response_hook(HookResult result) {
        switch (result.action) {
            case HookResult::Action::proceed:
                ++index_;
                next_response_hook();
                return;

            case HookResult::Action::respond:
                finish(std::move(*result.response));
                return;

            case HookResult::Action::fail:
                if (skip_failure(result)) {
                    ++index_;
                    next_response_hook();
                    return;
                }
                finish_with(std::move(*result.error));
                return;
        }
    }

    // index_ still points at the throwing plugin unless it completed first
    void hook_threw(const std::exception& e, std::string_view plugin, const Flag& called) {
        spdlog::error("Executor: Plugin '{}' threw: {}", plugin, e.what());
        if (called->exchange(true)) {
            return;  // Already completed before throwing
        }
        auto result = HookResult::fail(Error{.kind = ErrorKind::plugin, .message = e.what()});
        if (upstream_done_) {
            on_response_hook(std::move(result));
        } else {
            on_request_hook(std::move(result));
        }
    }

    bool skip_failure(const HookResult& result) {
        auto& plugin = chain_[index_];
        if (plugin->failure_policy() != FailurePolicy::skippable) {
            return false;
        }
        spdlog::warn("Executor: Skipping failed plugin '{}' for request {}: {}",
                     plugin->type(), ctx_->request_id,
                     result.error ? result.error->message : std::string("unknown error"));
        return true;
    }

    void finish_with(Error error) {
        auto response = error_response(error, version());
        ctx_->error = std::move(error);
        finish(std::move(response));
    }

    void finish(server::HttpResponse response) {
        if (finished_) {
            return;
        }
        finished_ = true;
        done_(std::move(response));
    }

    UpstreamCall upstream_;
    std::shared_ptr<RequestContext> ctx_;
    std::vector<PluginPtr> chain_;
    PipelineCallback done_;

    std::size_t index_{0};
    bool upstream_done_{false};
    bool finished_{false};
    server::HttpResponse response_;
};

Executor::Executor(UpstreamCall upstream)
    : upstream_(std::move(upstream))
{
}

void Executor::run(std::shared_ptr<RequestContext> ctx,
                   std::vector<PluginPtr> chain,
                   PipelineCallback done) const {
    std::make_shared<Run>(upstream_, std::move(ctx), std::move(chain), std::move(done))->start();
}

} // namespace portway::pipeline
