/**
 * PORTWAY - API Gateway Request Kernel
 * Redis Counter Store implementation
 */

#include "store/redis_counter_store.hpp"

#include <spdlog/spdlog.h>

namespace portway::store {

namespace {

// KEYS: current window, previous window
// ARGV: limit, window ms, elapsed ms, ttl ms
constexpr const char* admission_script = R"lua(
local cur = tonumber(redis.call('GET', KEYS[1]) or '0')
local prev = tonumber(redis.call('GET', KEYS[2]) or '0')
local limit = tonumber(ARGV[1])
local window = tonumber(ARGV[2])
local elapsed = tonumber(ARGV[3])
if (cur + 1) * window + prev * (window - elapsed) <= limit * window then
  cur = redis.call('INCR', KEYS[1])
  redis.call('PEXPIRE', KEYS[1], ARGV[4])
  return {1, cur, prev}
end
return {0, cur, prev}
)lua";

bool non_negative_integer(const resp::Value& value) {
    return value.type == resp::Value::Type::integer && value.integer >= 0;
}

} // anonymous namespace

RedisCounterStore::RedisCounterStore(RedisClient::Ptr client)
    : client_(std::move(client))
{
}

void RedisCounterStore::async_admit(ratelimit::WindowAdmission admission,
                                    ratelimit::AdmissionHandler handler) {
    client_->async_command(admission_command(admission),
        [handler = std::move(handler)](boost::system::error_code ec, resp::Value value) {
            ratelimit::AdmissionReply reply;
            if (!ec) {
                if (value.is_error()) {
                    spdlog::warn("RedisCounterStore: Script error: {}", value.str);
                    ec = errc::server_error;
                } else {
                    ec = parse_reply(value, reply);
                }
            }
            handler(ec, reply);
        });
}

std::vector<std::string> RedisCounterStore::admission_command(
    const ratelimit::WindowAdmission& admission)
{
    return {
        "EVAL",
        admission_script,
        "2",
        admission.current_key,
        admission.previous_key,
        std::to_string(admission.limit),
        std::to_string(admission.window_ms),
        std::to_string(admission.elapsed_ms),
        std::to_string(admission.ttl_ms)
    };
}

boost::system::error_code RedisCounterStore::parse_reply(const resp::Value& value,
                                                         ratelimit::AdmissionReply& reply) {
    if (value.type != resp::Value::Type::array || value.elements.size() != 3) {
        return errc::protocol_error;
    }
    for (const auto& element : value.elements) {
        if (!non_negative_integer(element)) {
            return errc::protocol_error;
        }
    }

    reply.admitted = value.elements[0].integer == 1;
    reply.counts.current = static_cast<std::uint64_t>(value.elements[1].integer);
    reply.counts.previous = static_cast<std::uint64_t>(value.elements[2].integer);
    return {};
}

} // namespace portway::store
