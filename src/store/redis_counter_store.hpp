/**
 * PORTWAY - API Gateway Request Kernel
 * Redis Counter Store - atomic sliding window admission in a Lua script
 */

#ifndef PORTWAY_STORE_REDIS_COUNTER_STORE_HPP
#define PORTWAY_STORE_REDIS_COUNTER_STORE_HPP

#include "ratelimit/counter_store.hpp"
#include "store/redis_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace portway::store {

/**
 * Counter store backed by Redis (or any server speaking RESP with EVAL).
 *
 * The admission test and INCR+PEXPIRE run server side in one script, so
 * concurrent gateways never over-admit between read and increment.
 */
class RedisCounterStore : public ratelimit::CounterStore {
public:
    explicit RedisCounterStore(RedisClient::Ptr client);

    void async_admit(ratelimit::WindowAdmission admission,
                     ratelimit::AdmissionHandler handler) override;

    /**
     * The EVAL command for one admission
     */
    static std::vector<std::string> admission_command(const ratelimit::WindowAdmission& admission);

    /**
     * Decode the script reply {admitted, current, previous}
     */
    static boost::system::error_code parse_reply(const resp::Value& value,
                                                 ratelimit::AdmissionReply& reply);

private:
    RedisClient::Ptr client_;
};

} // namespace portway::store

#endif // PORTWAY_STORE_REDIS_COUNTER_STORE_HPP
