/**
 * PORTWAY - API Gateway Request Kernel
 * Counter Store - shared window counters for the distributed rate limiter
 */

#ifndef PORTWAY_RATELIMIT_COUNTER_STORE_HPP
#define PORTWAY_RATELIMIT_COUNTER_STORE_HPP

#include "ratelimit/sliding_window.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace portway::ratelimit {

/**
 * One atomic check-and-increment against the shared store
 */
struct WindowAdmission {
    std::string current_key;
    std::string previous_key;
    std::uint64_t limit{0};
    std::int64_t window_ms{0};
    std::int64_t elapsed_ms{0};
    std::int64_t ttl_ms{0};  // Applied to current_key on increment
};

/**
 * Store reply: whether the request was admitted and the window counts
 * after the (possible) increment
 */
struct AdmissionReply {
    bool admitted{false};
    WindowCounts counts;
};

using AdmissionHandler = std::function<void(boost::system::error_code, AdmissionReply)>;

/**
 * Counter store interface
 *
 * async_admit must read both windows, apply the admission test and
 * increment-with-expiry in a single atomic round trip.
 */
class CounterStore {
public:
    virtual ~CounterStore() = default;

    virtual void async_admit(WindowAdmission admission, AdmissionHandler handler) = 0;
};

} // namespace portway::ratelimit

#endif // PORTWAY_RATELIMIT_COUNTER_STORE_HPP
