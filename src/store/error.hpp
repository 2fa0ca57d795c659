/**
 * PORTWAY - API Gateway Request Kernel
 * Store errors - error_code category for the counter store client
 */

#ifndef PORTWAY_STORE_ERROR_HPP
#define PORTWAY_STORE_ERROR_HPP

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/system/error_code.hpp>

#include <type_traits>

namespace portway::store {

enum class errc {
    protocol_error = 1,  // Reply could not be parsed
    server_error,        // Store answered with an error reply
    backoff,             // Reconnect back-off in effect
    closed               // Client shut down
};

const boost::system::error_category& store_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

} // namespace portway::store

namespace boost::system {

template <>
struct is_error_code_enum<portway::store::errc> : std::true_type {};

} // namespace boost::system

#endif // PORTWAY_STORE_ERROR_HPP
