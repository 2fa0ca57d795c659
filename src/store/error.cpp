/**
 * PORTWAY - API Gateway Request Kernel
 * Store errors implementation
 */

#include "store/error.hpp"

#include <string>

namespace portway::store {

namespace {

class StoreCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "portway.store";
    }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::protocol_error: return "malformed store reply";
            case errc::server_error:   return "store returned an error";
            case errc::backoff:        return "store reconnect back-off in effect";
            case errc::closed:         return "store client closed";
        }
        return "unknown store error";
    }
};

} // anonymous namespace

const boost::system::error_category& store_category() noexcept {
    static const StoreCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), store_category()};
}

} // namespace portway::store
