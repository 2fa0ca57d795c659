/**
 * PORTWAY - API Gateway Request Kernel
 * RESP - Redis serialization protocol encoder and incremental parser
 */

#ifndef PORTWAY_STORE_RESP_HPP
#define PORTWAY_STORE_RESP_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portway::store::resp {

/**
 * Malformed data on the wire
 */
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A decoded RESP value
 */
struct Value {
    enum class Type {
        simple_string,
        error,
        integer,
        bulk_string,
        nil,
        array
    };

    Type type{Type::nil};
    std::string str;              // simple_string, error, bulk_string
    std::int64_t integer{0};
    std::vector<Value> elements;  // array

    bool is_error() const noexcept { return type == Type::error; }
    bool is_nil() const noexcept { return type == Type::nil; }
};

/**
 * Encode a command as a RESP array of bulk strings
 */
std::string encode_command(const std::vector<std::string>& args);

/**
 * Incremental reply parser
 *
 * Feed bytes as they arrive; next() returns complete values in order and
 * leaves partial input buffered.
 */
class Parser {
public:
    void feed(std::string_view data);

    /**
     * @return the next complete value, or nullopt if more input is needed
     * @throws ProtocolError on malformed input
     */
    std::optional<Value> next();

    std::size_t buffered() const noexcept { return buffer_.size(); }

    void reset() { buffer_.clear(); }

private:
    bool parse(std::size_t& pos, Value& out, int depth) const;
    bool read_line(std::size_t& pos, std::string_view& line) const;

    std::string buffer_;
};

} // namespace portway::store::resp

#endif // PORTWAY_STORE_RESP_HPP
