/**
 * PORTWAY - API Gateway Request Kernel
 * RESP implementation
 */

#include "store/resp.hpp"

#include <algorithm>
#include <charconv>

namespace portway::store::resp {

namespace {

constexpr int max_depth = 8;
constexpr std::int64_t max_bulk_length = 64 * 1024 * 1024;

std::int64_t to_integer(std::string_view text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw ProtocolError("RESP: invalid integer '" + std::string(text) + "'");
    }
    return value;
}

} // anonymous namespace

std::string encode_command(const std::vector<std::string>& args) {
    std::string out;
    out.reserve(16 + args.size() * 16);
    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (const auto& arg : args) {
        out += '$';
        out += std::to_string(arg.size());
        out += "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

void Parser::feed(std::string_view data) {
    buffer_.append(data.data(), data.size());
}

std::optional<Value> Parser::next() {
    std::size_t pos = 0;
    Value value;
    if (!parse(pos, value, 0)) {
        return std::nullopt;
    }
    buffer_.erase(0, pos);
    return value;
}

bool Parser::read_line(std::size_t& pos, std::string_view& line) const {
    auto eol = buffer_.find("\r\n", pos);
    if (eol == std::string::npos) {
        return false;
    }
    line = std::string_view(buffer_).substr(pos, eol - pos);
    pos = eol + 2;
    return true;
}

bool Parser::parse(std::size_t& pos, Value& out, int depth) const {
    if (depth > max_depth) {
        throw ProtocolError("RESP: nesting too deep");
    }
    if (pos >= buffer_.size()) {
        return false;
    }

    const char type = buffer_[pos];
    std::size_t cursor = pos + 1;
    std::string_view line;
    if (!read_line(cursor, line)) {
        return false;
    }

    switch (type) {
        case '+':
            out.type = Value::Type::simple_string;
            out.str = std::string(line);
            break;

        case '-':
            out.type = Value::Type::error;
            out.str = std::string(line);
            break;

        case ':':
            out.type = Value::Type::integer;
            out.integer = to_integer(line);
            break;

        case '$': {
            const auto length = to_integer(line);
            if (length < 0) {
                out.type = Value::Type::nil;
                break;
            }
            if (length > max_bulk_length) {
                throw ProtocolError("RESP: bulk string too large");
            }
            const auto size = static_cast<std::size_t>(length);
            if (buffer_.size() < cursor + size + 2) {
                return false;
            }
            if (buffer_.compare(cursor + size, 2, "\r\n") != 0) {
                throw ProtocolError("RESP: bulk string not terminated");
            }
            out.type = Value::Type::bulk_string;
            out.str = buffer_.substr(cursor, size);
            cursor += size + 2;
            break;
        }

        case '*': {
            const auto count = to_integer(line);
            if (count < 0) {
                out.type = Value::Type::nil;
                break;
            }
            out.type = Value::Type::array;
            out.elements.clear();
            out.elements.reserve(static_cast<std::size_t>(std::min<std::int64_t>(count, 64)));
            for (std::int64_t i = 0; i < count; ++i) {
                Value element;
                if (!parse(cursor, element, depth + 1)) {
                    return false;
                }
                out.elements.push_back(std::move(element));
            }
            break;
        }

        default:
            throw ProtocolError(std::string("RESP: unexpected type byte '") + type + "'");
    }

    pos = cursor;
    return true;
}

} // namespace portway::store::resp
