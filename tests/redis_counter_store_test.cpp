/**
 * PORTWAY - API Gateway Request Kernel
 * Redis counter store command and reply tests
 */

#include "store/error.hpp"
#include "store/redis_counter_store.hpp"

#include <gtest/gtest.h>

using namespace portway;
using store::resp::Value;

namespace {

Value integer(std::int64_t n) {
    Value value;
    value.type = Value::Type::integer;
    value.integer = n;
    return value;
}

Value array(std::vector<Value> elements) {
    Value value;
    value.type = Value::Type::array;
    value.elements = std::move(elements);
    return value;
}

} // anonymous namespace

TEST(RedisCounterStoreTest, AdmissionCommandIsEvalWithTwoKeys) {
    ratelimit::WindowAdmission admission{
        .current_key = "rl:k:11",
        .previous_key = "rl:k:10",
        .limit = 5,
        .window_ms = 1000,
        .elapsed_ms = 250,
        .ttl_ms = 3000
    };

    auto command = store::RedisCounterStore::admission_command(admission);
    ASSERT_EQ(command.size(), 9u);
    EXPECT_EQ(command[0], "EVAL");
    EXPECT_NE(command[1].find("INCR"), std::string::npos);
    EXPECT_NE(command[1].find("PEXPIRE"), std::string::npos);
    EXPECT_EQ(command[2], "2");
    EXPECT_EQ(command[3], "rl:k:11");
    EXPECT_EQ(command[4], "rl:k:10");
    EXPECT_EQ(command[5], "5");
    EXPECT_EQ(command[6], "1000");
    EXPECT_EQ(command[7], "250");
    EXPECT_EQ(command[8], "3000");
}

TEST(RedisCounterStoreTest, ScriptAppliesTheWindowTestAndExpiry) {
    auto command = store::RedisCounterStore::admission_command(ratelimit::WindowAdmission{
        .current_key = "c", .previous_key = "p", .limit = 1, .window_ms = 1, .elapsed_ms = 0, .ttl_ms = 1});
    const auto& script = command[1];

    // The in-memory store of the limiter tests evaluates this same expression
    EXPECT_NE(script.find("if (cur + 1) * window + prev * (window - elapsed) <= limit * window then"),
              std::string::npos);
    EXPECT_NE(script.find("local limit = tonumber(ARGV[1])"), std::string::npos);
    EXPECT_NE(script.find("local window = tonumber(ARGV[2])"), std::string::npos);
    EXPECT_NE(script.find("local elapsed = tonumber(ARGV[3])"), std::string::npos);
    EXPECT_NE(script.find("redis.call('PEXPIRE', KEYS[1], ARGV[4])"), std::string::npos);
    EXPECT_EQ(script.find("KEYS[2], ARGV"), std::string::npos);
}

TEST(RedisCounterStoreTest, ParsesAdmittedReply) {
    ratelimit::AdmissionReply reply;
    auto ec = store::RedisCounterStore::parse_reply(array({integer(1), integer(3), integer(7)}), reply);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(reply.admitted);
    EXPECT_EQ(reply.counts.current, 3u);
    EXPECT_EQ(reply.counts.previous, 7u);
}

TEST(RedisCounterStoreTest, ParsesDeniedReply) {
    ratelimit::AdmissionReply reply;
    auto ec = store::RedisCounterStore::parse_reply(array({integer(0), integer(5), integer(0)}), reply);
    EXPECT_FALSE(ec);
    EXPECT_FALSE(reply.admitted);
    EXPECT_EQ(reply.counts.current, 5u);
}

TEST(RedisCounterStoreTest, RejectsUnexpectedReplies) {
    ratelimit::AdmissionReply reply;

    auto short_array = store::RedisCounterStore::parse_reply(array({integer(1), integer(3)}), reply);
    EXPECT_EQ(short_array, store::errc::protocol_error);

    auto negative = store::RedisCounterStore::parse_reply(array({integer(1), integer(-1), integer(0)}), reply);
    EXPECT_EQ(negative, store::errc::protocol_error);

    auto scalar = store::RedisCounterStore::parse_reply(integer(1), reply);
    EXPECT_EQ(scalar, store::errc::protocol_error);
}

TEST(RedisCounterStoreTest, ErrorCategoryNamesStoreErrors) {
    boost::system::error_code ec = store::errc::backoff;
    EXPECT_EQ(ec.category(), store::store_category());
    EXPECT_FALSE(ec.message().empty());
}
