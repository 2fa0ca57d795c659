/**
 * PORTWAY - API Gateway Request Kernel
 * RESP codec tests
 */

#include "store/resp.hpp"

#include <gtest/gtest.h>

using namespace portway::store::resp;

TEST(RespTest, EncodesCommandAsBulkStringArray) {
    EXPECT_EQ(encode_command({"GET", "key"}), "*2\r\n$3\r\nGET\r\n$3\r\nkey\r\n");
    EXPECT_EQ(encode_command({"SET", "k", ""}), "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
}

TEST(RespTest, ParsesScalarReplies) {
    Parser parser;
    parser.feed("+OK\r\n-ERR wrong type\r\n:42\r\n$5\r\nhello\r\n$-1\r\n");

    auto ok = parser.next();
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->type, Value::Type::simple_string);
    EXPECT_EQ(ok->str, "OK");

    auto err = parser.next();
    ASSERT_TRUE(err);
    EXPECT_TRUE(err->is_error());
    EXPECT_EQ(err->str, "ERR wrong type");

    auto number = parser.next();
    ASSERT_TRUE(number);
    EXPECT_EQ(number->type, Value::Type::integer);
    EXPECT_EQ(number->integer, 42);

    auto bulk = parser.next();
    ASSERT_TRUE(bulk);
    EXPECT_EQ(bulk->type, Value::Type::bulk_string);
    EXPECT_EQ(bulk->str, "hello");

    auto nil = parser.next();
    ASSERT_TRUE(nil);
    EXPECT_TRUE(nil->is_nil());

    EXPECT_FALSE(parser.next());
    EXPECT_EQ(parser.buffered(), 0u);
}

TEST(RespTest, WaitsForCompleteArrays) {
    Parser parser;
    parser.feed("*3\r\n:1\r\n:5");
    EXPECT_FALSE(parser.next());

    parser.feed("\r\n:0\r");
    EXPECT_FALSE(parser.next());

    parser.feed("\n");
    auto value = parser.next();
    ASSERT_TRUE(value);
    ASSERT_EQ(value->type, Value::Type::array);
    ASSERT_EQ(value->elements.size(), 3u);
    EXPECT_EQ(value->elements[0].integer, 1);
    EXPECT_EQ(value->elements[1].integer, 5);
    EXPECT_EQ(value->elements[2].integer, 0);
}

TEST(RespTest, BulkStringMayContainCrlf) {
    Parser parser;
    parser.feed("$4\r\na\r\nb\r\n");
    auto value = parser.next();
    ASSERT_TRUE(value);
    EXPECT_EQ(value->str, "a\r\nb");
}

TEST(RespTest, RejectsMalformedInput) {
    Parser bad_type;
    bad_type.feed("?what\r\n");
    EXPECT_THROW(bad_type.next(), ProtocolError);

    Parser bad_integer;
    bad_integer.feed(":12x\r\n");
    EXPECT_THROW(bad_integer.next(), ProtocolError);

    Parser bad_terminator;
    bad_terminator.feed("$2\r\nabXY");
    EXPECT_THROW(bad_terminator.next(), ProtocolError);
}
