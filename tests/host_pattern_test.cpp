/**
 * PORTWAY - API Gateway Request Kernel
 * Host pattern tests
 */

#include "routing/host_pattern.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace portway::routing;

TEST(HostPatternTest, NormalizeStripsPortCaseAndTrailingDot) {
    EXPECT_EQ(normalize_host("API.Example.COM:8443"), "api.example.com");
    EXPECT_EQ(normalize_host("example.com."), "example.com");
    EXPECT_EQ(normalize_host("[::1]:8080"), "[::1]");
    EXPECT_EQ(normalize_host("localhost"), "localhost");
    EXPECT_EQ(normalize_host(""), "");
}

TEST(HostPatternTest, ExactMatchesOnlyItself) {
    auto pattern = HostPattern::parse("Api.Example.com");
    EXPECT_EQ(pattern.kind(), HostPattern::Kind::exact);
    EXPECT_TRUE(pattern.matches("api.example.com"));
    EXPECT_FALSE(pattern.matches("www.api.example.com"));
    EXPECT_FALSE(pattern.matches("example.com"));
}

TEST(HostPatternTest, WildcardNeedsAtLeastOneLabel) {
    auto pattern = HostPattern::parse("*.example.com");
    EXPECT_EQ(pattern.kind(), HostPattern::Kind::wildcard);
    EXPECT_TRUE(pattern.matches("a.example.com"));
    EXPECT_TRUE(pattern.matches("a.b.example.com"));
    EXPECT_FALSE(pattern.matches("example.com"));
    EXPECT_FALSE(pattern.matches("badexample.com"));
}

TEST(HostPatternTest, CertificateWildcardCoversOneLabel) {
    auto pattern = HostPattern::parse("*.example.com");
    EXPECT_TRUE(pattern.matches_certificate_name("a.example.com"));
    EXPECT_FALSE(pattern.matches_certificate_name("a.b.example.com"));
    EXPECT_FALSE(pattern.matches_certificate_name("example.com"));

    EXPECT_TRUE(HostPattern::parse("api.example.com").matches_certificate_name("api.example.com"));
}

TEST(HostPatternTest, CatchAll) {
    EXPECT_EQ(HostPattern::parse("*").kind(), HostPattern::Kind::any);
    EXPECT_EQ(HostPattern::parse("").kind(), HostPattern::Kind::any);
    EXPECT_TRUE(HostPattern::parse("*").matches("anything.at.all"));
}

TEST(HostPatternTest, SpecificityOrdersExactWildcardAny) {
    auto exact = HostPattern::parse("api.example.com");
    auto long_wildcard = HostPattern::parse("*.eu.example.com");
    auto short_wildcard = HostPattern::parse("*.example.com");
    auto any = HostPattern::parse("*");

    EXPECT_GT(exact.specificity(), long_wildcard.specificity());
    EXPECT_GT(long_wildcard.specificity(), short_wildcard.specificity());
    EXPECT_GT(short_wildcard.specificity(), any.specificity());

    // A short exact name still beats a long wildcard
    EXPECT_GT(HostPattern::parse("a.io").specificity(),
              HostPattern::parse("*.very.long.example.com").specificity());
}

TEST(HostPatternTest, RejectsMisplacedWildcards) {
    EXPECT_THROW(HostPattern::parse("api.*.com"), std::invalid_argument);
    EXPECT_THROW(HostPattern::parse("*.*.com"), std::invalid_argument);
}
