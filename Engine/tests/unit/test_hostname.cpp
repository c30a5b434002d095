/**
 * @file test_hostname.cpp
 * @brief Unit tests for hostname normalization and target-relative splitting
 */

#include <gtest/gtest.h>
#include <dns/hostname.hpp>
#include <dns/domain_splitter.hpp>
#include <stdexcept>
#include <string>

using namespace Regulator;

// ============================================================================
// Normalization
// ============================================================================

TEST(HostnameTest, LowercasesAndTrims) {
    auto host = normalize_hostname("  WWW.Example.COM \t");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(*host, "www.example.com");
}

TEST(HostnameTest, StripsWildcardAndTrailingDot) {
    EXPECT_EQ(normalize_hostname("*.api.example.com").value(), "api.example.com");
    EXPECT_EQ(normalize_hostname("api.example.com.").value(), "api.example.com");
}

TEST(HostnameTest, RejectsForeignCharacters) {
    EXPECT_FALSE(normalize_hostname("bad host.example.com").has_value());
    EXPECT_FALSE(normalize_hostname("caf\xc3\xa9.example.com").has_value());
    EXPECT_FALSE(normalize_hostname("a/b.example.com").has_value());
}

TEST(HostnameTest, RejectsEmptyAndOverlong) {
    EXPECT_FALSE(normalize_hostname("").has_value());
    EXPECT_FALSE(normalize_hostname("   ").has_value());
    EXPECT_FALSE(normalize_hostname(std::string(254, 'a')).has_value());
    EXPECT_TRUE(normalize_hostname(std::string(253, 'a')).has_value());
}

TEST(HostnameTest, KeepsUnderscoreAndHyphen) {
    EXPECT_EQ(normalize_hostname("_dmarc.mail-01.example.com").value(), "_dmarc.mail-01.example.com");
}

TEST(HostnameTest, CollapseDotRuns) {
    EXPECT_EQ(collapse_dot_runs("test..example.com"), "test.example.com");
    EXPECT_EQ(collapse_dot_runs("a...b....c"), "a.b.c");
    EXPECT_EQ(collapse_dot_runs("plain.example.com"), "plain.example.com");
    EXPECT_EQ(collapse_dot_runs(""), "");
}

// ============================================================================
// Domain splitting
// ============================================================================

TEST(DomainSplitterTest, SplitsSubdomain) {
    DomainSplitter splitter("example.com");
    auto parts = splitter.split("api.eu.example.com");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->subdomain, "api.eu");
    EXPECT_EQ(parts->registrable_domain, "example.com");
    EXPECT_EQ(parts->suffix, "com");
}

TEST(DomainSplitterTest, TargetItselfHasEmptySubdomain) {
    DomainSplitter splitter("example.com");
    auto parts = splitter.split("example.com");
    ASSERT_TRUE(parts.has_value());
    EXPECT_TRUE(parts->subdomain.empty());
}

TEST(DomainSplitterTest, RejectsHostsOutsideTarget) {
    DomainSplitter splitter("example.com");
    EXPECT_FALSE(splitter.split("www.other.org").has_value());
    EXPECT_FALSE(splitter.split("badexample.com").has_value());
    EXPECT_FALSE(splitter.split("com").has_value());
}

TEST(DomainSplitterTest, NormalizesTarget) {
    DomainSplitter splitter("Example.COM.");
    EXPECT_EQ(splitter.target(), "example.com");
    EXPECT_THROW(DomainSplitter(""), std::invalid_argument);
    EXPECT_THROW(DomainSplitter("not a domain"), std::invalid_argument);
}
