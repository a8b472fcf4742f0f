#include <gtest/gtest.h>

#include "external_tag.hpp"

TEST(ExternalTag, FormatsTag) {
    EXPECT_EQ(FormatExternalTag("42"), "[EXT-42]");
}

TEST(ExternalTag, DescriptionKeepsRemoteText) {
    EXPECT_EQ(BuildExternalDescription("7", "buy oat milk"), "[EXT-7] buy oat milk");
    EXPECT_EQ(BuildExternalDescription("7", ""), "[EXT-7]");
}

TEST(ExternalTag, ParsesFirstTag) {
    EXPECT_EQ(ParseExternalTag("[EXT-123] notes"), "123");
    EXPECT_EQ(ParseExternalTag("prefix [EXT-abc] [EXT-def]"), "abc");
    EXPECT_EQ(ParseExternalTag("[EXT-8888888888]"), "8888888888");
}

TEST(ExternalTag, MalformedMeansUntagged) {
    EXPECT_FALSE(ParseExternalTag("").has_value());
    EXPECT_FALSE(ParseExternalTag("plain description").has_value());
    EXPECT_FALSE(ParseExternalTag("[EXT-123 no closing bracket").has_value());
    EXPECT_FALSE(ParseExternalTag("[EXT-]").has_value());
    EXPECT_FALSE(ParseExternalTag("[EXT-12 34]").has_value());
    EXPECT_FALSE(ParseExternalTag("[EXT-[9]").has_value());
    EXPECT_FALSE(ParseExternalTag("[ext-5]").has_value());
}

TEST(ExternalTag, RoundTripsThroughDescription) {
    EXPECT_EQ(ParseExternalTag(BuildExternalDescription("5", "text")), "5");
}

TEST(ExternalTag, LinkableIds) {
    EXPECT_TRUE(IsLinkableExternalId("8123456789"));
    EXPECT_TRUE(IsLinkableExternalId("abc-DEF_1"));
    EXPECT_FALSE(IsLinkableExternalId(""));
    EXPECT_FALSE(IsLinkableExternalId("a b"));
    EXPECT_FALSE(IsLinkableExternalId("a]b"));
    EXPECT_FALSE(IsLinkableExternalId("a[b"));
    EXPECT_FALSE(IsLinkableExternalId("tab\tid"));
}
