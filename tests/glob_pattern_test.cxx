#include <gtest/gtest.h>

#include <stdexcept>

#include "broker/glob_pattern.hpp"

using broker::GlobPattern;

TEST(GlobPatternTest, StarMatchesTenantTopics)
{
    GlobPattern pattern("readings:*");
    EXPECT_TRUE(pattern.match("readings:t1"));
    EXPECT_TRUE(pattern.match("readings:"));
    EXPECT_TRUE(pattern.match("readings:acme:north"));
    EXPECT_FALSE(pattern.match("reading:t1"));
    EXPECT_FALSE(pattern.match("alerts:t1"));
}

TEST(GlobPatternTest, QuestionMarkMatchesExactlyOneCharacter)
{
    GlobPattern pattern("readings:t?");
    EXPECT_TRUE(pattern.match("readings:t1"));
    EXPECT_FALSE(pattern.match("readings:t"));
    EXPECT_FALSE(pattern.match("readings:t12"));
}

TEST(GlobPatternTest, CharacterClassesAndNegation)
{
    GlobPattern range("readings:t[1-3]");
    EXPECT_TRUE(range.match("readings:t2"));
    EXPECT_FALSE(range.match("readings:t4"));

    GlobPattern negated("readings:t[^0-9]");
    EXPECT_TRUE(negated.match("readings:tx"));
    EXPECT_FALSE(negated.match("readings:t7"));
}

TEST(GlobPatternTest, EscapedMetacharactersAreLiteral)
{
    GlobPattern pattern("readings:\\*");
    EXPECT_TRUE(pattern.match("readings:*"));
    EXPECT_FALSE(pattern.match("readings:t1"));
}

TEST(GlobPatternTest, MultipleStarsBacktrack)
{
    GlobPattern pattern("*:*:north");
    EXPECT_TRUE(pattern.match("readings:acme:north"));
    EXPECT_FALSE(pattern.match("readings:acme:south"));
}

TEST(GlobPatternTest, UnterminatedClassIsRejected)
{
    EXPECT_THROW(GlobPattern("readings:[abc"), std::invalid_argument);
}
