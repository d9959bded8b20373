#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "headingclassifier.h"
#include "tocregistry.h"

using HeadingClassifier::ParseState;

TEST_CASE("nominal level counts leading hashes")
{
    CHECK(HeadingClassifier::nominalLevel(QStringLiteral("# Title")) == 1);
    CHECK(HeadingClassifier::nominalLevel(QStringLiteral("### Deep")) == 3);
    CHECK(HeadingClassifier::nominalLevel(QStringLiteral("######## Too deep")) == 8);
}

TEST_CASE("heading text drops every hash and surrounding space")
{
    CHECK(HeadingClassifier::headingText(QStringLiteral("##   Solution  ")) == QStringLiteral("Solution"));
    CHECK(HeadingClassifier::headingText(QStringLiteral("## Issue #42")) == QStringLiteral("Issue 42"));
}

TEST_CASE("display level is clamped to two")
{
    ParseState state;
    CHECK(HeadingClassifier::classify(QStringLiteral("# Title"), state).heading.level == 1);
    CHECK(HeadingClassifier::classify(QStringLiteral("## Overview"), state).heading.level == 2);
    CHECK(HeadingClassifier::classify(QStringLiteral("#### Details"), state).heading.level == 2);
    CHECK(HeadingClassifier::classify(QStringLiteral("######### Way down"), state).heading.level == 2);
}

TEST_CASE("solution heading is remembered")
{
    ParseState state;
    const auto result = HeadingClassifier::classify(QStringLiteral("## Proposed Solution"), state);
    CHECK(result.heading.level == 2);
    REQUIRE(state.currentSolutionHeading.has_value());
    CHECK(*state.currentSolutionHeading == QStringLiteral("Proposed Solution"));
}

TEST_CASE("how it works after a solution becomes level three")
{
    ParseState state;
    HeadingClassifier::classify(QStringLiteral("## Solution"), state);
    CHECK(HeadingClassifier::classify(QStringLiteral("# How It Works"), state).heading.level == 3);
    CHECK(HeadingClassifier::classify(QStringLiteral("### How It Works"), state).heading.level == 3);
}

TEST_CASE("how it works without a solution keeps the default level")
{
    ParseState state;
    const auto result = HeadingClassifier::classify(QStringLiteral("### How It Works"), state);
    CHECK(result.heading.level == 2);
    CHECK_FALSE(state.currentSolutionHeading.has_value());
}

TEST_CASE("the solution flag persists across later sections")
{
    ParseState state;
    HeadingClassifier::classify(QStringLiteral("## Solution"), state);
    HeadingClassifier::classify(QStringLiteral("## Impacts"), state);
    CHECK(HeadingClassifier::classify(QStringLiteral("## How It Works"), state).heading.level == 3);
}

TEST_CASE("a heading naming both keeps the solution rule")
{
    ParseState state;
    const auto result = HeadingClassifier::classify(
        QStringLiteral("### How It Works: Solution"), state);
    CHECK(result.heading.level == 2);
    CHECK(state.currentSolutionHeading.has_value());
}

TEST_CASE("keyword match is case sensitive")
{
    ParseState state;
    HeadingClassifier::classify(QStringLiteral("## solution"), state);
    CHECK_FALSE(state.currentSolutionHeading.has_value());
    CHECK(HeadingClassifier::classify(QStringLiteral("### How It Works"), state).heading.level == 2);
}

TEST_CASE("toc records nominal levels below the title")
{
    ParseState state;
    TocRegistry toc;
    HeadingClassifier::classify(QStringLiteral("# Title"), state, &toc);
    HeadingClassifier::classify(QStringLiteral("## Solution"), state, &toc);
    HeadingClassifier::classify(QStringLiteral("##### Deep"), state, &toc);

    REQUIRE(toc.size() == 2);
    CHECK(toc.entries().at(0) == Content::TocEntry{2, QStringLiteral("Solution")});
    CHECK(toc.entries().at(1) == Content::TocEntry{5, QStringLiteral("Deep")});
}
