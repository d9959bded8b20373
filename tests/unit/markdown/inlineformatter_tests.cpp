#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "../common/ContentTestUtils.h"
#include "inlineformatter.h"

using designdoc::test::bold;
using designdoc::test::plain;

TEST_CASE("plain text becomes a single plain run")
{
    const auto runs = InlineFormatter::format(QStringLiteral("nothing special here"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0) == plain(QStringLiteral("nothing special here")));
}

TEST_CASE("bold span splits the line into three runs")
{
    const auto runs = InlineFormatter::format(QStringLiteral("This **changed**."));
    REQUIRE(runs.size() == 3);
    CHECK(runs.at(0) == plain(QStringLiteral("This ")));
    CHECK(runs.at(1) == bold(QStringLiteral("changed")));
    CHECK(runs.at(2) == plain(QStringLiteral(".")));
}

TEST_CASE("bold span at the edges produces no empty plain runs")
{
    const auto runs = InlineFormatter::format(QStringLiteral("**all bold**"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0) == bold(QStringLiteral("all bold")));
}

TEST_CASE("several bold spans alternate with plain text")
{
    const auto runs = InlineFormatter::format(QStringLiteral("**a** and **b** done"));
    REQUIRE(runs.size() == 4);
    CHECK(runs.at(0) == bold(QStringLiteral("a")));
    CHECK(runs.at(1) == plain(QStringLiteral(" and ")));
    CHECK(runs.at(2) == bold(QStringLiteral("b")));
    CHECK(runs.at(3) == plain(QStringLiteral(" done")));
}

TEST_CASE("unterminated marker stays literal")
{
    const auto runs = InlineFormatter::format(QStringLiteral("**unterminated bold"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0) == plain(QStringLiteral("**unterminated bold")));
}

TEST_CASE("odd marker count pairs the first two and keeps the rest literal")
{
    const auto runs = InlineFormatter::format(QStringLiteral("**one** two **three"));
    REQUIRE(runs.size() == 2);
    CHECK(runs.at(0) == bold(QStringLiteral("one")));
    CHECK(runs.at(1) == plain(QStringLiteral(" two **three")));
}

TEST_CASE("a bold span needs at least one character")
{
    const auto runs = InlineFormatter::format(QStringLiteral("a****b"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0) == plain(QStringLiteral("a****b")));
}

TEST_CASE("closing marker is the first one after the opening span")
{
    const auto runs = InlineFormatter::format(QStringLiteral("***a**"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0) == bold(QStringLiteral("*a")));
}

TEST_CASE("single asterisks are plain text")
{
    const auto runs = InlineFormatter::format(QStringLiteral("2 * 3 = *six*"));
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0).text == QStringLiteral("2 * 3 = *six*"));
    CHECK_FALSE(runs.at(0).bold);
}

TEST_CASE("empty content yields one empty plain run")
{
    const auto runs = InlineFormatter::format(QString());
    REQUIRE(runs.size() == 1);
    CHECK(runs.at(0).text.isEmpty());
    CHECK_FALSE(runs.at(0).bold);
}

TEST_CASE("run texts reconstruct the line without markers")
{
    const QString line = QStringLiteral("Use **QSaveFile** so **partial** writes vanish ** here");
    QString joined;
    for (const auto &run : InlineFormatter::format(line))
        joined += run.text;
    CHECK(joined == QStringLiteral("Use QSaveFile so partial writes vanish ** here"));
}

TEST_CASE("formatting plain output again never produces bold runs")
{
    QString flattened;
    for (const auto &run : InlineFormatter::format(QStringLiteral("The **cache** is **warm**")))
        flattened += run.text;

    for (const auto &run : InlineFormatter::format(flattened))
        CHECK_FALSE(run.bold);
}
