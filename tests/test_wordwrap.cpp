/*
 * test_wordwrap.cpp — Greedy word wrapping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "testsupport.h"
#include "wordwrap.h"

// Test suite for greedy word wrapping

namespace {

const QString kLorem = QStringLiteral(
    "Lorem ipsum dolor sit amet, consectetur adipiscing elit. Sed do eiusmod tempor "
    "incididunt ut labore et dolore magna aliqua. Ut enim ad minim veniam, quis nostrud "
    "exercitation ullamco laboris nisi ut aliquip ex ea commodo consequat. Duis aute "
    "irure dolor in reprehenderit in voluptate velit esse cillum dolore eu fugiat.");

} // namespace

TEST(WordWrapTest, ShortTextIsOneLine) {
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("  a   short\ttext \n"), 79),
              (QStringList{QStringLiteral("a short text")}));
    EXPECT_TRUE(WordWrap::wrap(QStringLiteral("   "), 79).isEmpty());
}

TEST(WordWrapTest, BreaksAtWidth) {
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("aaa bbb ccc"), 7),
              (QStringList{QStringLiteral("aaa bbb"), QStringLiteral("ccc")}));
}

TEST(WordWrapTest, NeverExceedsWidthWithoutTagMarkers) {
    for (int width = 10; width <= 79; ++width) {
        const QStringList lines = WordWrap::wrap(kLorem, width);
        for (const QString &line : lines)
            EXPECT_LE(WordWrap::visibleLength(line), width) << line.toStdString();

        // Narrow widths split long words, so compare without spaces
        QString joined = lines.join(QString());
        joined.remove(QLatin1Char(' '));
        QString expected = kLorem;
        expected.remove(QLatin1Char(' '));
        EXPECT_EQ(joined, expected);
    }
}

TEST(WordWrapTest, DoubleSpaceBetweenSentences) {
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("It ends. Next one? Yes! ok. e.g. this"), 79),
              (QStringList{QStringLiteral("It ends.  Next one?  Yes! ok. e.g. this")}));
}

TEST(WordWrapTest, OverlongWordIsSplit) {
    // The current line is filled first
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("see abcdefghijklmnopqrstuv"), 20),
              (QStringList{QStringLiteral("see abcdefghijklmnop"), QStringLiteral("qrstuv")}));

    const QString word(45, QLatin1Char('x'));
    EXPECT_EQ(WordWrap::wrap(word + QStringLiteral(" end"), 20),
              (QStringList{QString(20, QLatin1Char('x')), QString(20, QLatin1Char('x')),
                           QStringLiteral("xxxxx end")}));
}

TEST(WordWrapTest, TagReferenceMayOverflow) {
    // 3 + 1 + 18 visible characters: over 20, but within the tag allowance
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("see |some-long-tag-name|"), 20),
              (QStringList{QStringLiteral("see |some-long-tag-name|")}));
    // Too far over the width even for a tag
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("see also |a-much-longer-tag-name|"), 20).size(), 2);
}

TEST(WordWrapTest, BarsDoNotCount) {
    EXPECT_EQ(WordWrap::visibleLength(QStringLiteral("|tag|")), 3);
    EXPECT_EQ(WordWrap::wrap(QStringLiteral("ab |cdef|"), 8),
              (QStringList{QStringLiteral("ab |cdef|")}));
    EXPECT_TRUE(WordWrap::hasTagMarker(QStringLiteral("*tag*")));
    EXPECT_FALSE(WordWrap::hasTagMarker(QStringLiteral("tag")));
}

TEST(WordWrapTest, BarePipesCount) {
    EXPECT_EQ(WordWrap::visibleLength(QStringLiteral("a | b")), 5);
    EXPECT_EQ(WordWrap::visibleLength(QStringLiteral("|tag| x |")), 7);
    EXPECT_FALSE(WordWrap::hasTagMarker(QStringLiteral("|")));

    const QStringList lines = WordWrap::wrap(QStringLiteral("a | b | c"), 7);
    EXPECT_EQ(lines, (QStringList{QStringLiteral("a | b |"), QStringLiteral("c")}));
    for (const QString &line : lines)
        EXPECT_LE(line.size(), 7);
}
