/*
 * test_cssselector.cpp — Selector parsing and matching
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "cssselector.h"
#include "gumbodocument.h"
#include "testsupport.h"

// Test suite for selector parsing and matching

TEST(CssSelectorTest, ParseId) {
    const Css::Result result = Css::parse(QStringLiteral("#content"));
    ASSERT_TRUE(result.valid) << result.errorMessage.toStdString();
    ASSERT_EQ(result.selector.chain.size(), 1);
    EXPECT_EQ(result.selector.chain.first().id, QStringLiteral("content"));
    EXPECT_TRUE(result.selector.chain.first().tag.isEmpty());
}

TEST(CssSelectorTest, ParseDescendantChainWithAttribute) {
    const Css::Result result = Css::parse(QStringLiteral("h3 a[class=anchor]"));
    ASSERT_TRUE(result.valid) << result.errorMessage.toStdString();
    ASSERT_EQ(result.selector.chain.size(), 2);
    EXPECT_EQ(result.selector.chain[0].tag, QStringLiteral("h3"));
    const Css::Compound &subject = result.selector.chain[1];
    EXPECT_EQ(subject.tag, QStringLiteral("a"));
    ASSERT_EQ(subject.attributes.size(), 1);
    EXPECT_EQ(subject.attributes.first().name, QStringLiteral("class"));
    EXPECT_EQ(subject.attributes.first().value, QStringLiteral("anchor"));
    EXPECT_TRUE(subject.attributes.first().hasValue);
}

TEST(CssSelectorTest, ParseCompound) {
    const Css::Result result = Css::parse(QStringLiteral("DIV.note.warning[data-x='a b'][hidden]"));
    ASSERT_TRUE(result.valid) << result.errorMessage.toStdString();
    const Css::Compound &c = result.selector.chain.first();
    EXPECT_EQ(c.tag, QStringLiteral("div"));
    EXPECT_EQ(c.classes, (QStringList{QStringLiteral("note"), QStringLiteral("warning")}));
    ASSERT_EQ(c.attributes.size(), 2);
    EXPECT_EQ(c.attributes[0].value, QStringLiteral("a b"));
    EXPECT_FALSE(c.attributes[1].hasValue);
}

TEST(CssSelectorTest, RejectsUnsupportedSyntax) {
    EXPECT_FALSE(Css::parse(QString()).valid);
    EXPECT_FALSE(Css::parse(QStringLiteral("   ")).valid);
    EXPECT_FALSE(Css::parse(QStringLiteral("div > p")).valid);
    EXPECT_FALSE(Css::parse(QStringLiteral("a:hover")).valid);
    EXPECT_FALSE(Css::parse(QStringLiteral("a[href")).valid);

    const Css::Result result = Css::parse(QStringLiteral("ul + p"));
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errorMessage.isEmpty());
}

TEST(CssSelectorTest, MatchesCompound) {
    FakeNode node(QStringLiteral("p"), {{QStringLiteral("class"), QStringLiteral("x  y")},
                                        {QStringLiteral("id"), QStringLiteral("main")}});
    EXPECT_TRUE(Css::matches(Css::parse(QStringLiteral("p.y")).selector.chain.first(), node));
    EXPECT_TRUE(Css::matches(Css::parse(QStringLiteral("*#main")).selector.chain.first(), node));
    EXPECT_FALSE(Css::matches(Css::parse(QStringLiteral("p.z")).selector.chain.first(), node));
    EXPECT_FALSE(Css::matches(Css::parse(QStringLiteral("div")).selector.chain.first(), node));
    EXPECT_FALSE(Css::matches(Css::parse(QStringLiteral("[id=other]")).selector.chain.first(), node));
}

TEST(CssSelectorTest, SelectInDocumentOrder) {
    const Source::GumboDocument doc(QStringLiteral(
        "<div id='content'><p class='x y'>one</p><div><p class='y'>two</p></div></div>"
        "<p class='y'>three</p>"));
    const QList<const Source::MarkupNode *> matches =
        Css::select(doc.root(), Css::parse(QStringLiteral("#content .y")).selector);
    ASSERT_EQ(matches.size(), 2);
    EXPECT_EQ(Source::textContent(*matches[0]), QStringLiteral("one"));
    EXPECT_EQ(Source::textContent(*matches[1]), QStringLiteral("two"));
}

TEST(CssSelectorTest, DescendantChainNeedsAncestor) {
    const Source::GumboDocument doc(QStringLiteral(
        "<h3><a class='anchor' href='#usage'>#</a>Usage</h3>"
        "<p><a class='anchor' href='#x'>x</a></p>"));
    const QList<const Source::MarkupNode *> matches =
        Css::select(doc.root(), Css::parse(QStringLiteral("h3 a[class=anchor]")).selector);
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches.first()->attribute(QStringLiteral("href")), QStringLiteral("#usage"));
}
