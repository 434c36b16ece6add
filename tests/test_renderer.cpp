/*
 * test_renderer.cpp — Rendering document trees to help text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "delimiters.h"
#include "renderer.h"
#include "testsupport.h"
#include "treepasses.h"

// Test suite for rendering document trees to help text

namespace {

Passes::ReferenceOptions referenceOptions()
{
    Passes::ReferenceOptions options;
    options.externalDocPrefix = QStringLiteral("http://vimdoc.sourceforge.net/htmldoc/");
    return options;
}

QString renderDocument(const Doc::Document &doc, int width = 79)
{
    Renderer renderer(doc, width);
    Doc::Fragments fragments = renderer.render(doc.root(), 0);
    EXPECT_FALSE(renderer.hasError()) << renderer.errorMessage().toStdString();
    Delimiters::deduplicate(fragments);
    return Delimiters::join(fragments);
}

QString renderHtml(const QString &html, bool withReferences = false)
{
    Doc::Document doc = Passes::linkParents(buildFromHtml(html));
    if (withReferences)
        doc = Passes::extractReferences(std::move(doc), referenceOptions());
    return renderDocument(doc);
}

// A linked document whose root holds `nodes`
Doc::Document documentOf(Doc::Document doc, const QList<Doc::NodeId> &nodes)
{
    doc.setRoot(doc.create(Doc::BlockSequence{}, nodes));
    return Passes::linkParents(std::move(doc));
}

QString words(int count)
{
    QStringList list;
    for (int i = 0; i < count; ++i)
        list << QStringLiteral("word");
    return list.join(QLatin1Char(' '));
}

const QString kRule1 = QString(79, QLatin1Char('='));
const QString kRule2 = QString(79, QLatin1Char('-'));

} // namespace

// --- Inline content ---

TEST(RendererTest, ParagraphsAreCompactedAndSeparated) {
    EXPECT_EQ(renderHtml(QStringLiteral("<p>Hello   <b>big</b>\n<i>world</i></p><p>Next</p>")),
              QStringLiteral("Hello __big__ _world_\n\nNext"));
}

TEST(RendererTest, EmphasisKeepsSurroundingSpace) {
    EXPECT_EQ(renderHtml(QStringLiteral("<p>a<em> b </em>c<strong> </strong>d</p>")),
              QStringLiteral("a _b_ c d"));
}

TEST(RendererTest, CodeFragmentQuoting) {
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<p>Run <code>make</code>, <code>a`b</code> and <code> </code></p>")),
              QStringLiteral("Run `make`, 'a`b' and"));
}

TEST(RendererTest, HyperLinkWithReference) {
    const QString text = renderHtml(
        QStringLiteral("<p>See <a href='http://x.example/'>here</a>.</p>"), true);
    EXPECT_EQ(text, QStringLiteral("See here [1].\n\n") + kRule1
                        + QStringLiteral("\nReferences ~\n\n[1] http://x.example/"));
}

TEST(RendererTest, DocumentationLinks) {
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<p>Set <a href=\"http://vimdoc.sourceforge.net/htmldoc/options.html#'tabstop'\">"
                  "'tabstop'</a> and <a href=\"http://vimdoc.sourceforge.net/htmldoc/options.html#'sw'\">"
                  "shift width</a>.</p>"), true),
              QStringLiteral("Set |'tabstop'| and shift width (see |'sw'|)."));
}

TEST(RendererTest, Images) {
    EXPECT_EQ(renderHtml(QStringLiteral("<p><img src='http://x.example/logo.png' alt='Logo'></p>"),
                         true).section(QLatin1Char('\n'), 0, 0),
              QStringLiteral("  Image: Logo (see reference [1])"));
    EXPECT_EQ(renderHtml(QStringLiteral("<p>A <img src='a.png'> b</p>"), true),
              QStringLiteral("A Image: (unlabeled image) b"));
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<p><a href='http://x.example/'><img src='http://x.example/i.png' alt='Shot'></a></p>"),
                  true).section(QLatin1Char('\n'), 0, 0),
              QStringLiteral("  Image: Shot [1]"));
}

TEST(RendererTest, ImagesSurroundedByWhitespace) {
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<p>\n  <img src='http://x.example/logo.png' alt='Logo'>\n</p>"),
                  true).section(QLatin1Char('\n'), 0, 0),
              QStringLiteral("  Image: Logo (see reference [1])"));
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<p><a href='http://x.example/'>\n<img src='http://x.example/i.png' alt='Shot'>\n</a></p>"),
                  true).section(QLatin1Char('\n'), 0, 0),
              QStringLiteral("  Image: Shot [1]"));
}

TEST(RendererTest, BlocksInsideInlineMarkupKeepTheirLayout) {
    EXPECT_EQ(renderHtml(QStringLiteral(
                  "<div>Intro <a href='http://x.example/'><div><h3>T</h3></div></a></div>")),
              QStringLiteral("Intro\n\n") + kRule2 + QStringLiteral("\nT ~"));
}

// --- Headings ---

TEST(RendererTest, UntaggedHeadings) {
    EXPECT_EQ(renderHtml(QStringLiteral("<h1>Intro</h1>")), kRule1 + QStringLiteral("\nIntro ~"));
    EXPECT_EQ(renderHtml(QStringLiteral("<h2>Usage</h2>")), kRule2 + QStringLiteral("\nUsage ~"));
}

TEST(RendererTest, TagLineIsRightAligned) {
    Doc::Document doc;
    Doc::NodeId heading = doc.create(Doc::Heading{1, QStringLiteral("plug-intro")},
                                     {doc.create(Doc::Text{QStringLiteral("Intro")})});
    doc = documentOf(std::move(doc), {heading});

    const QStringList lines = renderDocument(doc).split(QLatin1Char('\n'));
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], kRule1);
    EXPECT_EQ(lines[1], QString(79 - 12, QLatin1Char(' ')) + QStringLiteral("*plug-intro*"));
    EXPECT_EQ(lines[1].size(), 79);
    EXPECT_EQ(lines[2], QStringLiteral("Intro ~"));
}

TEST(RendererTest, TagInsideHeadingText) {
    Doc::Document doc;
    Doc::NodeId code = doc.create(Doc::CodeFragment{QStringLiteral("g:plug_option")});
    Doc::NodeId heading = doc.create(Doc::Heading{2, QStringLiteral("g:plug_option")},
                                     {code, doc.create(Doc::Text{QStringLiteral(" option")})});
    doc = documentOf(std::move(doc), {heading});

    EXPECT_EQ(renderDocument(doc), kRule2 + QStringLiteral("\n*g:plug_option* option"));
}

TEST(RendererTest, LongHeadingsWrapBeforeMarker) {
    const QString text = renderHtml(QStringLiteral("<h2>") + words(20) + QStringLiteral("</h2>"));
    const QStringList lines = text.split(QLatin1Char('\n'));
    ASSERT_EQ(lines.size(), 3);
    for (int i = 1; i < lines.size(); ++i) {
        EXPECT_TRUE(lines[i].endsWith(QStringLiteral(" ~")));
        EXPECT_LE(lines[i].size(), 79);
    }
}

// --- Blocks ---

TEST(RendererTest, PreformattedText) {
    EXPECT_EQ(renderHtml(QStringLiteral("<pre>  a\n\n    b</pre>")),
              QStringLiteral("\n>\n  a\n\n    b\n<\n"));
}

TEST(RendererTest, ShortListItemsAreDense) {
    EXPECT_EQ(renderHtml(QStringLiteral("<ul><li>One</li><li>Two</li></ul>")),
              QStringLiteral("- One\n- Two"));
    EXPECT_EQ(renderHtml(QStringLiteral("<ol><li>One</li><li>Two</li></ol>")),
              QStringLiteral("1. One\n2. Two"));
}

TEST(RendererTest, LongListItemsAreSpaced) {
    // 15 words fill the first line (77 columns after the bullet)
    const QString item = QStringLiteral("- ") + words(15) + QStringLiteral("\n  ") + words(5);
    EXPECT_EQ(renderHtml(QStringLiteral("<ul><li>") + words(20) + QStringLiteral("</li><li>")
                         + words(20) + QStringLiteral("</li></ul>")),
              item + QStringLiteral("\n\n") + item);
}

TEST(RendererTest, NestedListsAreIndented) {
    EXPECT_EQ(renderHtml(QStringLiteral("<ul><li>One<ul><li>Sub</li></ul></li></ul>")),
              QStringLiteral("- One\n\n  - Sub"));
}

TEST(RendererTest, ListWithoutItemsIsAnError) {
    const Doc::Document doc = Passes::linkParents(
        buildFromHtml(QStringLiteral("<ul><div>x</div></ul>")));
    Renderer renderer(doc);
    renderer.render(doc.root(), 0);
    EXPECT_TRUE(renderer.hasError());
    EXPECT_EQ(renderer.errorMessage(), QStringLiteral("List without list items"));
}

TEST(RendererTest, TablesRenderNothing) {
    EXPECT_EQ(renderHtml(QStringLiteral("<p>A</p><table><tr><td>x</td></tr></table><p>B</p>")),
              QStringLiteral("A\n\nB"));
}

TEST(RendererTest, ReferencesAndTableOfContents) {
    Doc::Document doc;
    Doc::TableOfContentsEntry tagged;
    tagged.number = 1;
    tagged.text = QStringLiteral("Intro");
    tagged.indent = 2;
    tagged.tag = QStringLiteral("plug-intro");
    Doc::TableOfContentsEntry untagged;
    untagged.number = 2;
    untagged.text = QStringLiteral("Usage");
    untagged.indent = 2;

    const QList<Doc::NodeId> nodes = {
        doc.create(tagged),
        doc.create(untagged),
        doc.create(Doc::Reference{3, QStringLiteral("http://e.example/")}),
    };
    doc = documentOf(std::move(doc), nodes);

    const QStringList lines = renderDocument(doc).split(QLatin1Char('\n'));
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], QStringLiteral("  1. Intro") + QString(57, QLatin1Char(' '))
                            + QStringLiteral("|plug-intro|"));
    EXPECT_EQ(lines[0].size(), 79);
    EXPECT_EQ(lines[1], QStringLiteral("  2. Usage"));
    EXPECT_EQ(lines[2], QStringLiteral("[3] http://e.example/"));
}
