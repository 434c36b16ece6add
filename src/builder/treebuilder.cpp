/*
 * treebuilder.cpp — MarkupNode tree → Doc::Document builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "treebuilder.h"
#include "logging.h"

#include <QStringList>

#include <algorithm>

TreeBuilder::TreeBuilder()
{
    // Element name → parse rule. Filled once; never modified afterwards.
    for (int level = 1; level <= 6; ++level)
        m_rules.insert(QStringLiteral("h%1").arg(level), &TreeBuilder::parseHeading);
    m_rules.insert(QStringLiteral("p"), &TreeBuilder::parseParagraph);
    m_rules.insert(QStringLiteral("pre"), &TreeBuilder::parsePreformatted);
    m_rules.insert(QStringLiteral("ul"), &TreeBuilder::parseList);
    m_rules.insert(QStringLiteral("ol"), &TreeBuilder::parseList);
    m_rules.insert(QStringLiteral("li"), &TreeBuilder::parseListItem);
    m_rules.insert(QStringLiteral("table"), &TreeBuilder::parseTable);
    m_rules.insert(QStringLiteral("a"), &TreeBuilder::parseHyperLink);
    m_rules.insert(QStringLiteral("img"), &TreeBuilder::parseImage);
    m_rules.insert(QStringLiteral("code"), &TreeBuilder::parseCode);
    m_rules.insert(QStringLiteral("tt"), &TreeBuilder::parseCode);
    m_rules.insert(QStringLiteral("em"), &TreeBuilder::parseEmphasis);
    m_rules.insert(QStringLiteral("i"), &TreeBuilder::parseEmphasis);
    m_rules.insert(QStringLiteral("strong"), &TreeBuilder::parseStrong);
    m_rules.insert(QStringLiteral("b"), &TreeBuilder::parseStrong);
    m_rules.insert(QStringLiteral("script"), &TreeBuilder::parseNonContent);
    m_rules.insert(QStringLiteral("style"), &TreeBuilder::parseNonContent);
}

// --- Build entry point ---

Doc::Document TreeBuilder::build(const Source::MarkupNode &root)
{
    m_doc = Doc::Document{};

    QList<Doc::NodeId> top;
    Doc::NodeId content = simplifyNode(root);
    if (content != Doc::kNoNode)
        top.append(content);
    m_doc.setRoot(m_doc.create(Doc::BlockSequence{}, top));

    qCDebug(lcBuilder) << "TreeBuilder: built" << m_doc.size() << "nodes";
    return std::move(m_doc);
}

// --- Simplification ---

Doc::NodeId TreeBuilder::simplifyNode(const Source::MarkupNode &node)
{
    // Text nodes are by far the most common, get them out of the way first
    if (node.isText())
        return m_doc.create(Doc::Text{node.text()});

    if (m_ignored.contains(&node)) {
        qCDebug(lcBuilder) << "Ignoring element" << node.name();
        return Doc::kNoNode;
    }

    const auto rule = m_rules.constFind(node.name());
    if (rule != m_rules.constEnd()) {
        Doc::NodeId id = (this->*rule.value())(node);
        if (id != Doc::kNoNode)
            qCDebug(lcBuilder).noquote() << "Mapping HTML element <" + node.name() + "> ->"
                                         << Doc::kindName(m_doc.node(id).data);
        return id;
    }

    // Improvise, trying not to lose information
    Doc::NodeId id = wrapSequence(simplifyChildren(node));
    qCDebug(lcBuilder).noquote() << "Not a supported element <" + node.name() + ">, improvising:"
                                 << Doc::kindName(m_doc.node(id).data);
    return id;
}

QList<Doc::NodeId> TreeBuilder::simplifyChildren(const Source::MarkupNode &node)
{
    QList<Doc::NodeId> children;
    for (const Source::MarkupNode *child : node.children()) {
        Doc::NodeId id = simplifyNode(*child);
        if (id != Doc::kNoNode)
            children.append(id);
    }
    return children;
}

Doc::NodeId TreeBuilder::wrapSequence(const QList<Doc::NodeId> &children)
{
    // Block content anywhere below is enough to make the whole sequence
    // block level, otherwise inline siblings would lose their layout.
    const bool block = std::any_of(children.cbegin(), children.cend(),
                                   [this](Doc::NodeId id) { return m_doc.containsBlock(id); });
    if (block)
        return m_doc.create(Doc::BlockSequence{}, children);
    return m_doc.create(Doc::InlineSequence{}, children);
}

// --- Parse rules ---

Doc::NodeId TreeBuilder::parseHeading(const Source::MarkupNode &node)
{
    Doc::Heading heading;
    heading.level = node.name().mid(1).toInt();
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(heading, children);
}

Doc::NodeId TreeBuilder::parseParagraph(const Source::MarkupNode &node)
{
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(Doc::Paragraph{}, children);
}

Doc::NodeId TreeBuilder::parsePreformatted(const Source::MarkupNode &node)
{
    // Inline markup inside <pre> is ignored, only the text is kept
    return m_doc.create(Doc::PreformattedText{dedent(Source::textContent(node))});
}

Doc::NodeId TreeBuilder::parseList(const Source::MarkupNode &node)
{
    Doc::List list;
    list.ordered = node.name() == QLatin1String("ol");
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(list, children);
}

Doc::NodeId TreeBuilder::parseListItem(const Source::MarkupNode &node)
{
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(Doc::ListItem{}, children);
}

Doc::NodeId TreeBuilder::parseTable(const Source::MarkupNode &)
{
    // Tables are not rendered; the node only marks where one was
    return m_doc.create(Doc::Table{});
}

Doc::NodeId TreeBuilder::parseHyperLink(const Source::MarkupNode &node)
{
    Doc::HyperLink link;
    link.target = node.attribute(QStringLiteral("href"));
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(link, children);
}

Doc::NodeId TreeBuilder::parseImage(const Source::MarkupNode &node)
{
    Doc::Image image;
    image.src = node.attribute(QStringLiteral("src"));
    image.alt = node.attribute(QStringLiteral("alt"));
    return m_doc.create(image);
}

Doc::NodeId TreeBuilder::parseCode(const Source::MarkupNode &node)
{
    return m_doc.create(Doc::CodeFragment{Source::textContent(node)});
}

Doc::NodeId TreeBuilder::parseEmphasis(const Source::MarkupNode &node)
{
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(Doc::Emphasis{}, children);
}

Doc::NodeId TreeBuilder::parseStrong(const Source::MarkupNode &node)
{
    const QList<Doc::NodeId> children = simplifyChildren(node);
    return m_doc.create(Doc::Strong{}, children);
}

Doc::NodeId TreeBuilder::parseNonContent(const Source::MarkupNode &node)
{
    qCDebug(lcBuilder) << "Skipping non-content element" << node.name();
    return Doc::kNoNode;
}

// --- Helpers ---

QString TreeBuilder::dedent(const QString &text)
{
    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    QStringList lines = normalized.split(QLatin1Char('\n'));

    // Longest whitespace prefix shared by all non-blank lines
    QString margin;
    bool first = true;
    for (const QString &line : lines) {
        if (line.trimmed().isEmpty())
            continue;
        int n = 0;
        while (n < line.size() && line[n].isSpace())
            ++n;
        const QString indent = line.left(n);
        if (first) {
            margin = indent;
            first = false;
            continue;
        }
        int common = 0;
        while (common < margin.size() && common < indent.size()
               && margin[common] == indent[common])
            ++common;
        margin.truncate(common);
    }

    for (QString &line : lines) {
        if (line.trimmed().isEmpty())
            line.clear();
        else
            line = line.mid(margin.size());
    }

    while (!lines.isEmpty() && lines.first().isEmpty())
        lines.removeFirst();
    while (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();

    return lines.join(QLatin1Char('\n'));
}
