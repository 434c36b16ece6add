/*
 * treebuilder.h — MarkupNode tree → Doc::Document builder
 *
 * Maps known elements through a fixed table of parse rules; anything
 * else is simplified into a block or inline sequence so no text is lost.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_TREEBUILDER_H
#define HTML2VIMDOC_TREEBUILDER_H

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include "documentmodel.h"
#include "markupnode.h"

class TreeBuilder
{
public:
    TreeBuilder();

    // Build a document whose root is a BlockSequence wrapping `root`.
    Doc::Document build(const Source::MarkupNode &root);

    // Subtrees to leave out of the build (e.g. matched ignore selectors)
    void setIgnoredNodes(const QSet<const Source::MarkupNode *> &nodes) { m_ignored = nodes; }

    bool hasRule(const QString &elementName) const { return m_rules.contains(elementName); }

    // Remove common leading whitespace and surrounding blank lines.
    static QString dedent(const QString &text);

private:
    using ParseRule = Doc::NodeId (TreeBuilder::*)(const Source::MarkupNode &);

    Doc::NodeId simplifyNode(const Source::MarkupNode &node);
    QList<Doc::NodeId> simplifyChildren(const Source::MarkupNode &node);
    Doc::NodeId wrapSequence(const QList<Doc::NodeId> &children);

    // Parse rules
    Doc::NodeId parseHeading(const Source::MarkupNode &node);
    Doc::NodeId parseParagraph(const Source::MarkupNode &node);
    Doc::NodeId parsePreformatted(const Source::MarkupNode &node);
    Doc::NodeId parseList(const Source::MarkupNode &node);
    Doc::NodeId parseListItem(const Source::MarkupNode &node);
    Doc::NodeId parseTable(const Source::MarkupNode &node);
    Doc::NodeId parseHyperLink(const Source::MarkupNode &node);
    Doc::NodeId parseImage(const Source::MarkupNode &node);
    Doc::NodeId parseCode(const Source::MarkupNode &node);
    Doc::NodeId parseEmphasis(const Source::MarkupNode &node);
    Doc::NodeId parseStrong(const Source::MarkupNode &node);
    Doc::NodeId parseNonContent(const Source::MarkupNode &node);

    QHash<QString, ParseRule> m_rules;
    QSet<const Source::MarkupNode *> m_ignored;
    Doc::Document m_doc;
};

#endif // HTML2VIMDOC_TREEBUILDER_H
