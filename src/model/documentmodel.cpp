/*
 * documentmodel.cpp — Simplified document tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentmodel.h"

#include <QStringList>

#include <algorithm>
#include <type_traits>

namespace Doc {

bool Fragment::isWhitespace() const
{
    return !text.isEmpty() && text.trimmed().isEmpty();
}

bool isBlockLevel(const NodeData &data)
{
    return std::visit([](const auto &n) {
        using T = std::decay_t<decltype(n)>;
        return std::is_same_v<T, BlockSequence>
            || std::is_same_v<T, Heading>
            || std::is_same_v<T, Paragraph>
            || std::is_same_v<T, PreformattedText>
            || std::is_same_v<T, List>
            || std::is_same_v<T, ListItem>
            || std::is_same_v<T, Table>
            || std::is_same_v<T, Reference>
            || std::is_same_v<T, TableOfContentsEntry>;
    }, data);
}

Delimiters defaultDelimiters(const NodeData &data)
{
    static const QString blank = QStringLiteral("\n\n");
    static const QString newline = QStringLiteral("\n");

    if (std::holds_alternative<PreformattedText>(data))
        return {QStringLiteral("\n>\n"), QStringLiteral("\n<\n")};
    if (std::holds_alternative<Reference>(data)
        || std::holds_alternative<TableOfContentsEntry>(data))
        return {newline, newline};
    if (isBlockLevel(data))
        return {blank, blank};
    return {};
}

QString kindName(const NodeData &data)
{
    return std::visit([](const auto &n) -> QString {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, BlockSequence>)
            return QStringLiteral("BlockSequence");
        else if constexpr (std::is_same_v<T, Heading>)
            return QStringLiteral("Heading");
        else if constexpr (std::is_same_v<T, Paragraph>)
            return QStringLiteral("Paragraph");
        else if constexpr (std::is_same_v<T, PreformattedText>)
            return QStringLiteral("PreformattedText");
        else if constexpr (std::is_same_v<T, List>)
            return QStringLiteral("List");
        else if constexpr (std::is_same_v<T, ListItem>)
            return QStringLiteral("ListItem");
        else if constexpr (std::is_same_v<T, Table>)
            return QStringLiteral("Table");
        else if constexpr (std::is_same_v<T, Reference>)
            return QStringLiteral("Reference");
        else if constexpr (std::is_same_v<T, TableOfContentsEntry>)
            return QStringLiteral("TableOfContentsEntry");
        else if constexpr (std::is_same_v<T, InlineSequence>)
            return QStringLiteral("InlineSequence");
        else if constexpr (std::is_same_v<T, Text>)
            return QStringLiteral("Text");
        else if constexpr (std::is_same_v<T, HyperLink>)
            return QStringLiteral("HyperLink");
        else if constexpr (std::is_same_v<T, Image>)
            return QStringLiteral("Image");
        else if constexpr (std::is_same_v<T, CodeFragment>)
            return QStringLiteral("CodeFragment");
        else if constexpr (std::is_same_v<T, Emphasis>)
            return QStringLiteral("Emphasis");
        else
            return QStringLiteral("Strong");
    }, data);
}

// --- Document ---

NodeId Document::create(NodeData data, const QList<NodeId> &children)
{
    Node node;
    node.data = std::move(data);
    node.children = children;
    m_nodes.append(std::move(node));
    return m_nodes.size() - 1;
}

void Document::appendChild(NodeId parent, NodeId child)
{
    m_nodes[parent].children.append(child);
    if (m_parentsLinked)
        m_nodes[child].parent = parent;
}

void Document::insertChild(NodeId parent, int index, NodeId child)
{
    m_nodes[parent].children.insert(index, child);
    if (m_parentsLinked)
        m_nodes[child].parent = parent;
}

QList<NodeId> Document::walk(NodeId from) const
{
    QList<NodeId> ordered;
    if (!contains(from))
        return ordered;

    // Explicit stack, children pushed in reverse to keep reading order
    QList<NodeId> stack{from};
    while (!stack.isEmpty()) {
        NodeId id = stack.takeLast();
        ordered.append(id);
        const auto &children = m_nodes[id].children;
        for (int i = children.size() - 1; i >= 0; --i)
            stack.append(children[i]);
    }
    return ordered;
}

bool Document::containsBlock(NodeId id) const
{
    if (isBlockLevel(id))
        return true;
    const QList<NodeId> &children = m_nodes[id].children;
    return std::any_of(children.cbegin(), children.cend(),
                       [this](NodeId child) { return containsBlock(child); });
}

QString Document::dump(NodeId id) const
{
    const Node &n = node(id);
    QString head = kindName(n.data);

    QStringList fields;
    if (const auto *t = std::get_if<Text>(&n.data))
        fields << QStringLiteral("\"%1\"").arg(t->text);
    else if (const auto *h = std::get_if<Heading>(&n.data))
        fields << QStringLiteral("level=%1").arg(h->level)
               << QStringLiteral("tag=%1").arg(h->tag);
    else if (const auto *l = std::get_if<HyperLink>(&n.data))
        fields << QStringLiteral("target=%1").arg(l->target);
    else if (const auto *img = std::get_if<Image>(&n.data))
        fields << QStringLiteral("src=%1").arg(img->src)
               << QStringLiteral("alt=%1").arg(img->alt);
    else if (const auto *c = std::get_if<CodeFragment>(&n.data))
        fields << QStringLiteral("\"%1\"").arg(c->text);
    else if (const auto *r = std::get_if<Reference>(&n.data))
        fields << QStringLiteral("number=%1").arg(r->number)
               << QStringLiteral("target=%1").arg(r->target);
    else if (const auto *e = std::get_if<TableOfContentsEntry>(&n.data))
        fields << QStringLiteral("number=%1").arg(e->number)
               << QStringLiteral("text=%1").arg(e->text);

    for (NodeId child : n.children)
        fields << dump(child);

    return head + QLatin1Char('(') + fields.join(QStringLiteral(", ")) + QLatin1Char(')');
}

} // namespace Doc
