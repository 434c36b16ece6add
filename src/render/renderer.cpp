/*
 * renderer.cpp — Doc::Document → fixed-width help text fragments
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderer.h"
#include "logging.h"
#include "wordwrap.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <type_traits>

Renderer::Renderer(const Doc::Document &doc, int textWidth)
    : m_doc(doc)
    , m_textWidth(textWidth)
{
}

Doc::Fragments Renderer::render(Doc::NodeId id, int indent)
{
    if (m_doc.containsBlock(id))
        return renderBlock(id, indent);
    return {Doc::Fragment::literal(renderInline({id}, indent))};
}

// Whitespace text around the image doesn't count
bool Renderer::holdsOnlyImage(Doc::NodeId id) const
{
    if (m_doc.walk<Doc::Image>(id).size() != 1)
        return false;
    const QList<Doc::NodeId> &children = m_doc.node(id).children;
    const auto significant = std::count_if(children.cbegin(), children.cend(),
                                           [this](Doc::NodeId child) {
        const Doc::Text *text = m_doc.get<Doc::Text>(child);
        return !text || !text->text.trimmed().isEmpty();
    });
    return significant == 1;
}

void Renderer::fail(const QString &message)
{
    qCWarning(lcRender) << "Render error:" << message;
    if (m_errorMessage.isEmpty())
        m_errorMessage = message;
}

// --- Block level nodes ---

Doc::Fragments Renderer::renderBlock(Doc::NodeId id, int indent)
{
    const Doc::Node &node = m_doc.node(id);
    const Doc::Delimiters delimiters = Doc::defaultDelimiters(node.data);
    const Doc::Fragment start = Doc::Fragment::delimiter(delimiters.start);
    const Doc::Fragment end = Doc::Fragment::delimiter(delimiters.end);

    return std::visit([&](const auto &n) -> Doc::Fragments {
        using T = std::decay_t<decltype(n)>;
        Doc::Fragments out;

        if constexpr (std::is_same_v<T, Doc::BlockSequence>) {
            out << start << renderBlocks(node.children, indent) << end;
        } else if constexpr (std::is_same_v<T, Doc::Heading>) {
            out << start << Doc::Fragment::literal(renderHeading(id, indent)) << end;
        } else if constexpr (std::is_same_v<T, Doc::Paragraph>) {
            // A paragraph holding nothing but an image is indented
            int paragraphIndent = indent;
            if (holdsOnlyImage(id))
                paragraphIndent = qMax(2, indent);
            out << start << renderSmart(node.children, paragraphIndent) << end;
        } else if constexpr (std::is_same_v<T, Doc::PreformattedText>) {
            out << start << Doc::Fragment::literal(renderPreformatted(id, indent)) << end;
        } else if constexpr (std::is_same_v<T, Doc::List>) {
            out = renderList(id, indent);
        } else if constexpr (std::is_same_v<T, Doc::ListItem>) {
            // List items outside of a list
            out << start << renderListItem(id, 1, indent) << end;
        } else if constexpr (std::is_same_v<T, Doc::Table>) {
            qCDebug(lcRender) << "Skipping table";
        } else if constexpr (std::is_same_v<T, Doc::Reference>) {
            out << start
                << Doc::Fragment::literal(QStringLiteral("[%1] %2").arg(n.number).arg(n.target))
                << end;
        } else if constexpr (std::is_same_v<T, Doc::TableOfContentsEntry>) {
            out << start << Doc::Fragment::literal(renderTableOfContentsEntry(id)) << end;
        } else if (m_doc.containsBlock(id)) {
            // Inline markup wrapped around block content
            qCDebug(lcRender) << "Laying out blocks inside" << Doc::kindName(node.data);
            out << renderBlocks(node.children, indent);
        } else {
            out << Doc::Fragment::literal(renderInline({id}, indent));
        }
        return out;
    }, node.data);
}

Doc::Fragments Renderer::renderBlocks(const QList<Doc::NodeId> &children, int indent)
{
    Doc::Fragments out;
    QList<Doc::NodeId> inlineRun;

    // Consecutive inline children are compacted and wrapped together
    auto flushInline = [&]() {
        if (inlineRun.isEmpty())
            return;
        out << Doc::Fragment::literal(renderInline(inlineRun, indent));
        inlineRun.clear();
    };

    for (Doc::NodeId child : children) {
        if (m_doc.containsBlock(child)) {
            flushInline();
            out << renderBlock(child, indent);
        } else {
            inlineRun.append(child);
        }
    }
    flushInline();

    // Drop empty literals, they would keep delimiters apart
    out.erase(std::remove_if(out.begin(), out.end(),
                             [](const Doc::Fragment &f) {
                                 return !f.isDelimiter() && f.text.trimmed().isEmpty();
                             }),
              out.end());
    return out;
}

Doc::Fragments Renderer::renderSmart(const QList<Doc::NodeId> &children, int indent)
{
    const bool block = std::any_of(children.cbegin(), children.cend(),
                                   [this](Doc::NodeId id) { return m_doc.containsBlock(id); });
    if (block)
        return renderBlocks(children, indent);
    return {Doc::Fragment::literal(renderInline(children, indent))};
}

QString Renderer::renderHeading(Doc::NodeId id, int indent)
{
    const Doc::Heading *heading = m_doc.get<Doc::Heading>(id);
    const QChar marker = heading->level == 1 ? QLatin1Char('=') : QLatin1Char('-');
    const QString prefix(indent, QLatin1Char(' '));

    QStringList lines;
    lines << QString(m_textWidth, marker);

    QString text = inlineText(m_doc.node(id).children).simplified();
    const QString &tag = heading->tag;
    const int tagPos = tag.isEmpty() ? -1 : text.indexOf(tag);

    if (tagPos >= 0) {
        // The tag is part of the heading text: mark it there
        text.replace(tagPos, tag.size(), QLatin1Char('*') + tag + QLatin1Char('*'));
        const QStringList wrapped = WordWrap::wrap(text, m_textWidth - indent);
        for (const QString &line : wrapped)
            lines << prefix + line;
    } else {
        if (!tag.isEmpty()) {
            const QString anchor = QLatin1Char('*') + tag + QLatin1Char('*');
            lines << QString(qMax(0, m_textWidth - anchor.size()), QLatin1Char(' ')) + anchor;
        }
        const QString suffix = QStringLiteral(" ~");
        const QStringList wrapped = WordWrap::wrap(text, m_textWidth - indent - suffix.size());
        for (const QString &line : wrapped)
            lines << prefix + line + suffix;
    }
    return lines.join(QLatin1Char('\n'));
}

QString Renderer::renderPreformatted(Doc::NodeId id, int indent)
{
    const QString prefix(qMax(indent, 2), QLatin1Char(' '));
    QStringList lines = m_doc.get<Doc::PreformattedText>(id)->text.split(QLatin1Char('\n'));
    for (QString &line : lines) {
        if (!line.isEmpty())
            line.prepend(prefix);
    }
    return lines.join(QLatin1Char('\n'));
}

Doc::Fragments Renderer::renderList(Doc::NodeId id, int indent)
{
    const Doc::Node &node = m_doc.node(id);
    const Doc::Delimiters delimiters = Doc::defaultDelimiters(node.data);

    QList<Doc::Fragments> items;
    for (Doc::NodeId child : node.children) {
        if (m_doc.is<Doc::ListItem>(child))
            items << renderListItem(child, items.size() + 1, indent);
        else
            qCDebug(lcRender) << "Ignoring" << Doc::kindName(m_doc.node(child).data)
                              << "inside list";
    }
    if (items.isEmpty()) {
        fail(QStringLiteral("List without list items"));
        return {};
    }

    // Items spanning several lines are easier to read with blank lines between them
    int lineCount = 0;
    for (const Doc::Fragments &item : items) {
        QString text;
        for (const Doc::Fragment &fragment : item)
            text += fragment.text;
        const QStringList lines = text.split(QLatin1Char('\n'));
        for (const QString &line : lines) {
            if (!line.trimmed().isEmpty())
                ++lineCount;
        }
    }
    const double average = double(lineCount) / items.size();
    const Doc::Fragment separator = Doc::Fragment::delimiter(
        average > 1.5 ? QStringLiteral("\n\n") : QStringLiteral("\n"));

    Doc::Fragments out;
    out << Doc::Fragment::delimiter(delimiters.start);
    for (int i = 0; i < items.size(); ++i) {
        if (i > 0)
            out << separator;
        out << items[i];
    }
    out << Doc::Fragment::delimiter(delimiters.end);
    return out;
}

Doc::Fragments Renderer::renderListItem(Doc::NodeId id, int number, int indent)
{
    bool ordered = false;
    if (const Doc::List *list = m_doc.get<Doc::List>(m_doc.node(id).parent))
        ordered = list->ordered;

    QString prefix(indent, QLatin1Char(' '));
    prefix += ordered ? QStringLiteral("%1. ").arg(number) : QStringLiteral("- ");

    Doc::Fragments body = renderSmart(m_doc.node(id).children, prefix.size());

    // The bullet takes the place of the first line's indentation
    while (!body.isEmpty() && body.first().isDelimiter() && body.first().isWhitespace())
        body.removeFirst();
    if (!body.isEmpty() && !body.first().isDelimiter()) {
        QString &first = body.first().text;
        int n = 0;
        while (n < prefix.size() && n < first.size() && first[n].isSpace())
            ++n;
        first.remove(0, n);
    }

    // No delimiters of its own: the list picks one for all items
    Doc::Fragments out;
    out << Doc::Fragment::literal(prefix) << body;
    return out;
}

QString Renderer::renderTableOfContentsEntry(Doc::NodeId id)
{
    const Doc::TableOfContentsEntry *entry = m_doc.get<Doc::TableOfContentsEntry>(id);
    QString text = QString(entry->indent, QLatin1Char(' '))
                   + QStringLiteral("%1. ").arg(entry->number)
                   + entry->text;
    if (!entry->tag.isEmpty()) {
        const QString tag = QLatin1Char('|') + entry->tag + QLatin1Char('|');
        const int padding = qMax(1, m_textWidth - int(text.size()) - int(tag.size()));
        text += QString(padding, QLatin1Char(' ')) + tag;
    }
    return text;
}

// --- Inline nodes ---

QString Renderer::renderInline(const QList<Doc::NodeId> &children, int indent)
{
    const QString prefix(indent, QLatin1Char(' '));
    QStringList lines = WordWrap::wrap(inlineText(children).simplified(), m_textWidth - indent);
    for (QString &line : lines)
        line.prepend(prefix);
    return lines.join(QLatin1Char('\n'));
}

QString Renderer::inlineText(const QList<Doc::NodeId> &children)
{
    QString text;
    for (Doc::NodeId child : children)
        text += inlineText(child);
    return text;
}

QString Renderer::inlineText(Doc::NodeId id)
{
    const Doc::Node &node = m_doc.node(id);
    return std::visit([&](const auto &n) -> QString {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Doc::Text>) {
            return n.text;
        } else if constexpr (std::is_same_v<T, Doc::InlineSequence>) {
            return inlineText(node.children);
        } else if constexpr (std::is_same_v<T, Doc::HyperLink>) {
            return hyperLinkText(id);
        } else if constexpr (std::is_same_v<T, Doc::Image>) {
            return imageText(id);
        } else if constexpr (std::is_same_v<T, Doc::CodeFragment>) {
            return codeText(id);
        } else if constexpr (std::is_same_v<T, Doc::Emphasis>
                             || std::is_same_v<T, Doc::Strong>) {
            const QString marker = std::is_same_v<T, Doc::Strong> ? QStringLiteral("__")
                                                                  : QStringLiteral("_");
            const QString inner = inlineText(node.children);
            const QString trimmed = inner.trimmed();
            if (trimmed.isEmpty())
                return inner;
            // Keep surrounding whitespace outside of the markers
            const int lead = inner.indexOf(trimmed);
            return inner.left(lead) + marker + trimmed + marker
                   + inner.mid(lead + trimmed.size());
        } else {
            // Block level content in an inline context: keep its text
            QStringList parts;
            const Doc::Fragments fragments = renderBlock(id, 0);
            for (const Doc::Fragment &fragment : fragments) {
                if (!fragment.isDelimiter())
                    parts << fragment.text;
            }
            return QLatin1Char(' ') + parts.join(QLatin1Char(' ')) + QLatin1Char(' ');
        }
    }, node.data);
}

QString Renderer::hyperLinkText(Doc::NodeId id)
{
    const Doc::HyperLink *link = m_doc.get<Doc::HyperLink>(id);
    const Doc::Node &node = m_doc.node(id);

    QString text;
    if (holdsOnlyImage(id)) {
        const Doc::NodeId image = m_doc.walk<Doc::Image>(id).first();
        text = QStringLiteral("Image: ") + m_doc.get<Doc::Image>(image)->alt;
    } else {
        text = inlineText(node.children);
    }

    if (!link->docAnchor.isEmpty() && m_doc.ancestor<Doc::Heading>(id) == Doc::kNoNode) {
        const QString &anchor = link->docAnchor;
        const QString reference = QLatin1Char('|') + anchor + QLatin1Char('|');
        const int pos = text.indexOf(anchor);
        if (pos >= 0)
            text.replace(pos, anchor.size(), reference);
        else
            text += QStringLiteral(" (see %1)").arg(reference);
    } else if (const Doc::Reference *ref = m_doc.get<Doc::Reference>(link->reference)) {
        text += QStringLiteral(" [%1]").arg(ref->number);
    }
    return text;
}

QString Renderer::imageText(Doc::NodeId id)
{
    const Doc::Image *image = m_doc.get<Doc::Image>(id);
    QString text = QStringLiteral("Image: ")
                   + (image->alt.isEmpty() ? QStringLiteral("(unlabeled image)") : image->alt);
    if (const Doc::Reference *ref = m_doc.get<Doc::Reference>(image->reference))
        text += QStringLiteral(" (see reference [%1])").arg(ref->number);
    return text;
}

QString Renderer::codeText(Doc::NodeId id)
{
    static const QRegularExpression literalOnly(QStringLiteral("^[\\s`]*$"));

    const QString &text = m_doc.get<Doc::CodeFragment>(id)->text;
    if (m_doc.ancestor<Doc::Heading>(id) != Doc::kNoNode || literalOnly.match(text).hasMatch())
        return text;
    if (text.contains(QLatin1Char('`')))
        return QLatin1Char('\'') + text + QLatin1Char('\'');
    return QLatin1Char('`') + text + QLatin1Char('`');
}
