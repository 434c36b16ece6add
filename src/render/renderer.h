/*
 * renderer.h — Doc::Document → fixed-width help text fragments
 *
 * Recursive, indent-aware rendering. Block level nodes produce their own
 * lines surrounded by delimiter fragments; inline nodes produce raw text
 * that the nearest enclosing block compacts and wraps. The flat fragment
 * list still needs Delimiters::deduplicate() before it is joined.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_RENDERER_H
#define HTML2VIMDOC_RENDERER_H

#include <QList>
#include <QString>

#include "documentmodel.h"

class Renderer
{
public:
    explicit Renderer(const Doc::Document &doc, int textWidth = 79);

    Doc::Fragments render(Doc::NodeId id, int indent);

    // The first structural problem hit while rendering (e.g. a list
    // without list items). Output produced after an error is unreliable.
    bool hasError() const { return !m_errorMessage.isEmpty(); }
    QString errorMessage() const { return m_errorMessage; }

    int textWidth() const { return m_textWidth; }

private:
    // --- Block level ---
    Doc::Fragments renderBlock(Doc::NodeId id, int indent);
    Doc::Fragments renderBlocks(const QList<Doc::NodeId> &children, int indent);
    Doc::Fragments renderSmart(const QList<Doc::NodeId> &children, int indent);
    QString renderHeading(Doc::NodeId id, int indent);
    QString renderPreformatted(Doc::NodeId id, int indent);
    Doc::Fragments renderList(Doc::NodeId id, int indent);
    Doc::Fragments renderListItem(Doc::NodeId id, int number, int indent);
    QString renderTableOfContentsEntry(Doc::NodeId id);

    // --- Inline ---
    QString renderInline(const QList<Doc::NodeId> &children, int indent);
    QString inlineText(Doc::NodeId id);
    QString inlineText(const QList<Doc::NodeId> &children);
    QString hyperLinkText(Doc::NodeId id);
    QString imageText(Doc::NodeId id);
    QString codeText(Doc::NodeId id);

    bool holdsOnlyImage(Doc::NodeId id) const;
    void fail(const QString &message);

    const Doc::Document &m_doc;
    int m_textWidth;
    QString m_errorMessage;
};

#endif // HTML2VIMDOC_RENDERER_H
