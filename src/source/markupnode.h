/*
 * markupnode.h — Read-only view of a parsed markup tree
 *
 * The tree builder only sees markup through this interface, so any HTML
 * parser can feed the conversion pipeline.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_MARKUPNODE_H
#define HTML2VIMDOC_MARKUPNODE_H

#include <QList>
#include <QString>

namespace Source {

class MarkupNode
{
public:
    virtual ~MarkupNode() = default;

    virtual bool isText() const = 0;
    // Text content of a text node (entities already decoded)
    virtual QString text() const = 0;

    // Lower-case element name; empty for text nodes
    virtual QString name() const = 0;
    virtual bool hasAttribute(const QString &name) const = 0;
    // Attribute value, or an empty string when absent
    virtual QString attribute(const QString &name) const = 0;

    virtual const QList<const MarkupNode *> &children() const = 0;
};

// All descendant text concatenated verbatim, markup ignored.
QString textContent(const MarkupNode &node);

} // namespace Source

#endif // HTML2VIMDOC_MARKUPNODE_H
