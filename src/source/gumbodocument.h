/*
 * gumbodocument.h — HTML5 parsing via gumbo, exposed as MarkupNode tree
 *
 * The gumbo tree is copied into MarkupNode objects once at parse time:
 * element names are normalized to lower case, attributes are captured
 * eagerly, comments are dropped and whitespace runs become text nodes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_GUMBODOCUMENT_H
#define HTML2VIMDOC_GUMBODOCUMENT_H

#include "markupnode.h"

#include <QHash>
#include <QString>

#include <memory>
#include <vector>

namespace Source {

class GumboDocument
{
public:
    explicit GumboDocument(const QString &html);
    ~GumboDocument();

    GumboDocument(const GumboDocument &) = delete;
    GumboDocument &operator=(const GumboDocument &) = delete;

    // The document node (name "#document"); its children include <html>.
    const MarkupNode &root() const { return *m_root; }

    // First element named `name` in document order, or nullptr.
    const MarkupNode *findFirst(const QString &name) const;

    int nodeCount() const { return static_cast<int>(m_nodes.size()); }

private:
    friend class GumboTreeCopier;

    std::vector<std::unique_ptr<MarkupNode>> m_nodes;
    const MarkupNode *m_root = nullptr;
};

// First element named `name` below (or at) `node`, in document order.
const MarkupNode *findFirstElement(const MarkupNode &node, const QString &name);

} // namespace Source

#endif // HTML2VIMDOC_GUMBODOCUMENT_H
