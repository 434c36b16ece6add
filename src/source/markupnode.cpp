/*
 * markupnode.cpp — Read-only view of a parsed markup tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markupnode.h"

namespace Source {

QString textContent(const MarkupNode &node)
{
    if (node.isText())
        return node.text();

    QString result;
    for (const MarkupNode *child : node.children())
        result += textContent(*child);
    return result;
}

} // namespace Source
