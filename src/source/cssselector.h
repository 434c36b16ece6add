/*
 * cssselector.h — Minimal CSS selectors for locating and ignoring subtrees
 *
 * Supported: descendant chains of compound selectors made of a tag name
 * or "*", "#id", ".class" and "[attr]" / "[attr=value]", e.g.
 *   "#content", "div.sidebar", "h3 a[class=anchor]"
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_CSSSELECTOR_H
#define HTML2VIMDOC_CSSSELECTOR_H

#include "markupnode.h"

#include <QList>
#include <QString>
#include <QStringList>

namespace Css {

struct AttributeTest {
    QString name;
    QString value;
    bool hasValue = false;
};

struct Compound {
    QString tag;            // empty or "*" = any element
    QString id;
    QStringList classes;
    QList<AttributeTest> attributes;
};

struct Selector {
    QList<Compound> chain;  // ancestor ... subject
};

struct Result {
    Selector selector;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

Result parse(const QString &expr);

bool matches(const Compound &compound, const Source::MarkupNode &node);

// Elements below (or at) root matching the selector, in document order.
QList<const Source::MarkupNode *> select(const Source::MarkupNode &root,
                                         const Selector &selector);

} // namespace Css

#endif // HTML2VIMDOC_CSSSELECTOR_H
