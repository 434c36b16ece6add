/*
 * cssselector.cpp — Minimal CSS selectors for locating and ignoring subtrees
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "cssselector.h"

#include <QRegularExpression>

namespace Css {

// Split on whitespace outside of [...] and quotes
static QStringList splitCompounds(const QString &expr, bool &ok)
{
    QStringList parts;
    QString current;
    int bracketDepth = 0;
    QChar quote;
    ok = true;

    for (const QChar c : expr) {
        if (!quote.isNull()) {
            current.append(c);
            if (c == quote)
                quote = QChar();
            continue;
        }
        if (c == QLatin1Char('"') || c == QLatin1Char('\'')) {
            quote = c;
            current.append(c);
        } else if (c == QLatin1Char('[')) {
            ++bracketDepth;
            current.append(c);
        } else if (c == QLatin1Char(']')) {
            --bracketDepth;
            current.append(c);
        } else if (c.isSpace() && bracketDepth == 0) {
            if (!current.isEmpty())
                parts << current;
            current.clear();
        } else {
            current.append(c);
        }
    }
    if (!current.isEmpty())
        parts << current;
    if (bracketDepth != 0 || !quote.isNull())
        ok = false;
    return parts;
}

static bool parseCompound(const QString &text, Compound &compound, QString &error)
{
    static const QRegularExpression tagRe(
        QStringLiteral(R"(^(\*|[A-Za-z][A-Za-z0-9_-]*))"));
    static const QRegularExpression idRe(
        QStringLiteral(R"(^#([A-Za-z0-9_-]+))"));
    static const QRegularExpression classRe(
        QStringLiteral(R"(^\.([A-Za-z0-9_-]+))"));
    static const QRegularExpression attrRe(
        QStringLiteral(R"(^\[\s*([A-Za-z0-9_:-]+)\s*(?:=\s*(?:"([^"]*)"|'([^']*)'|([^\]\s]*))\s*)?\])"));

    int pos = 0;
    auto m = tagRe.match(text);
    if (m.hasMatch()) {
        compound.tag = m.captured(1).toLower();
        pos = m.capturedLength(0);
    }

    while (pos < text.size()) {
        const QString rest = text.mid(pos);
        if ((m = idRe.match(rest)).hasMatch()) {
            compound.id = m.captured(1);
        } else if ((m = classRe.match(rest)).hasMatch()) {
            compound.classes << m.captured(1);
        } else if ((m = attrRe.match(rest)).hasMatch()) {
            AttributeTest test;
            test.name = m.captured(1).toLower();
            for (int group = 2; group <= 4; ++group) {
                if (m.capturedStart(group) >= 0) {
                    test.value = m.captured(group);
                    test.hasValue = true;
                    break;
                }
            }
            compound.attributes << test;
        } else {
            error = QStringLiteral("Unsupported selector syntax at \"%1\"").arg(rest);
            return false;
        }
        pos += m.capturedLength(0);
    }
    return true;
}

Result parse(const QString &expr)
{
    Result result;
    const QString trimmed = expr.trimmed();
    if (trimmed.isEmpty()) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Empty selector");
        return result;
    }

    bool ok = true;
    const QStringList parts = splitCompounds(trimmed, ok);
    if (!ok) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Unbalanced brackets or quotes in \"%1\"").arg(trimmed);
        return result;
    }

    for (const QString &part : parts) {
        if (part == QLatin1String(">") || part == QLatin1String("+")
            || part == QLatin1String("~")) {
            result.valid = false;
            result.errorMessage = QStringLiteral("Combinator \"%1\" is not supported").arg(part);
            return result;
        }
        Compound compound;
        QString error;
        if (!parseCompound(part, compound, error)) {
            result.valid = false;
            result.errorMessage = error;
            return result;
        }
        result.selector.chain << compound;
    }
    return result;
}

bool matches(const Compound &compound, const Source::MarkupNode &node)
{
    if (node.isText() || node.name().startsWith(QLatin1Char('#')))
        return false;
    if (!compound.tag.isEmpty() && compound.tag != QLatin1String("*")
        && compound.tag != node.name())
        return false;
    if (!compound.id.isEmpty() && node.attribute(QStringLiteral("id")) != compound.id)
        return false;
    if (!compound.classes.isEmpty()) {
        const QStringList classes = node.attribute(QStringLiteral("class"))
                                        .split(QRegularExpression(QStringLiteral("\\s+")),
                                               Qt::SkipEmptyParts);
        for (const QString &cls : compound.classes) {
            if (!classes.contains(cls))
                return false;
        }
    }
    for (const AttributeTest &test : compound.attributes) {
        if (!node.hasAttribute(test.name))
            return false;
        if (test.hasValue && node.attribute(test.name) != test.value)
            return false;
    }
    return true;
}

static bool matchesChain(const Selector &selector, const Source::MarkupNode &node,
                         const QList<const Source::MarkupNode *> &ancestors)
{
    const auto &chain = selector.chain;
    if (chain.isEmpty() || !matches(chain.last(), node))
        return false;

    // Descendant combinator only: match remaining compounds greedily
    // against the nearest qualifying ancestors.
    int a = ancestors.size() - 1;
    for (int i = chain.size() - 2; i >= 0; --i) {
        while (a >= 0 && !matches(chain[i], *ancestors[a]))
            --a;
        if (a < 0)
            return false;
        --a;
    }
    return true;
}

static void collect(const Source::MarkupNode &node, const Selector &selector,
                    QList<const Source::MarkupNode *> &ancestors,
                    QList<const Source::MarkupNode *> &out)
{
    if (node.isText())
        return;
    if (matchesChain(selector, node, ancestors))
        out.append(&node);

    ancestors.append(&node);
    for (const Source::MarkupNode *child : node.children())
        collect(*child, selector, ancestors, out);
    ancestors.removeLast();
}

QList<const Source::MarkupNode *> select(const Source::MarkupNode &root,
                                         const Selector &selector)
{
    QList<const Source::MarkupNode *> out;
    QList<const Source::MarkupNode *> ancestors;
    collect(root, selector, ancestors, out);
    return out;
}

} // namespace Css
