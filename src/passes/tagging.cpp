/*
 * tagging.cpp — Help tag creation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tagging.h"

#include <QRegularExpression>
#include <QStringList>

namespace Tags {

QString prefixFromFilename(const QString &filename)
{
    static const QRegularExpression suffixRe(
        QStringLiteral(R"(\.txt$)"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression versionRe(QStringLiteral(R"(-\d+(\.\d+)*$)"));

    QString prefix = filename.trimmed();
    prefix.remove(suffixRe);
    prefix.remove(versionRe);
    return prefix;
}

QString fromCode(const QString &code, const QString &prefix)
{
    static const QRegularExpression argumentsRe(QStringLiteral(R"(\s*\(.*?\))"));

    QString anchor = code;
    // Spell out operators so e.g. "a+b" and "a-b" stay distinct
    anchor.replace(QLatin1Char('+'), QLatin1String(" add "));
    anchor.replace(QLatin1Char('-'), QLatin1String(" sub "));
    anchor.replace(QLatin1Char('*'), QLatin1String(" mul "));
    anchor.replace(QLatin1Char('/'), QLatin1String(" div "));
    anchor.replace(argumentsRe, QStringLiteral("()"));
    return finish(anchor, prefix);
}

QString fromText(const QString &text, const QString &prefix)
{
    static const QRegularExpression asideRe(QStringLiteral(R"(\(.*?\))"));
    static const QRegularExpression apostropheRe(QStringLiteral(R"((\w)'(\w))"));
    static const QRegularExpression colonRe(QStringLiteral(R"(:\s+)"));
    static const QRegularExpression spaceRe(QStringLiteral(R"(\s+)"));
    static const QStringList fillerWords = {
        QStringLiteral("a"), QStringLiteral("the"),
        QStringLiteral("and"), QStringLiteral("some"),
    };

    QString anchor = text.toLower();
    anchor.remove(asideRe);
    anchor.replace(apostropheRe, QStringLiteral("\\1\\2"));
    anchor.replace(colonRe, QStringLiteral(" "));

    QStringList tokens;
    const QStringList words = anchor.split(spaceRe, Qt::SkipEmptyParts);
    for (const QString &word : words) {
        if (!fillerWords.contains(word))
            tokens << word;
    }
    return finish(tokens.join(QLatin1Char(' ')), prefix);
}

QString finish(const QString &anchor, const QString &prefix)
{
    static const QRegularExpression disallowedRe(QStringLiteral(R"([^A-Za-z0-9_().:]+)"));

    QString tag = anchor;
    if (!prefix.isEmpty() && !tag.contains(prefix, Qt::CaseInsensitive))
        tag = prefix + QLatin1Char('-') + tag;
    tag.replace(disallowedRe, QStringLiteral("-"));

    int start = 0;
    int end = tag.size();
    while (start < end && tag[start] == QLatin1Char('-'))
        ++start;
    while (end > start && tag[end - 1] == QLatin1Char('-'))
        --end;
    return tag.mid(start, end - start);
}

} // namespace Tags
