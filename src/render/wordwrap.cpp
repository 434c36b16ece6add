/*
 * wordwrap.cpp — Greedy word wrapping for fixed-width help text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "wordwrap.h"

#include <QRegularExpression>

namespace WordWrap {

int visibleLength(const QString &text)
{
    static const QRegularExpression tagReference(QStringLiteral("\\|[^|\\s]+\\|"));

    int concealed = 0;
    QRegularExpressionMatchIterator it = tagReference.globalMatch(text);
    while (it.hasNext()) {
        it.next();
        concealed += 2;
    }
    return text.size() - concealed;
}

bool hasTagMarker(const QString &word)
{
    static const QRegularExpression marker(QStringLiteral("[|*][^|*\\s]+[|*]"));
    return marker.match(word).hasMatch();
}

static bool endsSentence(const QString &line)
{
    if (line.isEmpty())
        return false;
    const QChar last = line.back();
    return last == QLatin1Char('.') || last == QLatin1Char('?') || last == QLatin1Char('!');
}

QStringList wrap(const QString &text, int width)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList words = text.split(whitespace, Qt::SkipEmptyParts);
    width = qMax(1, width);

    QStringList lines;
    QString line;
    for (QString word : words) {
        const bool breakable = !hasTagMarker(word);
        if (line.isEmpty()) {
            while (breakable && word.size() > width) {
                lines << word.left(width);
                word = word.mid(width);
            }
            line = word;
            continue;
        }

        const QString separator = endsSentence(line) && word.front().isUpper()
                                      ? QStringLiteral("  ")
                                      : QStringLiteral(" ");
        const int lineLen = visibleLength(line);
        const int wordLen = visibleLength(word);
        const int test = lineLen + separator.size() + wordLen;

        // Tag references are never split over two lines, within limits
        const bool fits = test <= width
                          || (hasTagMarker(word)
                              && wordLen >= width / 3.0
                              && lineLen < width / 0.8
                              && test < width * 1.2);
        if (fits) {
            line += separator + word;
            continue;
        }

        // Words longer than a line are broken, starting on the current one
        if (breakable && wordLen > width) {
            const int room = width - lineLen - separator.size();
            if (room > 0) {
                line += separator + word.left(room);
                word = word.mid(room);
            }
        }
        lines << line;
        while (breakable && word.size() > width) {
            lines << word.left(width);
            word = word.mid(width);
        }
        line = word;
    }
    if (!line.isEmpty())
        lines << line;
    return lines;
}

} // namespace WordWrap
