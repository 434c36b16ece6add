/*
 * wordwrap.h — Greedy word wrapping for fixed-width help text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
#ifndef HTML2VIMDOC_WORDWRAP_H
#define HTML2VIMDOC_WORDWRAP_H

#include <QString>
#include <QStringList>

namespace WordWrap {

// Width of a text as shown by Vim: the bars around |tag| references are
// concealed, so they don't count. Other bars do.
int visibleLength(const QString &text);

// True when the word carries a tag marker (|tag| or *tag*).
bool hasTagMarker(const QString &word);

// Pack the whitespace separated words of `text` onto lines of at most
// `width` visible characters. A word with a tag marker may overflow the
// line instead of being broken apart; any other word longer than `width`
// is split across lines.
QStringList wrap(const QString &text, int width);

} // namespace WordWrap

#endif // HTML2VIMDOC_WORDWRAP_H
