/*
 * delimiters.cpp — Post-render cleanup of block delimiters
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "delimiters.h"
#include "logging.h"

#include <algorithm>

namespace Delimiters {

// Index of the delimiter to drop from an adjacent pair, or -1 to keep both
static int redundantOf(const Doc::Fragments &fragments, int i)
{
    const Doc::Fragment &a = fragments[i];
    const Doc::Fragment &b = fragments[i + 1];
    if (!a.isDelimiter() || !b.isDelimiter())
        return -1;

    const bool aSpace = a.isWhitespace();
    const bool bSpace = b.isWhitespace();
    if (aSpace && !bSpace)
        return i;
    if (bSpace && !aSpace)
        return i + 1;
    if (a.text.size() < b.text.size())
        return i;
    if (a.text.size() > b.text.size())
        return i + 1;
    if (aSpace)
        return i;
    return -1;
}

void deduplicate(Doc::Fragments &fragments)
{
    const int before = fragments.size();

    // Empty literals would hide adjacent delimiters from each other
    fragments.erase(std::remove_if(fragments.begin(), fragments.end(),
                                   [](const Doc::Fragment &f) {
                                       return !f.isDelimiter() && f.text.isEmpty();
                                   }),
                    fragments.end());

    int i = 0;
    while (i < fragments.size() - 1) {
        const int redundant = redundantOf(fragments, i);
        if (redundant < 0) {
            ++i;
            continue;
        }
        fragments.removeAt(redundant);
        // The removal creates a new adjacent pair one step back
        i = qMax(0, i - 1);
    }

    while (!fragments.isEmpty() && fragments.first().isDelimiter()
           && fragments.first().isWhitespace())
        fragments.removeFirst();
    while (!fragments.isEmpty() && fragments.last().isDelimiter()
           && fragments.last().isWhitespace())
        fragments.removeLast();

    qCDebug(lcRender) << "Delimiter deduplication:" << before << "->" << fragments.size()
                      << "fragments";
}

QString join(const Doc::Fragments &fragments)
{
    QString text;
    for (const Doc::Fragment &fragment : fragments)
        text += fragment.text;
    return text;
}

} // namespace Delimiters
