/*
 * delimiters.h — Post-render cleanup of block delimiters
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
#ifndef HTML2VIMDOC_DELIMITERS_H
#define HTML2VIMDOC_DELIMITERS_H

#include <QString>

#include "documentmodel.h"

namespace Delimiters {

// Collapse adjacent delimiters until no pair is redundant:
//   - a content delimiter (e.g. "\n>\n") beats a whitespace one
//   - otherwise the longer delimiter wins
//   - of two equally long whitespace delimiters one is kept
// Whitespace delimiters at either end of the sequence are dropped.
// Running it on its own output changes nothing.
void deduplicate(Doc::Fragments &fragments);

QString join(const Doc::Fragments &fragments);

} // namespace Delimiters

#endif // HTML2VIMDOC_DELIMITERS_H
