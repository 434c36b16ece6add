/*
 * tagging.h — Help tag creation
 *
 * Tags may only contain letters, digits and "_().:"; everything else is
 * folded into dashes. Tags are prefixed with a document namespace (the
 * help file name without ".txt" and version suffix).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_TAGGING_H
#define HTML2VIMDOC_TAGGING_H

#include <QString>

namespace Tags {

// "plugin-1.2.txt" -> "plugin"
QString prefixFromFilename(const QString &filename);

// Tag for source code text: case preserved, operators spelled out,
// argument lists collapsed to "()".
QString fromCode(const QString &code, const QString &prefix);

// Tag for English text: lower case, asides and filler words dropped.
QString fromText(const QString &text, const QString &prefix);

// Apply the prefix (unless already present) and sanitize.
QString finish(const QString &anchor, const QString &prefix);

} // namespace Tags

#endif // HTML2VIMDOC_TAGGING_H
