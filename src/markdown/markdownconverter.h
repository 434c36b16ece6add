/*
 * markdownconverter.h — Markdown → HTML via md4c, for Markdown input files
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_MARKDOWNCONVERTER_H
#define HTML2VIMDOC_MARKDOWNCONVERTER_H

#include <QString>

namespace Markdown {

// Input that starts with a heading marker, or comes from a file with a
// Markdown extension, is treated as Markdown.
bool looksLikeMarkdown(const QString &path, const QString &text);

// GitHub flavoured Markdown rendered to an HTML fragment. Returns an
// empty string and sets `ok` to false when md4c rejects the input.
QString toHtml(const QString &markdown, bool *ok = nullptr);

} // namespace Markdown

#endif // HTML2VIMDOC_MARKDOWNCONVERTER_H
