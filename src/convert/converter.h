/*
 * converter.h — HTML → Vim help file conversion pipeline
 *
 *   source tree → TreeBuilder → Passes (fixed order) → Renderer
 *     → Delimiters::deduplicate → assemble
 *
 * Every call works on its own document; nothing is shared between
 * conversions.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_CONVERTER_H
#define HTML2VIMDOC_CONVERTER_H

#include <QString>

#include "conversionoptions.h"
#include "documentmodel.h"
#include "markupnode.h"

namespace Convert {

struct Result {
    QString text;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

Result convert(const Source::MarkupNode &root, const ConversionOptions &options);

// Parses `html` with gumbo, then convert().
Result convertHtml(const QString &html, const ConversionOptions &options);

// `title` when given, else the compacted text of the first <title>,
// else of the first <h1>.
QString selectTitle(const Source::MarkupNode &root, const QString &title);

// Join the fragments and add the first line and the mode line.
QString assemble(const Doc::Fragments &fragments, const QString &filename,
                 const QString &title, const QString &modeline);

} // namespace Convert

#endif // HTML2VIMDOC_CONVERTER_H
