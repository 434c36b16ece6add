/*
 * conversionoptions.h — Options struct for a single HTML → help conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_CONVERSIONOPTIONS_H
#define HTML2VIMDOC_CONVERSIONOPTIONS_H

#include <QSet>
#include <QString>
#include <QStringList>

struct ConversionOptions {
    // First line of the help file
    QString title;                      // empty = taken from <title> or <h1>
    QString embeddedFilename;           // e.g. "plugin.txt", also the tag prefix

    // Source tree selection
    QString contentSelector = QStringLiteral("#content");
    QStringList selectorsToIgnore;

    // References
    QString baseUrl;                    // resolves relative targets, empty = none
    QSet<QString> ignoredLinkTargets = {QStringLiteral("http://www.vim.org/")};
    QString externalDocPrefix = QStringLiteral("http://vimdoc.sourceforge.net/htmldoc/");

    // Output
    QString modeline = QStringLiteral("vim: ft=help");   // blank = no mode line
    int textWidth = 79;
    int shiftWidth = 2;                 // TOC indent per heading level
};

#endif // HTML2VIMDOC_CONVERSIONOPTIONS_H
