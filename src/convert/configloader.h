/*
 * configloader.h — Read ConversionOptions from an INI style file
 *
 *   [Conversion]
 *   EmbeddedFilename=plugin.txt
 *   SelectorsToIgnore=h3 a[class=anchor],#footer
 *   TextWidth=79
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_CONFIGLOADER_H
#define HTML2VIMDOC_CONFIGLOADER_H

#include <QString>

#include "conversionoptions.h"

namespace Config {

struct Result {
    ConversionOptions options;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

// Keys missing from the file keep the value from `defaults`.
Result load(const QString &path, const ConversionOptions &defaults = ConversionOptions());

} // namespace Config

#endif // HTML2VIMDOC_CONFIGLOADER_H
