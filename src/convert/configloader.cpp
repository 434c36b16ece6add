/*
 * configloader.cpp — Read ConversionOptions from an INI style file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "configloader.h"
#include "logging.h"

#include <QFileInfo>

#include <KConfig>
#include <KConfigGroup>

namespace Config {

Result load(const QString &path, const ConversionOptions &defaults)
{
    Result result;
    result.options = defaults;

    const QFileInfo info(path);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        result.valid = false;
        result.errorMessage = QStringLiteral("Cannot read configuration file \"%1\"").arg(path);
        return result;
    }

    KConfig config(info.absoluteFilePath(), KConfig::SimpleConfig);
    KConfigGroup group(&config, QStringLiteral("Conversion"));
    if (!group.exists())
        qCDebug(lcConvert) << "No [Conversion] group in" << path;

    ConversionOptions &opts = result.options;
    opts.title            = group.readEntry("Title", defaults.title);
    opts.embeddedFilename = group.readEntry("EmbeddedFilename", defaults.embeddedFilename);
    opts.baseUrl          = group.readEntry("BaseURL", defaults.baseUrl);
    opts.contentSelector  = group.readEntry("ContentSelector", defaults.contentSelector);
    opts.selectorsToIgnore = group.readEntry("SelectorsToIgnore", defaults.selectorsToIgnore);
    opts.externalDocPrefix = group.readEntry("ExternalDocPrefix", defaults.externalDocPrefix);
    opts.modeline         = group.readEntry("Modeline", defaults.modeline);
    opts.textWidth        = group.readEntry("TextWidth", defaults.textWidth);

    if (group.hasKey("IgnoredLinkTargets")) {
        const QStringList targets = group.readEntry("IgnoredLinkTargets", QStringList());
        opts.ignoredLinkTargets = QSet<QString>(targets.cbegin(), targets.cend());
    }

    if (opts.textWidth < 20) {
        result.valid = false;
        result.errorMessage = QStringLiteral("TextWidth must be at least 20, got %1")
                                  .arg(opts.textWidth);
        return result;
    }

    qCDebug(lcConvert) << "Loaded conversion options from" << path;
    return result;
}

} // namespace Config
