/*
 * markdownconverter.cpp — Markdown → HTML via md4c, for Markdown input files
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownconverter.h"
#include "logging.h"

#include <QByteArray>
#include <QFileInfo>

#include <md4c-html.h>

namespace Markdown {

bool looksLikeMarkdown(const QString &path, const QString &text)
{
    if (text.startsWith(QLatin1Char('#')))
        return true;
    const QString suffix = QFileInfo(path).suffix().toLower();
    return suffix == QLatin1String("md")
        || suffix == QLatin1String("mkd")
        || suffix == QLatin1String("markdown");
}

static void appendOutput(const MD_CHAR *text, MD_SIZE size, void *userdata)
{
    static_cast<QByteArray *>(userdata)->append(text, static_cast<int>(size));
}

QString toHtml(const QString &markdown, bool *ok)
{
    const QByteArray utf8 = markdown.toUtf8();
    QByteArray html;
    const int result = md_html(utf8.constData(), static_cast<MD_SIZE>(utf8.size()),
                               &appendOutput, &html, MD_DIALECT_GITHUB, 0);
    if (ok)
        *ok = result == 0;
    if (result != 0) {
        qCWarning(lcConvert) << "md4c failed to parse Markdown input";
        return QString();
    }
    qCDebug(lcConvert) << "Converted" << utf8.size() << "bytes of Markdown to"
                       << html.size() << "bytes of HTML";
    return QString::fromUtf8(html);
}

} // namespace Markdown
