/*
 * logging.h — Logging categories for the conversion pipeline
 *
 * All categories default to warnings; enable more detail with e.g.
 *   QT_LOGGING_RULES="html2vimdoc.*.debug=true"
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_LOGGING_H
#define HTML2VIMDOC_LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcSource)
Q_DECLARE_LOGGING_CATEGORY(lcBuilder)
Q_DECLARE_LOGGING_CATEGORY(lcPasses)
Q_DECLARE_LOGGING_CATEGORY(lcRender)
Q_DECLARE_LOGGING_CATEGORY(lcConvert)

#endif // HTML2VIMDOC_LOGGING_H
