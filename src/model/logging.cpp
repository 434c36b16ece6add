/*
 * logging.cpp — Logging categories for the conversion pipeline
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logging.h"

Q_LOGGING_CATEGORY(lcSource, "html2vimdoc.source", QtWarningMsg)
Q_LOGGING_CATEGORY(lcBuilder, "html2vimdoc.builder", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPasses, "html2vimdoc.passes", QtWarningMsg)
Q_LOGGING_CATEGORY(lcRender, "html2vimdoc.render", QtWarningMsg)
Q_LOGGING_CATEGORY(lcConvert, "html2vimdoc.convert", QtWarningMsg)
