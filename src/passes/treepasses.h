/*
 * treepasses.h — Whole-document passes over a Doc::Document
 *
 * Each pass takes the document by value and returns it, so the pipeline
 * reads as a chain of calls in a fixed order:
 *
 *   linkParents → shiftHeadings → extractReferences → tagHeadings
 *     → generateTableOfContents → pruneEmptyNodes
 *
 * Tag assignment needs parent links and the final heading set; the table
 * of contents needs the final tags.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_TREEPASSES_H
#define HTML2VIMDOC_TREEPASSES_H

#include <QSet>
#include <QString>

#include "documentmodel.h"

namespace Passes {

struct ReferenceOptions {
    QString baseUrl;                // resolves relative targets; empty = none
    QSet<QString> ignoredTargets;   // e.g. a project home page
    QString externalDocPrefix;      // links below this become help tags
};

Doc::Document linkParents(Doc::Document doc);
Doc::Document shiftHeadings(Doc::Document doc);
Doc::Document extractReferences(Doc::Document doc, const ReferenceOptions &options);
Doc::Document tagHeadings(Doc::Document doc, const QString &prefix);
Doc::Document generateTableOfContents(Doc::Document doc, int shiftWidth);
Doc::Document pruneEmptyNodes(Doc::Document doc);

// Compacted text of a subtree without any markup (tags, TOC, titles).
QString plainText(const Doc::Document &doc, Doc::NodeId id);

// Type-specific emptiness; containers are empty when all children are.
bool isEmpty(const Doc::Document &doc, Doc::NodeId id);

// Help tag for a link into external documentation ("...#anchor"), or an
// empty string when the target has no usable fragment.
QString documentationAnchor(const QString &target);

} // namespace Passes

#endif // HTML2VIMDOC_TREEPASSES_H
