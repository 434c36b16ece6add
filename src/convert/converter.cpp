/*
 * converter.cpp — HTML → Vim help file conversion pipeline
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "converter.h"
#include "cssselector.h"
#include "delimiters.h"
#include "gumbodocument.h"
#include "logging.h"
#include "renderer.h"
#include "tagging.h"
#include "treebuilder.h"
#include "treepasses.h"

#include <QSet>
#include <QStringList>

namespace Convert {

// --- Source tree selection ---

QString selectTitle(const Source::MarkupNode &root, const QString &title)
{
    if (!title.isEmpty())
        return title;
    for (const QString &name : {QStringLiteral("title"), QStringLiteral("h1")}) {
        if (const Source::MarkupNode *element = Source::findFirstElement(root, name)) {
            const QString text = Source::textContent(*element).simplified();
            if (!text.isEmpty())
                return text;
        }
    }
    return QString();
}

static QSet<const Source::MarkupNode *> ignoredNodes(const Source::MarkupNode &root,
                                                     const QStringList &selectors)
{
    QSet<const Source::MarkupNode *> nodes;
    for (const QString &expr : selectors) {
        const Css::Result parsed = Css::parse(expr);
        if (!parsed.valid) {
            qCWarning(lcConvert) << "Ignoring invalid selector" << expr << ":"
                                 << parsed.errorMessage;
            continue;
        }
        const QList<const Source::MarkupNode *> matches = Css::select(root, parsed.selector);
        qCDebug(lcConvert) << "Selector" << expr << "ignores" << matches.size() << "elements";
        for (const Source::MarkupNode *node : matches)
            nodes.insert(node);
    }
    return nodes;
}

static const Source::MarkupNode &contentRoot(const Source::MarkupNode &root,
                                             const QString &selector)
{
    if (!selector.trimmed().isEmpty()) {
        const Css::Result parsed = Css::parse(selector);
        if (!parsed.valid) {
            qCWarning(lcConvert) << "Invalid content selector" << selector << ":"
                                 << parsed.errorMessage;
        } else {
            const QList<const Source::MarkupNode *> matches = Css::select(root, parsed.selector);
            if (!matches.isEmpty()) {
                qCDebug(lcConvert) << "Content selector" << selector << "matched";
                return *matches.first();
            }
        }
    }
    if (const Source::MarkupNode *body = Source::findFirstElement(root, QStringLiteral("body"))) {
        qCDebug(lcConvert) << "Falling back to document body";
        return *body;
    }
    qCDebug(lcConvert) << "Falling back to whole document";
    return root;
}

// --- Pipeline ---

Result convert(const Source::MarkupNode &root, const ConversionOptions &options)
{
    Result result;
    const QString title = selectTitle(root, options.title);

    TreeBuilder builder;
    builder.setIgnoredNodes(ignoredNodes(root, options.selectorsToIgnore));
    Doc::Document doc = builder.build(contentRoot(root, options.contentSelector));

    Passes::ReferenceOptions references;
    references.baseUrl = options.baseUrl;
    references.ignoredTargets = options.ignoredLinkTargets;
    references.externalDocPrefix = options.externalDocPrefix;

    doc = Passes::linkParents(std::move(doc));
    doc = Passes::shiftHeadings(std::move(doc));
    doc = Passes::extractReferences(std::move(doc), references);
    doc = Passes::tagHeadings(std::move(doc), Tags::prefixFromFilename(options.embeddedFilename));
    doc = Passes::generateTableOfContents(std::move(doc), options.shiftWidth);
    doc = Passes::pruneEmptyNodes(std::move(doc));
    qCDebug(lcConvert).noquote() << "Simplified tree:" << doc.dump(doc.root());

    Renderer renderer(doc, options.textWidth);
    Doc::Fragments fragments = renderer.render(doc.root(), 0);
    if (renderer.hasError()) {
        result.valid = false;
        result.errorMessage = renderer.errorMessage();
        return result;
    }

    Delimiters::deduplicate(fragments);
    result.text = assemble(fragments, options.embeddedFilename, title, options.modeline);
    return result;
}

Result convertHtml(const QString &html, const ConversionOptions &options)
{
    const Source::GumboDocument document(html);
    return convert(document.root(), options);
}

// --- Output ---

QString assemble(const Doc::Fragments &fragments, const QString &filename,
                 const QString &title, const QString &modeline)
{
    QString text = Delimiters::join(fragments);

    QStringList firstLine;
    if (!filename.isEmpty())
        firstLine << QLatin1Char('*') + filename + QLatin1Char('*');
    if (!title.isEmpty())
        firstLine << title;
    if (!firstLine.isEmpty())
        text = firstLine.join(QStringLiteral("  ")) + QStringLiteral("\n\n") + text;

    if (!modeline.trimmed().isEmpty())
        text += QStringLiteral("\n\n") + modeline;
    return text;
}

} // namespace Convert
