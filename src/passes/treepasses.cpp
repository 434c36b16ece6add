/*
 * treepasses.cpp — Whole-document passes over a Doc::Document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "treepasses.h"
#include "logging.h"
#include "tagging.h"

#include <QHash>
#include <QList>
#include <QUrl>

#include <algorithm>
#include <type_traits>

namespace Passes {

// --- Helpers ---

static void collectText(const Doc::Document &doc, Doc::NodeId id, QString &out)
{
    const Doc::Node &node = doc.node(id);
    std::visit([&](const auto &n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Doc::Text>) {
            out += n.text;
        } else if constexpr (std::is_same_v<T, Doc::CodeFragment>) {
            out += n.text;
        } else if constexpr (std::is_same_v<T, Doc::Image>) {
            out += n.alt;
        } else if constexpr (std::is_same_v<T, Doc::PreformattedText>) {
            out += n.text;
        } else if constexpr (std::is_same_v<T, Doc::Reference>) {
            out += n.target;
        } else if constexpr (std::is_same_v<T, Doc::TableOfContentsEntry>) {
            out += n.text;
        } else {
            const bool block = Doc::isBlockLevel(node.data);
            for (Doc::NodeId child : node.children) {
                collectText(doc, child, out);
                if (block)
                    out += QLatin1Char(' ');
            }
        }
    }, node.data);
}

QString plainText(const Doc::Document &doc, Doc::NodeId id)
{
    QString text;
    collectText(doc, id, text);
    return text.simplified();
}

bool isEmpty(const Doc::Document &doc, Doc::NodeId id)
{
    const Doc::Node &node = doc.node(id);
    return std::visit([&](const auto &n) -> bool {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Doc::Text>) {
            return n.text.trimmed().isEmpty();
        } else if constexpr (std::is_same_v<T, Doc::Image>) {
            return n.src.isEmpty() && n.alt.isEmpty();
        } else if constexpr (std::is_same_v<T, Doc::CodeFragment>) {
            return n.text.isEmpty();
        } else if constexpr (std::is_same_v<T, Doc::PreformattedText>) {
            return n.text.trimmed().isEmpty();
        } else if constexpr (std::is_same_v<T, Doc::Reference>
                             || std::is_same_v<T, Doc::TableOfContentsEntry>) {
            return false;
        } else if constexpr (std::is_same_v<T, Doc::Table>) {
            return true;    // tables render nothing
        } else {
            return std::all_of(node.children.cbegin(), node.children.cend(),
                               [&](Doc::NodeId child) { return isEmpty(doc, child); });
        }
    }, node.data);
}

QString documentationAnchor(const QString &target)
{
    const QUrl url(target);
    if (!url.isValid() || !url.hasFragment())
        return QString();
    return url.fragment(QUrl::FullyDecoded).trimmed();
}

static Doc::NodeId appendHeading(Doc::Document &doc, Doc::NodeId parent, int index,
                                 const QString &title)
{
    Doc::NodeId heading = doc.create(Doc::Heading{1, QString()});
    doc.appendChild(heading, doc.create(Doc::Text{title}));
    if (index < 0)
        doc.appendChild(parent, heading);
    else
        doc.insertChild(parent, index, heading);
    return heading;
}

// --- Parent linking ---

static void linkChildren(Doc::Document &doc, Doc::NodeId id)
{
    const QList<Doc::NodeId> children = doc.node(id).children;
    for (Doc::NodeId child : children) {
        doc.node(child).parent = id;
        linkChildren(doc, child);
    }
}

Doc::Document linkParents(Doc::Document doc)
{
    if (doc.parentsLinked()) {
        qCDebug(lcPasses) << "Parent links already established";
        return doc;
    }
    doc.node(doc.root()).parent = Doc::kNoNode;
    linkChildren(doc, doc.root());
    doc.setParentsLinked(true);
    return doc;
}

// --- Heading levels ---

Doc::Document shiftHeadings(Doc::Document doc)
{
    const QList<Doc::NodeId> headings = doc.walk<Doc::Heading>(doc.root());
    if (headings.isEmpty()) {
        qCDebug(lcPasses) << "Document doesn't contain any headings";
        return doc;
    }

    int minLevel = doc.get<Doc::Heading>(headings.first())->level;
    for (Doc::NodeId id : headings)
        minLevel = qMin(minLevel, doc.get<Doc::Heading>(id)->level);
    qCDebug(lcPasses) << "Largest headings have level" << minLevel;

    if (minLevel > 1) {
        const int toSubtract = minLevel - 1;
        qCDebug(lcPasses) << "Shifting headings by" << toSubtract << "levels";
        for (Doc::NodeId id : headings)
            doc.get<Doc::Heading>(id)->level -= toSubtract;
    }
    return doc;
}

// --- References ---

Doc::Document extractReferences(Doc::Document doc, const ReferenceOptions &options)
{
    if (!doc.parentsLinked())
        doc = linkParents(std::move(doc));

    const QUrl baseUrl(options.baseUrl);
    QHash<QString, Doc::NodeId> byTarget;
    QList<Doc::NodeId> references;

    qCDebug(lcPasses) << "Scanning document for hyper links and images";
    const QList<Doc::NodeId> ordered = doc.walk(doc.root());
    for (Doc::NodeId id : ordered) {
        QString target;
        const bool isLink = doc.is<Doc::HyperLink>(id);
        if (isLink)
            target = doc.get<Doc::HyperLink>(id)->target;
        else if (const auto *image = doc.get<Doc::Image>(id))
            target = image->src;
        else
            continue;

        target = target.trimmed();
        if (target.isEmpty() || target.startsWith(QLatin1Char('#')))
            continue;
        if (options.ignoredTargets.contains(target))
            continue;

        if (isLink && !options.externalDocPrefix.isEmpty()
            && target.startsWith(options.externalDocPrefix)) {
            const QString anchor = documentationAnchor(target);
            if (!anchor.isEmpty()) {
                doc.get<Doc::HyperLink>(id)->docAnchor = anchor;
                continue;
            }
            qCWarning(lcPasses) << "No help tag in documentation link, numbering it instead:"
                                << target;
        }

        QString normalized = QUrl::fromPercentEncoding(target.toUtf8());
        QUrl url(normalized);
        if (url.isValid() && url.isRelative() && baseUrl.isValid() && !baseUrl.isEmpty()) {
            url = baseUrl.resolved(url);
            normalized = url.toString();
        }
        // Relative and unparsable targets can't be followed from a help file
        if (!url.isValid() || url.isRelative())
            continue;
        if (options.ignoredTargets.contains(normalized))
            continue;

        // Literal URLs already show their target
        if (isLink) {
            const QString text = plainText(doc, id);
            if (text == target || text == normalized)
                continue;
        }

        Doc::NodeId reference = byTarget.value(normalized, Doc::kNoNode);
        if (reference == Doc::kNoNode) {
            const int number = references.size() + 1;
            qCDebug(lcPasses) << "Extracting reference" << number << "to" << normalized;
            reference = doc.create(Doc::Reference{number, normalized});
            references.append(reference);
            byTarget.insert(normalized, reference);
        }

        if (auto *link = doc.get<Doc::HyperLink>(id))
            link->reference = reference;
        else if (auto *image = doc.get<Doc::Image>(id))
            image->reference = reference;
    }

    qCDebug(lcPasses) << "Found" << references.size() << "references";
    if (!references.isEmpty()) {
        appendHeading(doc, doc.root(), -1, QStringLiteral("References"));
        for (Doc::NodeId reference : references)
            doc.appendChild(doc.root(), reference);
    }
    return doc;
}

// --- Tags ---

Doc::Document tagHeadings(Doc::Document doc, const QString &prefix)
{
    if (!doc.parentsLinked())
        doc = linkParents(std::move(doc));

    QSet<QString> used;
    qCDebug(lcPasses) << "Tagging headings using prefix" << prefix;

    const QList<Doc::NodeId> headings = doc.walk<Doc::Heading>(doc.root());
    for (Doc::NodeId id : headings) {
        // Pruned before rendering, a tag would point nowhere
        if (isEmpty(doc, id))
            continue;
        QString tag;

        // Source code entities make the best tags
        const QList<Doc::NodeId> fragments = doc.walk<Doc::CodeFragment>(id);
        for (Doc::NodeId fragment : fragments) {
            const QString candidate = Tags::fromCode(doc.get<Doc::CodeFragment>(fragment)->text, prefix);
            if (!candidate.isEmpty() && !used.contains(candidate)) {
                tag = candidate;
                break;
            }
        }

        if (tag.isEmpty()) {
            const QString text = plainText(doc, id);
            const QString candidate = Tags::fromText(text, prefix);
            if (candidate.isEmpty())
                continue;
            if (used.contains(candidate)) {
                qCInfo(lcPasses) << "Tag" << candidate << "already in use, leaving heading"
                                 << text << "untagged";
                continue;
            }
            tag = candidate;
        }

        qCDebug(lcPasses) << "Found suitable tag:" << tag;
        doc.get<Doc::Heading>(id)->tag = tag;
        used.insert(tag);
    }
    return doc;
}

// --- Table of contents ---

Doc::Document generateTableOfContents(Doc::Document doc, int shiftWidth)
{
    if (!doc.parentsLinked())
        doc = linkParents(std::move(doc));

    QList<Doc::NodeId> headings = doc.walk<Doc::Heading>(doc.root());
    headings.erase(std::remove_if(headings.begin(), headings.end(),
                                  [&doc](Doc::NodeId id) { return isEmpty(doc, id); }),
                   headings.end());
    if (headings.isEmpty())
        return doc;

    QList<int> counters;
    QList<Doc::TableOfContentsEntry> entries;
    for (Doc::NodeId id : headings) {
        const Doc::Heading *heading = doc.get<Doc::Heading>(id);
        const int level = qMax(1, heading->level);

        // Forget counters of deeper levels, start fresh levels at 1
        counters = counters.mid(0, level);
        while (counters.size() < level)
            counters.append(1);

        Doc::TableOfContentsEntry entry;
        entry.number = counters[level - 1];
        entry.text = plainText(doc, id);
        entry.indent = shiftWidth * level;
        entry.tag = heading->tag;
        entries.append(entry);

        ++counters[level - 1];
    }
    qCDebug(lcPasses) << "Table of contents has" << entries.size() << "entries";

    Doc::NodeId sequence = doc.create(Doc::BlockSequence{});
    for (const auto &entry : entries)
        doc.appendChild(sequence, doc.create(entry));

    appendHeading(doc, doc.root(), 0, QStringLiteral("Contents"));
    doc.insertChild(doc.root(), 1, sequence);
    return doc;
}

// --- Pruning ---

static void pruneChildren(Doc::Document &doc, Doc::NodeId id)
{
    const QList<Doc::NodeId> children = doc.node(id).children;
    QList<Doc::NodeId> kept;
    for (Doc::NodeId child : children) {
        pruneChildren(doc, child);
        // Whitespace text stays: it separates inline siblings. It goes
        // away together with its parent when that turns out empty.
        if (doc.is<Doc::Text>(child) || !isEmpty(doc, child))
            kept.append(child);
    }
    doc.node(id).children = kept;
}

Doc::Document pruneEmptyNodes(Doc::Document doc)
{
    pruneChildren(doc, doc.root());
    return doc;
}

} // namespace Passes
