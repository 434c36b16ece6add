/*
 * gumbodocument.cpp — HTML5 parsing via gumbo, exposed as MarkupNode tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "gumbodocument.h"
#include "logging.h"

#include <QByteArray>

#include <gumbo.h>

namespace Source {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput *o) const
    {
        if (o)
            gumbo_destroy_output(&kGumboDefaultOptions, o);
    }
};

class GumboMarkupNode : public MarkupNode
{
public:
    bool isText() const override { return m_isText; }
    QString text() const override { return m_text; }
    QString name() const override { return m_name; }
    bool hasAttribute(const QString &name) const override
    {
        return m_attributes.contains(name.toLower());
    }
    QString attribute(const QString &name) const override
    {
        return m_attributes.value(name.toLower());
    }
    const QList<const MarkupNode *> &children() const override { return m_children; }

    bool m_isText = false;
    QString m_text;
    QString m_name;
    QHash<QString, QString> m_attributes;
    QList<const MarkupNode *> m_children;
};

QString elementName(const GumboElement &element)
{
    if (element.tag != GUMBO_TAG_UNKNOWN)
        return QString::fromUtf8(gumbo_normalized_tagname(element.tag));

    // Unknown tags keep their source spelling; strip the angle brackets
    GumboStringPiece piece = element.original_tag;
    gumbo_tag_from_original_text(&piece);
    return QString::fromUtf8(piece.data, static_cast<int>(piece.length)).toLower();
}

} // anonymous namespace

class GumboTreeCopier
{
public:
    explicit GumboTreeCopier(GumboDocument &doc) : m_doc(doc) {}

    const MarkupNode *copy(const GumboNode *node)
    {
        auto wrapper = std::make_unique<GumboMarkupNode>();
        GumboMarkupNode *raw = wrapper.get();
        m_doc.m_nodes.push_back(std::move(wrapper));

        const GumboVector *children = nullptr;
        switch (node->type) {
        case GUMBO_NODE_DOCUMENT:
            raw->m_name = QStringLiteral("#document");
            children = &node->v.document.children;
            break;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            raw->m_name = elementName(node->v.element);
            const GumboVector &attrs = node->v.element.attributes;
            for (unsigned int i = 0; i < attrs.length; ++i) {
                const auto *attr = static_cast<const GumboAttribute *>(attrs.data[i]);
                raw->m_attributes.insert(QString::fromUtf8(attr->name).toLower(),
                                         QString::fromUtf8(attr->value));
            }
            children = &node->v.element.children;
            break;
        }
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            raw->m_isText = true;
            raw->m_text = QString::fromUtf8(node->v.text.text);
            break;
        case GUMBO_NODE_COMMENT:
            break;
        }

        if (children) {
            for (unsigned int i = 0; i < children->length; ++i) {
                const auto *child = static_cast<const GumboNode *>(children->data[i]);
                if (child->type == GUMBO_NODE_COMMENT)
                    continue;
                raw->m_children.append(copy(child));
            }
        }
        return raw;
    }

private:
    GumboDocument &m_doc;
};

GumboDocument::GumboDocument(const QString &html)
{
    const QByteArray utf8 = html.toUtf8();
    std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, utf8.constData(),
                                 static_cast<size_t>(utf8.size())));

    if (!output) {
        // gumbo only fails on allocation errors; keep an empty document
        qCWarning(lcSource) << "GumboDocument: parser returned no output";
        auto empty = std::make_unique<GumboMarkupNode>();
        empty->m_name = QStringLiteral("#document");
        m_root = empty.get();
        m_nodes.push_back(std::move(empty));
        return;
    }

    GumboTreeCopier copier(*this);
    m_root = copier.copy(output->document);
    qCDebug(lcSource) << "GumboDocument: parsed" << m_nodes.size() << "nodes";
}

GumboDocument::~GumboDocument() = default;

const MarkupNode *GumboDocument::findFirst(const QString &name) const
{
    return findFirstElement(*m_root, name);
}

const MarkupNode *findFirstElement(const MarkupNode &node, const QString &name)
{
    if (!node.isText() && node.name() == name)
        return &node;
    for (const MarkupNode *child : node.children()) {
        if (const MarkupNode *found = findFirstElement(*child, name))
            return found;
    }
    return nullptr;
}

} // namespace Source
