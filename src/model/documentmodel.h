/*
 * documentmodel.h — Simplified document tree (std::variant nodes in an arena)
 *
 * Intermediate representation between the parsed markup tree and the
 * help file renderer. Nodes live in a flat arena owned by Document and
 * refer to their children and parent by index, so there are no owning
 * cycles. Tree passes fill in the mutable fields (heading tags, assigned
 * references) after construction.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef HTML2VIMDOC_DOCUMENTMODEL_H
#define HTML2VIMDOC_DOCUMENTMODEL_H

#include <QList>
#include <QString>

#include <variant>

namespace Doc {

using NodeId = int;
constexpr NodeId kNoNode = -1;

// --- Block nodes ---

struct BlockSequence {};

struct Heading {
    int level = 1;
    QString tag;            // empty = untagged
};

struct Paragraph {};

struct PreformattedText {
    QString text;           // dedented, no leading/trailing blank lines
};

struct List {
    bool ordered = false;
};

struct ListItem {};

struct Table {};

// Synthesized by the reference extraction pass
struct Reference {
    int number = 0;
    QString target;
};

// Synthesized by the table of contents pass
struct TableOfContentsEntry {
    int number = 0;
    QString text;
    int indent = 0;         // in spaces
    QString tag;            // empty = heading was not tagged
};

// --- Inline nodes ---

struct InlineSequence {};

struct Text {
    QString text;
};

struct HyperLink {
    QString target;
    NodeId reference = kNoNode;  // Reference node, set by extractReferences()
    QString docAnchor;           // help tag for links into external documentation
};

struct Image {
    QString src;
    QString alt;
    NodeId reference = kNoNode;
};

struct CodeFragment {
    QString text;
};

struct Emphasis {};
struct Strong {};

using NodeData = std::variant<
    BlockSequence,
    Heading,
    Paragraph,
    PreformattedText,
    List,
    ListItem,
    Table,
    Reference,
    TableOfContentsEntry,
    InlineSequence,
    Text,
    HyperLink,
    Image,
    CodeFragment,
    Emphasis,
    Strong
>;

struct Node {
    NodeData data;
    QList<NodeId> children;     // document order
    NodeId parent = kNoNode;    // set by Passes::linkParents()
};

// --- Rendering delimiters ---

struct Delimiters {
    QString start;
    QString end;
};

// One piece of rendered output: literal text or a block delimiter.
struct Fragment {
    enum Kind { Literal, Delimiter };
    Kind kind = Literal;
    QString text;

    static Fragment literal(const QString &text) { return {Literal, text}; }
    static Fragment delimiter(const QString &text) { return {Delimiter, text}; }

    bool isDelimiter() const { return kind == Delimiter; }
    bool isWhitespace() const;
};

using Fragments = QList<Fragment>;

bool isBlockLevel(const NodeData &data);
Delimiters defaultDelimiters(const NodeData &data);
QString kindName(const NodeData &data);

// --- Document ---

class Document
{
public:
    NodeId create(NodeData data, const QList<NodeId> &children = {});

    Node &node(NodeId id) { return m_nodes[id]; }
    const Node &node(NodeId id) const { return m_nodes[id]; }
    int size() const { return m_nodes.size(); }
    bool contains(NodeId id) const { return id >= 0 && id < m_nodes.size(); }

    NodeId root() const { return m_root; }
    void setRoot(NodeId id) { m_root = id; }

    template<typename T>
    T *get(NodeId id)
    {
        return contains(id) ? std::get_if<T>(&m_nodes[id].data) : nullptr;
    }

    template<typename T>
    const T *get(NodeId id) const
    {
        return contains(id) ? std::get_if<T>(&m_nodes[id].data) : nullptr;
    }

    template<typename T>
    bool is(NodeId id) const { return get<T>(id) != nullptr; }

    bool isBlockLevel(NodeId id) const { return Doc::isBlockLevel(m_nodes[id].data); }
    // True if id or any of its descendants is block level.
    bool containsBlock(NodeId id) const;

    // Parent links are established once by Passes::linkParents(). Children
    // attached afterwards through appendChild()/insertChild() get their
    // parent link immediately.
    bool parentsLinked() const { return m_parentsLinked; }
    void setParentsLinked(bool linked) { m_parentsLinked = linked; }
    void appendChild(NodeId parent, NodeId child);
    void insertChild(NodeId parent, int index, NodeId child);

    // Nearest ancestor (excluding id itself) holding a T, or kNoNode.
    template<typename T>
    NodeId ancestor(NodeId id) const
    {
        for (NodeId p = m_nodes[id].parent; p != kNoNode; p = m_nodes[p].parent) {
            if (is<T>(p))
                return p;
        }
        return kNoNode;
    }

    // Pre-order walk from `from` (included), i.e. reading order.
    QList<NodeId> walk(NodeId from) const;

    template<typename T>
    QList<NodeId> walk(NodeId from) const
    {
        QList<NodeId> result;
        for (NodeId id : walk(from)) {
            if (is<T>(id))
                result.append(id);
        }
        return result;
    }

    // Debug representation, e.g. Paragraph(Text("x"), HyperLink(...))
    QString dump(NodeId id) const;

private:
    QList<Node> m_nodes;
    NodeId m_root = kNoNode;
    bool m_parentsLinked = false;
};

} // namespace Doc

#endif // HTML2VIMDOC_DOCUMENTMODEL_H
