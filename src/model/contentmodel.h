/*
 * contentmodel.h — Content node types (header-only, std::variant)
 *
 * Defines the intermediate representation between the analysis text
 * parser and the document serializers. Formatting is limited to heading
 * level and run-level bold; fonts and spacing belong to DocumentStyle.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_CONTENTMODEL_H
#define DESIGNDOC_CONTENTMODEL_H

#include <QList>
#include <QString>

#include <type_traits>
#include <variant>

namespace Content {

// --- Inline nodes ---

struct Run {
    QString text;
    bool bold = false;

    bool operator==(const Run &other) const
    {
        return bold == other.bold && text == other.text;
    }
};

// --- Block nodes ---

struct Heading {
    int level = 1;      // display level, 1-3
    QString text;
};

struct Paragraph {
    QList<Run> runs;
};

enum class ListType { Bullet, Numbered };

struct ListItem {
    ListType type = ListType::Bullet;
    QList<Run> runs;
};

using BlockNode = std::variant<
    Heading,
    Paragraph,
    ListItem
>;

// --- Table of contents ---

struct TocEntry {
    int level = 2;      // nominal level as written in the source
    QString text;

    bool operator==(const TocEntry &other) const
    {
        return level == other.level && text == other.text;
    }
};

// --- Document ---

struct Document {
    QList<BlockNode> blocks;
    QList<TocEntry> toc;
};

// Concatenated text of a block's runs (or the heading text).
inline QString plainText(const BlockNode &block)
{
    return std::visit([](const auto &b) -> QString {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Heading>) {
            return b.text;
        } else {
            QString text;
            for (const Run &run : b.runs)
                text += run.text;
            return text;
        }
    }, block);
}

} // namespace Content

#endif // DESIGNDOC_CONTENTMODEL_H
