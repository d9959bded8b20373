/*
 * tocregistry.h — Ordered collection of table-of-contents entries
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_TOCREGISTRY_H
#define DESIGNDOC_TOCREGISTRY_H

#include <QList>
#include <QString>

#include "contentmodel.h"

// Append-only. Repeated headings produce repeated entries so the list
// mirrors the document structure rather than acting as a title index.
class TocRegistry
{
public:
    TocRegistry() = default;

    // Records the heading unless it is the document title (level 1).
    // Returns true if an entry was added.
    bool addHeading(int nominalLevel, const QString &text);

    const QList<Content::TocEntry> &entries() const { return m_entries; }
    bool isEmpty() const { return m_entries.isEmpty(); }
    int size() const { return m_entries.size(); }

    // Moves the collected entries out, leaving the registry empty.
    QList<Content::TocEntry> takeEntries();

private:
    QList<Content::TocEntry> m_entries;
};

#endif // DESIGNDOC_TOCREGISTRY_H
