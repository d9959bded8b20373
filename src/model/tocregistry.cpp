/*
 * tocregistry.cpp — Ordered collection of table-of-contents entries
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tocregistry.h"

#include <utility>

bool TocRegistry::addHeading(int nominalLevel, const QString &text)
{
    if (nominalLevel <= 1)
        return false;

    m_entries.append(Content::TocEntry{nominalLevel, text});
    return true;
}

QList<Content::TocEntry> TocRegistry::takeEntries()
{
    return std::exchange(m_entries, {});
}
