/*
 * rtfexportoptions.h — Options for RTF document export
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_RTFEXPORTOPTIONS_H
#define DESIGNDOC_RTFEXPORTOPTIONS_H

#include <QString>

struct RtfExportOptions {
    // Table of contents written before the first block. Skipped when the
    // document has no TOC entries.
    bool includeTableOfContents = true;
    QString tableOfContentsTitle = QStringLiteral("Table of Contents");
    int tocMaxLevel = 3;        // deepest nominal level listed

    static RtfExportOptions withoutTableOfContents()
    {
        RtfExportOptions opts;
        opts.includeTableOfContents = false;
        return opts;
    }
};

#endif // DESIGNDOC_RTFEXPORTOPTIONS_H
