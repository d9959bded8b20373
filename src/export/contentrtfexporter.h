/*
 * contentrtfexporter.h — RTF generation from Content:: model nodes
 *
 * Serializes a Content::Document into RTF that Word and LibreOffice open
 * as a styled document: headings carry the "heading N" paragraph styles
 * and outline levels, list items the "List Bullet"/"List Number" styles,
 * and bold is toggled per run. Fonts and sizes come from DocumentStyle.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_CONTENTRTFEXPORTER_H
#define DESIGNDOC_CONTENTRTFEXPORTER_H

#include <QByteArray>
#include <QColor>
#include <QList>
#include <QMap>
#include <QString>

#include "contentmodel.h"
#include "documentstyle.h"
#include "rtfexportoptions.h"

class ContentRtfExporter
{
public:
    explicit ContentRtfExporter(const DocumentStyle &style = DocumentStyle());

    QByteArray exportDocument(const Content::Document &doc,
                              const RtfExportOptions &options = RtfExportOptions());

    // Writes the document atomically. On failure nothing is written to
    // filePath, false is returned and errorMessage (if given) says why.
    bool exportToFile(const Content::Document &doc, const QString &filePath,
                      const RtfExportOptions &options = RtfExportOptions(),
                      QString *errorMessage = nullptr);

private:
    // Stylesheet indices
    enum StyleId {
        NormalStyle = 0,
        // 1-3: heading levels
        ListBulletStyle = 4,
        ListNumberStyle = 5,
    };

    // Pre-scan to collect fonts and colors
    void scanStyles();
    void scanTextStyle(const TextStyle &style);

    // RTF generation
    QByteArray writeHeader();
    void writeStyleSheet(QByteArray &out);
    void writeTableOfContents(QByteArray &out, const QList<Content::TocEntry> &toc);
    void writeBlock(QByteArray &out, const Content::BlockNode &block);
    void writeHeading(QByteArray &out, const Content::Heading &heading);
    void writeParagraph(QByteArray &out, const Content::Paragraph &para);
    void writeListItem(QByteArray &out, const Content::ListItem &item);
    void writeRuns(QByteArray &out, const QList<Content::Run> &runs,
                   const TextStyle &baseStyle);
    void writeCharFormat(QByteArray &out, const TextStyle &style);
    void writeParagraphFormat(QByteArray &out, const ParagraphFormat &fmt);

    // Helpers
    int fontIndex(const QString &family);
    int colorIndex(const QColor &color);

    DocumentStyle m_style;
    RtfExportOptions m_options;
    QMap<QString, int> m_fonts;
    QMap<QRgb, int> m_colors;
    int m_listNumber = 0;   // running number within consecutive numbered items
};

#endif // DESIGNDOC_CONTENTRTFEXPORTER_H
