/*
 * contentrtfexporter.cpp — RTF generation from Content:: model nodes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentrtfexporter.h"
#include "rtfutils.h"

#include <QDebug>
#include <QSaveFile>

#include <algorithm>
#include <type_traits>

using RtfUtils::escapeText;
using RtfUtils::toHalfPoints;
using RtfUtils::toTwips;

ContentRtfExporter::ContentRtfExporter(const DocumentStyle &style)
    : m_style(style)
{
}

// --- Public ---

QByteArray ContentRtfExporter::exportDocument(const Content::Document &doc,
                                              const RtfExportOptions &options)
{
    m_options = options;
    m_fonts.clear();
    m_colors.clear();
    m_listNumber = 0;

    // Ensure default entries
    fontIndex(m_style.bodyFontFamily());
    colorIndex(QColor(Qt::black));

    scanStyles();

    QByteArray rtf;
    rtf.reserve(4096);

    rtf.append(writeHeader());

    if (m_options.includeTableOfContents && !doc.toc.isEmpty())
        writeTableOfContents(rtf, doc.toc);

    for (const auto &block : doc.blocks)
        writeBlock(rtf, block);

    rtf.append("}");
    return rtf;
}

bool ContentRtfExporter::exportToFile(const Content::Document &doc,
                                      const QString &filePath,
                                      const RtfExportOptions &options,
                                      QString *errorMessage)
{
    auto fail = [&](const QString &reason) {
        qWarning() << "ContentRtfExporter: cannot write" << filePath << ":" << reason;
        if (errorMessage)
            *errorMessage = reason;
        return false;
    };

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly))
        return fail(file.errorString());

    const QByteArray rtf = exportDocument(doc, options);
    if (file.write(rtf) != rtf.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return fail(reason);
    }

    if (!file.commit())
        return fail(file.errorString());

    return true;
}

// --- Pre-scan ---

void ContentRtfExporter::scanStyles()
{
    scanTextStyle(m_style.bodyTextStyle());
    for (int level = 1; level <= DocumentStyle::HeadingLevels; ++level)
        scanTextStyle(m_style.headingTextStyle(level));
}

void ContentRtfExporter::scanTextStyle(const TextStyle &style)
{
    if (!style.fontFamily.isEmpty())
        fontIndex(style.fontFamily);
    if (style.foreground.isValid())
        colorIndex(style.foreground);
}

// --- RTF generation ---

QByteArray ContentRtfExporter::writeHeader()
{
    QByteArray hdr;
    hdr.append("{\\rtf1\\ansi\\ansicpg1252\\deff0\n");

    // Font table
    hdr.append("{\\fonttbl");
    for (auto it = m_fonts.constBegin(); it != m_fonts.constEnd(); ++it) {
        hdr.append("{\\f");
        hdr.append(QByteArray::number(it.value()));
        hdr.append("\\fnil ");
        hdr.append(escapeText(it.key()));
        hdr.append(";}");
    }
    hdr.append("}\n");

    // Color table: RTF color indices are 1-based, index 0 is auto/default
    hdr.append("{\\colortbl;");

    QList<QPair<QRgb, int>> colorList;
    for (auto it = m_colors.constBegin(); it != m_colors.constEnd(); ++it)
        colorList.append({it.key(), it.value()});
    std::sort(colorList.begin(), colorList.end(),
              [](const auto &a, const auto &b) { return a.second < b.second; });

    for (const auto &entry : colorList) {
        QColor c = QColor::fromRgb(entry.first);
        hdr.append("\\red");
        hdr.append(QByteArray::number(c.red()));
        hdr.append("\\green");
        hdr.append(QByteArray::number(c.green()));
        hdr.append("\\blue");
        hdr.append(QByteArray::number(c.blue()));
        hdr.append(";");
    }
    hdr.append("}\n");

    writeStyleSheet(hdr);

    hdr.append("\\viewkind4\\uc1\n");
    return hdr;
}

void ContentRtfExporter::writeStyleSheet(QByteArray &out)
{
    out.append("{\\stylesheet");

    out.append("{\\s0");
    writeParagraphFormat(out, m_style.bodyFormat());
    writeCharFormat(out, m_style.bodyTextStyle());
    out.append("Normal;}");

    for (int level = 1; level <= DocumentStyle::HeadingLevels; ++level) {
        out.append("{\\s");
        out.append(QByteArray::number(level));
        out.append("\\outlinelevel");
        out.append(QByteArray::number(level - 1));
        writeParagraphFormat(out, m_style.headingFormat(level));
        out.append("\\sbasedon0\\snext0");
        writeCharFormat(out, m_style.headingTextStyle(level));
        out.append("heading ");
        out.append(QByteArray::number(level));
        out.append(";}");
    }

    const struct {
        StyleId id;
        const char *name;
    } listStyles[] = {
        {ListBulletStyle, "List Bullet"},
        {ListNumberStyle, "List Number"},
    };
    for (const auto &ls : listStyles) {
        out.append("{\\s");
        out.append(QByteArray::number(ls.id));
        writeParagraphFormat(out, m_style.listItemFormat());
        out.append("\\sbasedon0\\snext");
        out.append(QByteArray::number(ls.id));
        writeCharFormat(out, m_style.bodyTextStyle());
        out.append(ls.name);
        out.append(";}");
    }

    out.append("}\n");
}

void ContentRtfExporter::writeTableOfContents(QByteArray &out,
                                              const QList<Content::TocEntry> &toc)
{
    TextStyle titleStyle = m_style.headingTextStyle(1);
    ParagraphFormat titleFormat = m_style.headingFormat(1);

    out.append("\\pard\\plain\\s0");
    writeParagraphFormat(out, titleFormat);
    out.append(" {");
    writeCharFormat(out, titleStyle);
    out.append(escapeText(m_options.tableOfContentsTitle));
    out.append("}\\par\n");

    // TOC field; the cached result lists the entries so readers that do
    // not update fields still show them.
    out.append("{\\field{\\*\\fldinst { TOC \\\\o \"1-");
    out.append(QByteArray::number(m_options.tocMaxLevel));
    out.append("\" \\\\h \\\\z \\\\u }}{\\fldrslt ");

    const TextStyle entryStyle = m_style.bodyTextStyle();
    for (const Content::TocEntry &entry : toc) {
        if (entry.level > m_options.tocMaxLevel)
            continue;
        ParagraphFormat fmt;
        fmt.leftIndent = 18.0 * (entry.level - 2);
        fmt.spaceAfter = 2.0;
        out.append("\\pard\\plain\\s0");
        writeParagraphFormat(out, fmt);
        out.append(" {");
        writeCharFormat(out, entryStyle);
        out.append(escapeText(entry.text));
        out.append("}\\par\n");
    }
    out.append("}}\n");
    out.append("\\pard\\plain\\page\n");
}

void ContentRtfExporter::writeBlock(QByteArray &out, const Content::BlockNode &block)
{
    std::visit([this, &out](const auto &b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Content::Heading>) {
            m_listNumber = 0;
            writeHeading(out, b);
        } else if constexpr (std::is_same_v<T, Content::Paragraph>) {
            m_listNumber = 0;
            writeParagraph(out, b);
        } else if constexpr (std::is_same_v<T, Content::ListItem>) {
            if (b.type != Content::ListType::Numbered)
                m_listNumber = 0;
            writeListItem(out, b);
        }
    }, block);
}

void ContentRtfExporter::writeHeading(QByteArray &out, const Content::Heading &heading)
{
    const int level = qBound(1, heading.level, DocumentStyle::HeadingLevels);

    out.append("\\pard\\plain\\s");
    out.append(QByteArray::number(level));
    out.append("\\outlinelevel");
    out.append(QByteArray::number(level - 1));
    writeParagraphFormat(out, m_style.headingFormat(level));
    out.append(" {");
    writeCharFormat(out, m_style.headingTextStyle(level));
    out.append(escapeText(heading.text));
    out.append("}\\par\n");
}

void ContentRtfExporter::writeParagraph(QByteArray &out, const Content::Paragraph &para)
{
    out.append("\\pard\\plain\\s0");
    writeParagraphFormat(out, m_style.bodyFormat());
    out.append(" ");
    writeRuns(out, para.runs, m_style.bodyTextStyle());
    out.append("\\par\n");
}

void ContentRtfExporter::writeListItem(QByteArray &out, const Content::ListItem &item)
{
    const bool numbered = item.type == Content::ListType::Numbered;
    const TextStyle bodyStyle = m_style.bodyTextStyle();

    QByteArray pnText;
    if (numbered)
        pnText = QByteArray::number(++m_listNumber) + ".\\tab";
    else
        pnText = "\\'B7\\tab";

    out.append("\\pard\\plain\\s");
    out.append(QByteArray::number(numbered ? ListNumberStyle : ListBulletStyle));
    writeParagraphFormat(out, m_style.listItemFormat());
    out.append("{\\pntext");
    writeCharFormat(out, bodyStyle);
    out.append(pnText);
    out.append("}");
    writeRuns(out, item.runs, bodyStyle);
    out.append("\\par\n");
}

void ContentRtfExporter::writeRuns(QByteArray &out, const QList<Content::Run> &runs,
                                   const TextStyle &baseStyle)
{
    for (const Content::Run &run : runs) {
        if (run.text.isEmpty())
            continue;
        TextStyle style = baseStyle;
        style.bold = baseStyle.bold || run.bold;
        out.append("{");
        writeCharFormat(out, style);
        out.append(escapeText(run.text));
        out.append("}");
    }
}

void ContentRtfExporter::writeCharFormat(QByteArray &out, const TextStyle &style)
{
    if (!style.fontFamily.isEmpty()) {
        out.append("\\f");
        out.append(QByteArray::number(fontIndex(style.fontFamily)));
    }

    // Font size in half-points
    if (style.fontSize > 0) {
        out.append("\\fs");
        out.append(QByteArray::number(toHalfPoints(style.fontSize)));
    }

    out.append(style.bold ? "\\b" : "\\b0");

    // Foreground color (RTF color table is 1-based)
    if (style.foreground.isValid()) {
        out.append("\\cf");
        out.append(QByteArray::number(colorIndex(style.foreground) + 1));
    }

    out.append(" ");
}

void ContentRtfExporter::writeParagraphFormat(QByteArray &out, const ParagraphFormat &fmt)
{
    out.append("\\ql");

    // Space before/after (in twips)
    if (fmt.spaceBefore > 0) {
        out.append("\\sb");
        out.append(QByteArray::number(toTwips(fmt.spaceBefore)));
    }
    if (fmt.spaceAfter > 0) {
        out.append("\\sa");
        out.append(QByteArray::number(toTwips(fmt.spaceAfter)));
    }

    if (fmt.leftIndent > 0) {
        out.append("\\li");
        out.append(QByteArray::number(toTwips(fmt.leftIndent)));
    }
    if (fmt.firstLineIndent != 0) {
        out.append("\\fi");
        out.append(QByteArray::number(toTwips(fmt.firstLineIndent)));
    }
}

// --- Helpers ---

int ContentRtfExporter::fontIndex(const QString &family)
{
    auto it = m_fonts.find(family);
    if (it != m_fonts.end())
        return it.value();

    int idx = m_fonts.size();
    m_fonts.insert(family, idx);
    return idx;
}

int ContentRtfExporter::colorIndex(const QColor &color)
{
    QRgb rgb = color.rgb();
    auto it = m_colors.find(rgb);
    if (it != m_colors.end())
        return it.value();

    int idx = m_colors.size();
    m_colors.insert(rgb, idx);
    return idx;
}
