/*
 * documentstyle.h — Fonts, sizes and spacing applied at export time
 *
 * The content model only carries heading levels and bold runs; the
 * serializers resolve everything else through a DocumentStyle.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_DOCUMENTSTYLE_H
#define DESIGNDOC_DOCUMENTSTYLE_H

#include <QColor>
#include <QString>

struct TextStyle {
    QString fontFamily = QStringLiteral("Calibri");
    qreal fontSize = 12.0;
    bool bold = false;
    QColor foreground;          // invalid = automatic
};

struct ParagraphFormat {
    qreal spaceBefore = 0;
    qreal spaceAfter = 0;
    qreal leftIndent = 0;
    qreal firstLineIndent = 0;  // negative = hanging indent
};

class DocumentStyle
{
public:
    static constexpr int HeadingLevels = 3;

    DocumentStyle();

    // Body text (paragraphs and list items)
    QString bodyFontFamily() const { return m_body.fontFamily; }
    void setBodyFontFamily(const QString &family) { m_body.fontFamily = family; }
    qreal bodyFontSize() const { return m_body.fontSize; }
    void setBodyFontSize(qreal pts);

    // Headings share family and colour; sizes are per level
    QString headingFontFamily() const { return m_headingFontFamily; }
    void setHeadingFontFamily(const QString &family) { m_headingFontFamily = family; }
    QColor headingColor() const { return m_headingColor; }
    void setHeadingColor(const QColor &color) { m_headingColor = color; }
    qreal headingFontSize(int level) const;
    void setHeadingFontSize(int level, qreal pts);

    TextStyle bodyTextStyle() const { return m_body; }
    TextStyle headingTextStyle(int level) const;

    ParagraphFormat bodyFormat() const;
    ParagraphFormat headingFormat(int level) const;
    ParagraphFormat listItemFormat() const;

private:
    static int levelIndex(int level);

    TextStyle m_body;
    QString m_headingFontFamily = QStringLiteral("Calibri Light");
    QColor m_headingColor = QColor(0x2f, 0x54, 0x96);
    qreal m_headingSizes[HeadingLevels] = {16.0, 13.0, 12.0};
};

#endif // DESIGNDOC_DOCUMENTSTYLE_H
