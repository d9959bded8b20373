/*
 * documentstyle.cpp — Fonts, sizes and spacing applied at export time
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentstyle.h"

#include <QDebug>
#include <QtGlobal>

DocumentStyle::DocumentStyle() = default;

int DocumentStyle::levelIndex(int level)
{
    return qBound(1, level, HeadingLevels) - 1;
}

void DocumentStyle::setBodyFontSize(qreal pts)
{
    if (pts <= 0) {
        qWarning() << "DocumentStyle: ignoring invalid body font size" << pts;
        return;
    }
    m_body.fontSize = pts;
}

qreal DocumentStyle::headingFontSize(int level) const
{
    return m_headingSizes[levelIndex(level)];
}

void DocumentStyle::setHeadingFontSize(int level, qreal pts)
{
    if (pts <= 0) {
        qWarning() << "DocumentStyle: ignoring invalid heading size" << pts
                   << "for level" << level;
        return;
    }
    m_headingSizes[levelIndex(level)] = pts;
}

TextStyle DocumentStyle::headingTextStyle(int level) const
{
    TextStyle s;
    s.fontFamily = m_headingFontFamily;
    s.fontSize = headingFontSize(level);
    s.bold = level >= 2;
    s.foreground = m_headingColor;
    return s;
}

ParagraphFormat DocumentStyle::bodyFormat() const
{
    ParagraphFormat f;
    f.spaceAfter = 8.0;
    return f;
}

ParagraphFormat DocumentStyle::headingFormat(int level) const
{
    static const qreal spaceBefore[] = {24, 12, 10};
    static const qreal spaceAfter[] = {6, 4, 2};
    ParagraphFormat f;
    f.spaceBefore = spaceBefore[levelIndex(level)];
    f.spaceAfter = spaceAfter[levelIndex(level)];
    return f;
}

ParagraphFormat DocumentStyle::listItemFormat() const
{
    ParagraphFormat f;
    f.spaceAfter = 4.0;
    f.leftIndent = 36.0;
    f.firstLineIndent = -18.0;
    return f;
}
