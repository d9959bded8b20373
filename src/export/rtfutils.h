/*
 * rtfutils.h — Shared RTF utility functions
 *
 * Provides escapeText(), toTwips() and toHalfPoints() used by the RTF
 * serializer when writing the font table, stylesheet and body.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_RTFUTILS_H
#define DESIGNDOC_RTFUTILS_H

#include <QByteArray>
#include <QString>
#include <QtMath>

namespace RtfUtils {

/// Escape text for an RTF body or font table entry.
/// Line breaks inside a block become \line, carriage returns and other
/// C0 control characters are dropped, and anything above ASCII without
/// a named keyword is written as \uN with a '?' fallback.
inline QByteArray escapeText(const QString &text)
{
    QByteArray result;
    result.reserve(text.size() * 2);

    for (QChar ch : text) {
        const ushort code = ch.unicode();
        switch (code) {
        case '\\':
        case '{':
        case '}':
            result.append('\\');
            result.append(static_cast<char>(code));
            continue;
        case '\t':
            result.append("\\tab ");
            continue;
        case '\n':
            result.append("\\line ");
            continue;
        case 0x00A0:
            result.append("\\~");
            continue;
        case 0x2013:
            result.append("\\endash ");
            continue;
        case 0x2014:
            result.append("\\emdash ");
            continue;
        case 0x2018:
            result.append("\\lquote ");
            continue;
        case 0x2019:
            result.append("\\rquote ");
            continue;
        case 0x201C:
            result.append("\\ldblquote ");
            continue;
        case 0x201D:
            result.append("\\rdblquote ");
            continue;
        default:
            break;
        }

        if (code < 0x20 || code == 0x7F)
            continue;
        if (code < 0x80) {
            result.append(static_cast<char>(code));
        } else {
            // \u takes a signed 16-bit value
            result.append("\\u");
            result.append(QByteArray::number(static_cast<qint16>(code)));
            result.append('?');
        }
    }

    return result;
}

/// Convert points to twips (1 point = 20 twips).
inline int toTwips(qreal points)
{
    return qRound(points * 20.0);
}

/// Convert points to half-points (1 point = 2 half-points).
inline int toHalfPoints(qreal points)
{
    return qRound(points * 2.0);
}

} // namespace RtfUtils

#endif // DESIGNDOC_RTFUTILS_H
