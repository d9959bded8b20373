/*
 * listclassifier.cpp — Classify body lines as bullet, numbered or paragraph
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "listclassifier.h"

#include <QRegularExpression>

namespace ListClassifier {

static QString leftTrimmed(const QString &line)
{
    int start = 0;
    while (start < line.size() && line[start].isSpace())
        ++start;
    return line.mid(start);
}

Result classify(const QString &line)
{
    const QString trimmed = leftTrimmed(line);

    if (trimmed.startsWith(QLatin1String("- ")))
        return {LineKind::Bullet, trimmed.mid(2)};

    static const QRegularExpression numberedRx(QStringLiteral(R"(^[0-9]+\. )"));
    const QRegularExpressionMatch match = numberedRx.match(trimmed);
    if (match.hasMatch())
        return {LineKind::Numbered, trimmed.mid(match.capturedLength())};

    return {LineKind::Paragraph, line};
}

} // namespace ListClassifier
