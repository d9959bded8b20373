/*
 * segmenter.cpp — Split analysis text into heading and body segments
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "segmenter.h"

#include <QRegularExpression>

namespace Segmenter {

static void appendSegment(QList<Segment> &segments, Segment::Kind kind,
                          const QString &text)
{
    if (text.trimmed().isEmpty())
        return;
    segments.append(Segment{kind, text});
}

QList<Segment> segment(const QString &text)
{
    QList<Segment> segments;
    if (text.isEmpty())
        return segments;

    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));

    static const QRegularExpression headingRx(
        QStringLiteral(R"(^#+.+$)"),
        QRegularExpression::MultilineOption);

    int bodyStart = 0;
    auto it = headingRx.globalMatch(normalized);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const int start = match.capturedStart();

        appendSegment(segments, Segment::Body,
                      normalized.mid(bodyStart, start - bodyStart));
        appendSegment(segments, Segment::Heading, match.captured());

        bodyStart = match.capturedEnd();
    }
    appendSegment(segments, Segment::Body, normalized.mid(bodyStart));

    return segments;
}

} // namespace Segmenter
