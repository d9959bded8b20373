/*
 * segmenter.h — Split analysis text into heading and body segments
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_SEGMENTER_H
#define DESIGNDOC_SEGMENTER_H

#include <QList>
#include <QString>

namespace Segmenter {

struct Segment {
    enum Kind { Heading, Body };

    Kind kind = Body;
    QString text;   // heading: the whole marker line; body: raw lines

    bool isHeading() const { return kind == Heading; }
};

// A heading is a full line starting at column 0 with one or more '#'
// followed by at least one more character. Everything between heading
// lines becomes a body segment. Blank segments are dropped, so the
// result alternates only where the source does.
//
// Line endings are normalized to '\n' before splitting.
QList<Segment> segment(const QString &text);

} // namespace Segmenter

#endif // DESIGNDOC_SEGMENTER_H
