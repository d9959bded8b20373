/*
 * listclassifier.h — Classify body lines as bullet, numbered or paragraph
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_LISTCLASSIFIER_H
#define DESIGNDOC_LISTCLASSIFIER_H

#include <QString>

namespace ListClassifier {

enum class LineKind { Bullet, Numbered, Paragraph };

struct Result {
    LineKind kind = LineKind::Paragraph;
    QString content;    // line text with the list marker removed
};

// Checks are made in this order: "- " bullet, "<digits>. " numbered,
// then plain paragraph. Markers are matched after left-trimming; a
// paragraph keeps the line untouched.
Result classify(const QString &line);

} // namespace ListClassifier

#endif // DESIGNDOC_LISTCLASSIFIER_H
