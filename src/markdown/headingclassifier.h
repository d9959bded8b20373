/*
 * headingclassifier.h — Heading depth and display level renormalization
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_HEADINGCLASSIFIER_H
#define DESIGNDOC_HEADINGCLASSIFIER_H

#include <QString>

#include <optional>

#include "contentmodel.h"

class TocRegistry;

namespace HeadingClassifier {

// Sequential state carried across the headings of one conversion.
struct ParseState {
    // Most recent heading mentioning "Solution". Once set it stays set
    // for the rest of the document; it is not scoped to a section.
    std::optional<QString> currentSolutionHeading;
};

struct Result {
    int nominalLevel = 1;
    Content::Heading heading;
};

// Classifies a raw heading line ("## Text"):
//  - nominal level is the number of leading '#'
//  - display level is the nominal level clamped to 1..2, except that a
//    "How It Works" heading after any "Solution" heading becomes level 3
//  - headings below the title (nominal level > 1) go into the TOC
// The parse state is updated in place and never restored.
Result classify(const QString &headingLine, ParseState &state,
                TocRegistry *toc = nullptr);

int nominalLevel(const QString &headingLine);

// Heading text with every '#' removed, trimmed.
QString headingText(const QString &headingLine);

} // namespace HeadingClassifier

#endif // DESIGNDOC_HEADINGCLASSIFIER_H
