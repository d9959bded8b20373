/*
 * headingclassifier.cpp — Heading depth and display level renormalization
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "headingclassifier.h"
#include "tocregistry.h"

#include <QtGlobal>

namespace HeadingClassifier {

int nominalLevel(const QString &headingLine)
{
    int level = 0;
    while (level < headingLine.size() && headingLine[level] == QLatin1Char('#'))
        ++level;
    return level;
}

QString headingText(const QString &headingLine)
{
    QString text = headingLine;
    text.remove(QLatin1Char('#'));
    return text.trimmed();
}

Result classify(const QString &headingLine, ParseState &state, TocRegistry *toc)
{
    Result result;
    result.nominalLevel = nominalLevel(headingLine);
    result.heading.text = headingText(headingLine);

    // Anything deeper than level 2 renders as level 2 unless overridden
    result.heading.level = qBound(1, result.nominalLevel, 2);

    if (result.heading.text.contains(QLatin1String("Solution"))) {
        state.currentSolutionHeading = result.heading.text;
    } else if (result.heading.text.contains(QLatin1String("How It Works"))
               && state.currentSolutionHeading.has_value()) {
        result.heading.level = 3;
    }

    if (toc)
        toc->addHeading(result.nominalLevel, result.heading.text);

    return result;
}

} // namespace HeadingClassifier
