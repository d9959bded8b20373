/*
 * inlineformatter.cpp — Split a line into plain and bold runs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "inlineformatter.h"

namespace InlineFormatter {

static bool isMarkerAt(const QString &text, int pos)
{
    return pos + 1 < text.size()
        && text[pos] == QLatin1Char('*')
        && text[pos + 1] == QLatin1Char('*');
}

// Position of the "**" closing a span opened at 'open', or -1.
// The span holds at least one character and never crosses a line break.
static int findClosingMarker(const QString &text, int open)
{
    for (int pos = open + 3; pos + 1 < text.size(); ++pos) {
        if (text[pos - 1] == QLatin1Char('\n'))
            return -1;
        if (isMarkerAt(text, pos))
            return pos;
    }
    return -1;
}

QList<Content::Run> format(const QString &text)
{
    QList<Content::Run> runs;
    QString plain;

    auto flushPlain = [&runs, &plain]() {
        if (plain.isEmpty())
            return;
        runs.append(Content::Run{plain, false});
        plain.clear();
    };

    int pos = 0;
    while (pos < text.size()) {
        if (isMarkerAt(text, pos)) {
            const int close = findClosingMarker(text, pos);
            if (close >= 0) {
                flushPlain();
                runs.append(Content::Run{text.mid(pos + 2, close - pos - 2), true});
                pos = close + 2;
                continue;
            }
        }
        // Unpaired marker characters fall through as literal text
        plain += text[pos];
        ++pos;
    }
    flushPlain();

    if (runs.isEmpty())
        runs.append(Content::Run{QString(), false});
    return runs;
}

} // namespace InlineFormatter
