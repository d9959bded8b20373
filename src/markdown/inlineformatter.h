/*
 * inlineformatter.h — Split a line into plain and bold runs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_INLINEFORMATTER_H
#define DESIGNDOC_INLINEFORMATTER_H

#include <QList>
#include <QString>

#include "contentmodel.h"

namespace InlineFormatter {

// Splits text into runs using the **bold** convention.
//
// A "**" opens a bold span only if another "**" starts at least one
// character later; the first such marker closes it. Markers without a
// partner stay in the output as literal plain text. Empty plain
// fragments between spans are dropped, but an empty input still yields
// one empty plain run so every text block has at least one run.
QList<Content::Run> format(const QString &text);

} // namespace InlineFormatter

#endif // DESIGNDOC_INLINEFORMATTER_H
