/*
 * documentbuilder.h — Analysis text → Content::Document builder
 *
 * Single pass over the segmenter output: heading segments go through
 * HeadingClassifier (feeding the TOC), body lines through ListClassifier
 * and InlineFormatter. One block is emitted per heading and per
 * non-blank body line, in source order.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_DOCUMENTBUILDER_H
#define DESIGNDOC_DOCUMENTBUILDER_H

#include <QString>

#include "contentmodel.h"
#include "headingclassifier.h"

class TocRegistry;

class DocumentBuilder
{
public:
    DocumentBuilder() = default;

    // Parse state and TOC are local to each call, so one builder can be
    // reused, and separate builders can run on separate threads.
    Content::Document build(const QString &analysisText) const;

private:
    void appendHeading(Content::Document &doc, const QString &headingLine,
                       HeadingClassifier::ParseState &state,
                       TocRegistry &toc) const;
    void appendBody(Content::Document &doc, const QString &body) const;
    Content::BlockNode bodyLineBlock(const QString &line) const;
};

#endif // DESIGNDOC_DOCUMENTBUILDER_H
