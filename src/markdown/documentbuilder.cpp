/*
 * documentbuilder.cpp — Analysis text → Content::Document builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentbuilder.h"
#include "inlineformatter.h"
#include "listclassifier.h"
#include "segmenter.h"
#include "tocregistry.h"

#include <QDebug>
#include <QStringList>

#include <utility>

static constexpr int MaxMarkdownHeadingLevel = 6;

Content::Document DocumentBuilder::build(const QString &analysisText) const
{
    Content::Document doc;
    HeadingClassifier::ParseState state;
    TocRegistry toc;

    const QList<Segmenter::Segment> segments = Segmenter::segment(analysisText);
    for (const Segmenter::Segment &segment : segments) {
        if (segment.isHeading())
            appendHeading(doc, segment.text, state, toc);
        else
            appendBody(doc, segment.text);
    }

    doc.toc = toc.takeEntries();
    return doc;
}

void DocumentBuilder::appendHeading(Content::Document &doc,
                                    const QString &headingLine,
                                    HeadingClassifier::ParseState &state,
                                    TocRegistry &toc) const
{
    HeadingClassifier::Result result =
        HeadingClassifier::classify(headingLine, state, &toc);

    if (result.nominalLevel > MaxMarkdownHeadingLevel) {
        qDebug() << "DocumentBuilder: heading nested" << result.nominalLevel
                 << "levels deep, rendering at level" << result.heading.level
                 << ":" << result.heading.text;
    }

    doc.blocks.append(std::move(result.heading));
}

void DocumentBuilder::appendBody(Content::Document &doc, const QString &body) const
{
    const QStringList lines = body.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        if (line.trimmed().isEmpty())
            continue;
        doc.blocks.append(bodyLineBlock(line));
    }
}

Content::BlockNode DocumentBuilder::bodyLineBlock(const QString &line) const
{
    const ListClassifier::Result classified = ListClassifier::classify(line);
    QList<Content::Run> runs = InlineFormatter::format(classified.content);

    switch (classified.kind) {
    case ListClassifier::LineKind::Bullet:
        return Content::ListItem{Content::ListType::Bullet, std::move(runs)};
    case ListClassifier::LineKind::Numbered:
        return Content::ListItem{Content::ListType::Numbered, std::move(runs)};
    case ListClassifier::LineKind::Paragraph:
        break;
    }
    return Content::Paragraph{std::move(runs)};
}
