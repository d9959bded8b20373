/*
 * documentcomposer.cpp — Assemble the design document from story fields
 * and the analysis text
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentcomposer.h"
#include "documentbuilder.h"

#include <utility>

namespace DocumentComposer {

static constexpr int PreambleHeadingLevel = 2;

static void appendSection(Content::Document &doc, const QString &title,
                          const QString &body)
{
    doc.blocks.append(Content::Heading{PreambleHeadingLevel, title});
    doc.blocks.append(Content::Paragraph{{Content::Run{body, false}}});
}

Content::Document compose(const StoryDetails &story, const QString &analysisText)
{
    Content::Document doc;

    appendSection(doc, QStringLiteral("User Story Name"), story.name);

    if (!story.description.isEmpty())
        appendSection(doc, QStringLiteral("User Story Description"), story.description);

    if (!story.additionalContext.trimmed().isEmpty())
        appendSection(doc, QStringLiteral("Additional Context & Instructions"),
                      story.additionalContext);

    DocumentBuilder builder;
    Content::Document analysis = builder.build(analysisText);
    doc.blocks.append(analysis.blocks);
    doc.toc = std::move(analysis.toc);

    return doc;
}

QString suggestedFileName(const QString &storyName, const QString &extension,
                          const QString &fallbackBaseName)
{
    QString base = storyName.isEmpty() ? fallbackBaseName : storyName;
    base.replace(QLatin1Char(' '), QLatin1Char('_'));

    if (extension.isEmpty())
        return base;
    if (extension.startsWith(QLatin1Char('.')))
        return base + extension;
    return base + QLatin1Char('.') + extension;
}

} // namespace DocumentComposer
