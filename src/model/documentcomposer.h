/*
 * documentcomposer.h — Assemble the design document from story fields
 * and the analysis text
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DESIGNDOC_DOCUMENTCOMPOSER_H
#define DESIGNDOC_DOCUMENTCOMPOSER_H

#include <QString>

#include "contentmodel.h"

// Free-text fields describing the user story behind a code change.
struct StoryDetails {
    QString name;
    QString description;
    QString additionalContext;
};

namespace DocumentComposer {

// Preamble sections, always at heading level 2 and never in the TOC:
//   "User Story Name"                   always, even when the name is empty
//   "User Story Description"            when the description is non-empty
//   "Additional Context & Instructions" when the context is not blank
// The field text is kept verbatim as a single plain run. The blocks
// built from the analysis text follow, and the document TOC is the one
// collected from the analysis headings.
Content::Document compose(const StoryDetails &story, const QString &analysisText);

// Output file name derived from the story name: spaces become '_'.
// An empty name falls back to 'fallbackBaseName'.
QString suggestedFileName(const QString &storyName, const QString &extension,
                          const QString &fallbackBaseName = QStringLiteral("code_analysis"));

} // namespace DocumentComposer

#endif // DESIGNDOC_DOCUMENTCOMPOSER_H
