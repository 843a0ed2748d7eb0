/*
 * migrationtool.h — Marker syntax of third-party documentation tools
 *
 * A tool is described by data only: the patterns that find its markers and
 * the mapping from its section names to canonical identifiers. Every marker
 * pattern exposes the tool's section name as the named group "name";
 * heading patterns also expose the heading's "#" run as "level".
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MIGRATIONTOOL_H
#define DOKUMENTOR_MIGRATIONTOOL_H

#include "section/sectionidentifier.h"

#include <QHash>
#include <QList>
#include <QRegularExpression>
#include <QString>

#include <functional>
#include <optional>

struct MigrationTool {
    enum class MarkerStyle {
        Comment,   // explicit start and end marker comments
        Heading,   // a matching heading opens a section that runs until the
                   // next heading of the same or a higher level
    };

    QString name;
    MarkerStyle style = MarkerStyle::Comment;
    QRegularExpression startPattern;
    QRegularExpression endPattern;   // Comment style only; may equal startPattern
    QRegularExpression detectionPattern;
    QHash<QString, SectionIdentifier> sectionMappings;   // lower-case names
    std::function<QString(const QString &)> normalizeName;

    // Canonical identifier for a tool section name, if the tool maps it.
    std::optional<SectionIdentifier> mapName(const QString &sectionName) const;

    // Start and end markers are the same text; occurrences alternate.
    bool markersIdentical() const;
};

namespace MigrationTools {

MigrationTool actionDocs();
MigrationTool actdocs();
MigrationTool githubActionReadmeGenerator();
MigrationTool autoDoc();

QList<MigrationTool> builtins();

} // namespace MigrationTools

#endif // DOKUMENTOR_MIGRATIONTOOL_H
