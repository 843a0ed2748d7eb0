/*
 * migrationservice.h — Tool registry, detection and migration of destinations
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MIGRATIONSERVICE_H
#define DOKUMENTOR_MIGRATIONSERVICE_H

#include "content/content.h"
#include "migration/migrationtool.h"
#include "section/sectionidentifier.h"

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

class QIODevice;
class SectionWriter;

class MigrationService
{
public:
    struct Result {
        Content content;     // the migrated document
        QString toolName;
        bool valid = true;
        QString errorMessage;
    };

    static constexpr qsizetype kDetectionChunkSize = 8 * 1024;
    static constexpr qsizetype kDetectionWindow = 8 * 1024;

    // Starts with the built-in tools registered. The writer is not owned.
    explicit MigrationService(SectionWriter *writer);

    // Replaces a registered tool of the same name.
    void registerTool(const MigrationTool &tool);
    QStringList toolNames() const;
    std::optional<MigrationTool> tool(const QString &name) const;

    // First registered tool whose detection pattern occurs in the destination.
    std::optional<MigrationTool> detect(const QString &destination) const;

    const QList<SectionIdentifier> &supportedSections() const { return m_supportedSections; }
    void setSupportedSections(const QList<SectionIdentifier> &sections);

    // An empty toolName auto-detects. A dry run returns the migrated
    // document without writing it.
    Result migrate(const QString &destination, const QString &toolName = QString(),
                   bool dryRun = false) const;

private:
    bool detectionMatches(const MigrationTool &tool, QIODevice *device) const;

    SectionWriter *m_writer;
    QList<MigrationTool> m_tools;
    QList<SectionIdentifier> m_supportedSections;
};

#endif // DOKUMENTOR_MIGRATIONSERVICE_H
