/*
 * migrationrewriter.h — Rewrite a third-party tool's markers into canonical sections
 *
 * Migration runs in three steps:
 *  1. rewriteMarkers() streams the document through an incremental UTF-8
 *     decoder and replaces the tool's markers line by line.
 *  2. mergeConsecutiveSections() folds adjacent spans of one section into one.
 *  3. fillMissingSections() inserts empty spans for absent sections.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MIGRATIONREWRITER_H
#define DOKUMENTOR_MIGRATIONREWRITER_H

#include "content/content.h"
#include "migration/migrationtool.h"
#include "section/sectionidentifier.h"

#include <QList>
#include <QString>

class QIODevice;

class MigrationRewriter
{
public:
    struct Result {
        Content content;
        bool valid = true;
        QString errorMessage;
    };

    static constexpr qsizetype kDefaultChunkSize = 8 * 1024;

    explicit MigrationRewriter(const MigrationTool &tool);

    const MigrationTool &tool() const { return m_tool; }

    qsizetype chunkSize() const { return m_chunkSize; }
    void setChunkSize(qsizetype bytes) { m_chunkSize = qMax(qsizetype(1), bytes); }

    // Step 1. The device must be open for reading.
    Result rewriteMarkers(QIODevice *source) const;

    // All three steps. Fill-missing is limited to the supported sections.
    Result migrate(QIODevice *source,
                   const QList<SectionIdentifier> &supported = SectionIdentifiers::all()) const;

    static Content mergeConsecutiveSections(const Content &document);
    static Content fillMissingSections(const Content &document,
                                       const QList<SectionIdentifier> &supported = SectionIdentifiers::all());

private:
    class LineProcessor;

    MigrationTool m_tool;
    qsizetype m_chunkSize = kDefaultChunkSize;
};

#endif // DOKUMENTOR_MIGRATIONREWRITER_H
