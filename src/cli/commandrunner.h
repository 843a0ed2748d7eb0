/*
 * commandrunner.h — Runs generate and migrate over a set of destinations
 *
 * Destinations are processed on a thread pool limited to the configured
 * concurrency. Writes to one destination are serialized by the lock
 * registry, so listing a destination twice is safe.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_COMMANDRUNNER_H
#define DOKUMENTOR_COMMANDRUNNER_H

#include "generate/sectionmanifest.h"
#include "markdown/linktransformer.h"
#include "section/destinationlockregistry.h"
#include "section/sectionwriter.h"

#include <QMutex>
#include <QString>
#include <QStringList>

#include <functional>

class DocumentStorage;
class QIODevice;

class CommandRunner
{
public:
    enum ExitCode {
        Success = 0,
        ProcessingFailure = 1,
        UsageError = 2,
    };

    // Neither storage nor output is owned. Dry-run documents and tool
    // listings are written to output as UTF-8.
    CommandRunner(DocumentStorage *storage, QIODevice *output);

    void setConcurrency(int threads) { m_concurrency = qMax(1, threads); }
    int concurrency() const { return m_concurrency; }

    int generate(const SectionManifest &manifest, LinkFormat linkFormat,
                 const QStringList &destinations, bool dryRun);
    int migrate(const QString &toolName, const QStringList &destinations, bool dryRun);
    int listTools();

private:
    using Task = std::function<bool(const QString &destination)>;

    // Runs task for every destination; false when any of them failed.
    bool runAll(const QStringList &destinations, const Task &task);
    void printDocument(const QString &destination, const Content &document, bool withHeader);

    DocumentStorage *m_storage;
    QIODevice *m_output;
    DestinationLockRegistry m_locks;
    SectionWriter m_writer;
    QMutex m_outputMutex;
    int m_concurrency = 1;
};

#endif // DOKUMENTOR_COMMANDRUNNER_H
