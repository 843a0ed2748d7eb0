/*
 * commandrunner.cpp — Runs generate and migrate over a set of destinations
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "commandrunner.h"
#include "generate/documentationgenerator.h"
#include "migration/migrationservice.h"

#include <QAtomicInt>
#include <QDebug>
#include <QIODevice>
#include <QThreadPool>

CommandRunner::CommandRunner(DocumentStorage *storage, QIODevice *output)
    : m_storage(storage)
    , m_output(output)
    , m_writer(storage, &m_locks)
{
}

bool CommandRunner::runAll(const QStringList &destinations, const Task &task)
{
    QAtomicInt failures(0);
    QThreadPool pool;
    pool.setMaxThreadCount(m_concurrency);
    for (const QString &destination : destinations) {
        pool.start([&task, &failures, destination]() {
            if (!task(destination))
                failures.fetchAndAddOrdered(1);
        });
    }
    pool.waitForDone();
    return failures.loadAcquire() == 0;
}

void CommandRunner::printDocument(const QString &destination, const Content &document,
                                  bool withHeader)
{
    QMutexLocker locker(&m_outputMutex);
    if (withHeader)
        m_output->write(QStringLiteral("==> %1 <==\n").arg(destination).toUtf8());
    m_output->write(document.toUtf8());
}

int CommandRunner::generate(const SectionManifest &manifest, LinkFormat linkFormat,
                            const QStringList &destinations, bool dryRun)
{
    if (destinations.isEmpty()) {
        qCritical() << "CommandRunner: no destination given";
        return UsageError;
    }

    DocumentationGenerator generator(&m_writer);
    generator.setLinkFormat(linkFormat);
    const bool withHeader = destinations.size() > 1;

    const bool ok = runAll(destinations, [&](const QString &destination) {
        const DocumentationGenerator::Result result = generator.generate(destination, manifest, dryRun);
        if (!result.valid) {
            qCritical().noquote() << QStringLiteral("%1: %2").arg(destination, result.errorMessage);
            return false;
        }
        if (dryRun)
            printDocument(destination, result.document, withHeader);
        else
            qInfo().noquote() << QStringLiteral("Updated %1 section(s) in %2")
                                     .arg(result.sections.size())
                                     .arg(destination);
        return true;
    });
    return ok ? Success : ProcessingFailure;
}

int CommandRunner::migrate(const QString &toolName, const QStringList &destinations, bool dryRun)
{
    if (destinations.isEmpty()) {
        qCritical() << "CommandRunner: no destination given";
        return UsageError;
    }

    MigrationService service(&m_writer);
    if (!toolName.isEmpty() && !service.tool(toolName)) {
        qCritical().noquote() << QStringLiteral("Unknown migration tool \"%1\"; available: %2")
                                     .arg(toolName, service.toolNames().join(QStringLiteral(", ")));
        return UsageError;
    }
    const bool withHeader = destinations.size() > 1;

    const bool ok = runAll(destinations, [&](const QString &destination) {
        const MigrationService::Result result = service.migrate(destination, toolName, dryRun);
        if (!result.valid) {
            qCritical().noquote() << QStringLiteral("%1: %2").arg(destination, result.errorMessage);
            return false;
        }
        if (dryRun)
            printDocument(destination, result.content, withHeader);
        return true;
    });
    return ok ? Success : ProcessingFailure;
}

int CommandRunner::listTools()
{
    MigrationService service(&m_writer);
    QMutexLocker locker(&m_outputMutex);
    for (const QString &name : service.toolNames())
        m_output->write(name.toUtf8() + '\n');
    return Success;
}
