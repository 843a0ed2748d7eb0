/*
 * migrationservice.cpp — Tool registry, detection and migration of destinations
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "migrationservice.h"
#include "migrationrewriter.h"
#include "section/sectionwriter.h"
#include "storage/documentstorage.h"

#include <QDebug>
#include <QIODevice>
#include <QObject>
#include <QStringDecoder>

MigrationService::MigrationService(SectionWriter *writer)
    : m_writer(writer)
    , m_tools(MigrationTools::builtins())
    , m_supportedSections(SectionIdentifiers::all())
{
}

void MigrationService::registerTool(const MigrationTool &tool)
{
    for (MigrationTool &existing : m_tools) {
        if (existing.name.compare(tool.name, Qt::CaseInsensitive) == 0) {
            existing = tool;
            return;
        }
    }
    m_tools.append(tool);
}

QStringList MigrationService::toolNames() const
{
    QStringList names;
    for (const MigrationTool &tool : m_tools)
        names.append(tool.name);
    return names;
}

std::optional<MigrationTool> MigrationService::tool(const QString &name) const
{
    for (const MigrationTool &tool : m_tools) {
        if (tool.name.compare(name.trimmed(), Qt::CaseInsensitive) == 0)
            return tool;
    }
    return std::nullopt;
}

void MigrationService::setSupportedSections(const QList<SectionIdentifier> &sections)
{
    m_supportedSections = sections;
}

bool MigrationService::detectionMatches(const MigrationTool &tool, QIODevice *device) const
{
    QStringDecoder decoder(QStringDecoder::Utf8);
    QString window;
    while (true) {
        const QByteArray chunk = device->read(kDetectionChunkSize);
        if (chunk.isEmpty())
            break;
        const QString decoded = decoder.decode(chunk);
        window.append(decoded);
        if (tool.detectionPattern.match(window).hasMatch())
            return true;
        // Keep a tail so markers split across chunks still match.
        if (window.size() > kDetectionWindow)
            window = window.right(kDetectionWindow);
    }
    return false;
}

std::optional<MigrationTool> MigrationService::detect(const QString &destination) const
{
    DocumentStorage *storage = m_writer->storage();
    if (!storage->exists(destination))
        return std::nullopt;

    for (const MigrationTool &tool : m_tools) {
        QString errorMessage;
        std::unique_ptr<QIODevice> device = storage->open(destination, &errorMessage);
        if (!device) {
            qWarning() << "MigrationService:" << errorMessage;
            return std::nullopt;
        }
        if (detectionMatches(tool, device.get())) {
            qDebug() << "MigrationService: detected" << tool.name << "markers in" << destination;
            return tool;
        }
    }
    return std::nullopt;
}

MigrationService::Result MigrationService::migrate(const QString &destination,
                                                   const QString &toolName, bool dryRun) const
{
    Result result;
    const bool autoDetect = toolName.trimmed().isEmpty();

    std::optional<MigrationTool> selected;
    if (!autoDetect) {
        selected = tool(toolName);
        if (!selected) {
            result.valid = false;
            result.errorMessage = QObject::tr("Unknown migration tool: %1").arg(toolName);
            return result;
        }
        result.toolName = selected->name;
    }

    DocumentStorage *storage = m_writer->storage();
    if (!storage->exists(destination)) {
        qInfo() << "MigrationService:" << destination << "does not exist, nothing to migrate";
        return result;
    }

    if (autoDetect) {
        selected = detect(destination);
        if (!selected) {
            result.valid = false;
            result.errorMessage = QObject::tr("No migration tool recognizes the markers in %1")
                                      .arg(destination);
            return result;
        }
        result.toolName = selected->name;
    }

    const MigrationRewriter rewriter(*selected);
    const QList<SectionIdentifier> supported = m_supportedSections;
    auto run = [&rewriter, &supported, &result](QIODevice *source, QString *errorMessage)
        -> std::optional<Content> {
        const MigrationRewriter::Result migrated = rewriter.migrate(source, supported);
        if (!migrated.valid) {
            if (errorMessage)
                *errorMessage = migrated.errorMessage;
            return std::nullopt;
        }
        result.content = migrated.content;
        return migrated.content;
    };

    QString errorMessage;
    bool ok = false;
    if (dryRun) {
        std::unique_ptr<QIODevice> source = storage->open(destination, &errorMessage);
        ok = source && run(source.get(), &errorMessage).has_value();
    } else {
        ok = m_writer->rewrite(destination, run, &errorMessage);
    }

    if (!ok) {
        result.valid = false;
        result.errorMessage = QObject::tr("Cannot migrate %1: %2").arg(destination, errorMessage);
        return result;
    }
    qInfo() << "MigrationService: migrated" << destination << "from" << selected->name;
    return result;
}
