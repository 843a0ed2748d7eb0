/*
 * sectionwriter.cpp — Write sections into destination documents
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionwriter.h"
#include "destinationlockregistry.h"
#include "sectionmarkers.h"
#include "storage/documentstorage.h"

#include <QDebug>
#include <QIODevice>

SectionWriter::SectionWriter(DocumentStorage *storage, DestinationLockRegistry *locks)
    : m_storage(storage)
    , m_locks(locks)
{
}

bool SectionWriter::writeSection(const QString &destination, SectionIdentifier id,
                                 const Content &body, QString *errorMessage)
{
    return writeSections(destination, {qMakePair(id, body)}, errorMessage);
}

bool SectionWriter::writeSections(const QString &destination,
                                  const QList<QPair<SectionIdentifier, Content>> &sections,
                                  QString *errorMessage)
{
    const DestinationLockRegistry::Lock lock = m_locks->acquire(m_storage->destinationKey(destination));

    const std::optional<Content> current = m_storage->read(destination, errorMessage);
    if (!current)
        return false;

    Content document = *current;
    for (const auto &section : sections) {
        qDebug() << "SectionWriter: writing" << SectionIdentifiers::name(section.first)
                 << "to" << destination;
        document = SectionMarkers::applySection(document, section.first, section.second);
    }
    return m_storage->write(destination, document, errorMessage);
}

bool SectionWriter::replaceContent(const QString &destination, const Content &content,
                                   QString *errorMessage)
{
    const DestinationLockRegistry::Lock lock = m_locks->acquire(m_storage->destinationKey(destination));
    qDebug() << "SectionWriter: replacing content of" << destination;
    return m_storage->write(destination, content, errorMessage);
}

bool SectionWriter::rewrite(const QString &destination, const Rewriter &rewriter,
                            QString *errorMessage)
{
    const DestinationLockRegistry::Lock lock = m_locks->acquire(m_storage->destinationKey(destination));

    std::unique_ptr<QIODevice> source = m_storage->open(destination, errorMessage);
    if (!source)
        return false;

    const std::optional<Content> content = rewriter(source.get(), errorMessage);
    source.reset();
    if (!content)
        return false;
    return m_storage->write(destination, *content, errorMessage);
}
