/*
 * sectionwriter.h — Write sections into destination documents
 *
 * Every read-modify-write cycle on a destination runs under that
 * destination's lock, so concurrent writers to one document are applied in
 * arrival order and none of their sections is lost.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_SECTIONWRITER_H
#define DOKUMENTOR_SECTIONWRITER_H

#include "content/content.h"
#include "section/sectionidentifier.h"

#include <QList>
#include <QPair>
#include <QString>

#include <functional>
#include <optional>

class DestinationLockRegistry;
class DocumentStorage;
class QIODevice;

class SectionWriter
{
public:
    // Produces the new document from a stream over the current one.
    using Rewriter = std::function<std::optional<Content>(QIODevice *source, QString *errorMessage)>;

    // Neither pointer is owned; both must outlive the writer.
    SectionWriter(DocumentStorage *storage, DestinationLockRegistry *locks);

    DocumentStorage *storage() const { return m_storage; }

    bool writeSection(const QString &destination, SectionIdentifier id, const Content &body,
                      QString *errorMessage = nullptr);

    // Apply several sections in one locked cycle, in list order.
    bool writeSections(const QString &destination,
                       const QList<QPair<SectionIdentifier, Content>> &sections,
                       QString *errorMessage = nullptr);

    bool replaceContent(const QString &destination, const Content &content,
                        QString *errorMessage = nullptr);

    // Stream the destination through rewriter and store the result, holding
    // the destination lock for the whole cycle.
    bool rewrite(const QString &destination, const Rewriter &rewriter,
                 QString *errorMessage = nullptr);

private:
    DocumentStorage *m_storage;
    DestinationLockRegistry *m_locks;
};

#endif // DOKUMENTOR_SECTIONWRITER_H
