/*
 * memorydocumentstorage.h — Documents held in memory
 *
 * Used for dry runs and tests. Thread-safe.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MEMORYDOCUMENTSTORAGE_H
#define DOKUMENTOR_MEMORYDOCUMENTSTORAGE_H

#include "storage/documentstorage.h"

#include <QByteArray>
#include <QHash>
#include <QMutex>

class MemoryDocumentStorage : public DocumentStorage
{
public:
    bool exists(const QString &destination) const override;
    std::unique_ptr<QIODevice> open(const QString &destination,
                                    QString *errorMessage = nullptr) const override;
    bool write(const QString &destination, const Content &content,
               QString *errorMessage = nullptr) override;
    QString destinationKey(const QString &destination) const override;

    void setDocument(const QString &destination, const QByteArray &bytes);
    QByteArray document(const QString &destination) const;
    int writeCount() const;

private:
    mutable QMutex m_mutex;
    QHash<QString, QByteArray> m_documents;
    int m_writeCount = 0;
};

#endif // DOKUMENTOR_MEMORYDOCUMENTSTORAGE_H
