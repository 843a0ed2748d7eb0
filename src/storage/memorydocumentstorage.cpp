/*
 * memorydocumentstorage.cpp — Documents held in memory
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "memorydocumentstorage.h"

#include <QBuffer>
#include <QMutexLocker>
#include <QObject>

bool MemoryDocumentStorage::exists(const QString &destination) const
{
    QMutexLocker lock(&m_mutex);
    return m_documents.contains(destination);
}

std::unique_ptr<QIODevice> MemoryDocumentStorage::open(const QString &destination,
                                                       QString *errorMessage) const
{
    QMutexLocker lock(&m_mutex);
    const auto it = m_documents.constFind(destination);
    if (it == m_documents.constEnd()) {
        if (errorMessage)
            *errorMessage = QObject::tr("No document named %1").arg(destination);
        return nullptr;
    }

    auto buffer = std::make_unique<QBuffer>();
    buffer->setData(it.value());
    buffer->open(QIODevice::ReadOnly);
    return buffer;
}

bool MemoryDocumentStorage::write(const QString &destination, const Content &content, QString *)
{
    QMutexLocker lock(&m_mutex);
    m_documents.insert(destination, content.toUtf8());
    ++m_writeCount;
    return true;
}

QString MemoryDocumentStorage::destinationKey(const QString &destination) const
{
    return destination;
}

void MemoryDocumentStorage::setDocument(const QString &destination, const QByteArray &bytes)
{
    QMutexLocker lock(&m_mutex);
    m_documents.insert(destination, bytes);
}

QByteArray MemoryDocumentStorage::document(const QString &destination) const
{
    QMutexLocker lock(&m_mutex);
    return m_documents.value(destination);
}

int MemoryDocumentStorage::writeCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_writeCount;
}
