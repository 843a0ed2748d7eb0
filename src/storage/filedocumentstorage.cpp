/*
 * filedocumentstorage.cpp — Documents on the local file system
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "filedocumentstorage.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QSaveFile>

bool FileDocumentStorage::exists(const QString &destination) const
{
    return QFileInfo(destination).isFile();
}

std::unique_ptr<QIODevice> FileDocumentStorage::open(const QString &destination,
                                                     QString *errorMessage) const
{
    auto file = std::make_unique<QFile>(destination);
    if (!file->open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = QObject::tr("Cannot open %1: %2").arg(destination, file->errorString());
        return nullptr;
    }
    return file;
}

bool FileDocumentStorage::write(const QString &destination, const Content &content,
                                QString *errorMessage)
{
    const QFileInfo info(destination);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage)
            *errorMessage = QObject::tr("Cannot create directory %1").arg(info.absolutePath());
        return false;
    }

    QSaveFile file(destination);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage)
            *errorMessage = QObject::tr("Cannot write %1: %2").arg(destination, file.errorString());
        return false;
    }

    const QByteArray bytes = content.toUtf8();
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (errorMessage)
            *errorMessage = QObject::tr("Cannot write %1: %2").arg(destination, file.errorString());
        return false;
    }
    return true;
}

QString FileDocumentStorage::destinationKey(const QString &destination) const
{
    return QDir::cleanPath(QFileInfo(destination).absoluteFilePath());
}
