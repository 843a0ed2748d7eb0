/*
 * filedocumentstorage.h — Documents on the local file system
 *
 * Writes go through QSaveFile so a failed write never leaves a truncated
 * document behind.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_FILEDOCUMENTSTORAGE_H
#define DOKUMENTOR_FILEDOCUMENTSTORAGE_H

#include "storage/documentstorage.h"

class FileDocumentStorage : public DocumentStorage
{
public:
    bool exists(const QString &destination) const override;
    std::unique_ptr<QIODevice> open(const QString &destination,
                                    QString *errorMessage = nullptr) const override;
    bool write(const QString &destination, const Content &content,
               QString *errorMessage = nullptr) override;
    QString destinationKey(const QString &destination) const override;
};

#endif // DOKUMENTOR_FILEDOCUMENTSTORAGE_H
