/*
 * documentstorage.h — Byte-stream boundary for reading and writing documents
 *
 * Destinations are plain strings interpreted by the implementation (a file
 * path, a key in memory). destinationKey() maps a destination to the
 * identity used to serialize concurrent writers.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_DOCUMENTSTORAGE_H
#define DOKUMENTOR_DOCUMENTSTORAGE_H

#include "content/content.h"

#include <QIODevice>
#include <QString>

#include <memory>
#include <optional>

class DocumentStorage
{
public:
    virtual ~DocumentStorage() = default;

    virtual bool exists(const QString &destination) const = 0;

    // Device opened for reading, or nullptr when the destination cannot be read.
    virtual std::unique_ptr<QIODevice> open(const QString &destination,
                                            QString *errorMessage = nullptr) const = 0;

    // Replace the whole destination with content.
    virtual bool write(const QString &destination, const Content &content,
                       QString *errorMessage = nullptr) = 0;

    virtual QString destinationKey(const QString &destination) const = 0;

    // Whole document as UTF-8 decoded content; empty when the destination
    // does not exist, nullopt on read or decoding failure.
    std::optional<Content> read(const QString &destination, QString *errorMessage = nullptr) const;
};

#endif // DOKUMENTOR_DOCUMENTSTORAGE_H
