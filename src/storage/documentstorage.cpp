/*
 * documentstorage.cpp — Byte-stream boundary for reading and writing documents
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentstorage.h"

#include <QObject>
#include <QStringDecoder>

std::optional<Content> DocumentStorage::read(const QString &destination, QString *errorMessage) const
{
    if (!exists(destination))
        return Content();

    std::unique_ptr<QIODevice> device = open(destination, errorMessage);
    if (!device)
        return std::nullopt;

    const QByteArray bytes = device->readAll();
    QStringDecoder decoder(QStringDecoder::Utf8, QStringConverter::Flag::Stateless);
    const QString text = decoder.decode(bytes);
    if (decoder.hasError()) {
        if (errorMessage)
            *errorMessage = QObject::tr("%1 is not valid UTF-8").arg(destination);
        return std::nullopt;
    }
    return Content(text);
}
