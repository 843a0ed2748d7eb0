/*
 * dokumentorconfig.h — Project configuration file (.dokumentorrc)
 *
 * INI file read through KConfig. Missing files and keys fall back to the
 * defaults below; invalid values are reported with qWarning and replaced
 * by the default.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_DOKUMENTORCONFIG_H
#define DOKUMENTOR_DOKUMENTORCONFIG_H

#include "cli/messagehandler.h"
#include "markdown/linktransformer.h"

#include <QString>

class DokumentorConfig
{
public:
    static constexpr int kDefaultConcurrency = 5;

    static QString defaultPath();

    DokumentorConfig() = default;

    // Reads path, relative to the working directory.
    void load(const QString &path);

    const QString &path() const { return m_path; }

    MessageHandler::Format logFormat() const { return m_logFormat; }
    int concurrency() const { return m_concurrency; }
    LinkFormat linkFormat() const { return m_linkFormat; }
    const QString &generateDestination() const { return m_generateDestination; }
    const QString &migrateTool() const { return m_migrateTool; }
    const QString &migrateDestination() const { return m_migrateDestination; }

private:
    QString m_path;
    MessageHandler::Format m_logFormat = MessageHandler::Format::Text;
    int m_concurrency = kDefaultConcurrency;
    LinkFormat m_linkFormat = LinkFormat::Auto;
    QString m_generateDestination = QStringLiteral("README.md");
    QString m_migrateTool;
    QString m_migrateDestination = QStringLiteral("README.md");
};

#endif // DOKUMENTOR_DOKUMENTORCONFIG_H
