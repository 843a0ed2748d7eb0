/*
 * dokumentorconfig.cpp — Project configuration file (.dokumentorrc)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "dokumentorconfig.h"

#include <KConfig>
#include <KConfigGroup>

#include <QDebug>
#include <QFileInfo>

QString DokumentorConfig::defaultPath()
{
    return QStringLiteral(".dokumentorrc");
}

void DokumentorConfig::load(const QString &path)
{
    // KConfig resolves relative names against the user config directory.
    m_path = QFileInfo(path).absoluteFilePath();
    KConfig config(m_path, KConfig::SimpleConfig);

    const KConfigGroup general = config.group(QStringLiteral("General"));
    const QString logFormat = general.readEntry("LogFormat", MessageHandler::formatName(m_logFormat));
    if (const auto format = MessageHandler::formatFromName(logFormat))
        m_logFormat = *format;
    else
        qWarning() << "DokumentorConfig: unknown LogFormat" << logFormat << "in" << m_path;

    const int concurrency = general.readEntry("Concurrency", m_concurrency);
    if (concurrency < 1)
        qWarning() << "DokumentorConfig: Concurrency must be at least 1, got" << concurrency;
    m_concurrency = qMax(1, concurrency);

    const KConfigGroup generate = config.group(QStringLiteral("Generate"));
    const QString linkFormat = generate.readEntry("LinkFormat", LinkTransformer::linkFormatName(m_linkFormat));
    if (const auto format = LinkTransformer::linkFormatFromName(linkFormat))
        m_linkFormat = *format;
    else
        qWarning() << "DokumentorConfig: unknown LinkFormat" << linkFormat << "in" << m_path;
    m_generateDestination = generate.readEntry("Destination", m_generateDestination);

    const KConfigGroup migrate = config.group(QStringLiteral("Migrate"));
    m_migrateTool = migrate.readEntry("Tool", m_migrateTool);
    m_migrateDestination = migrate.readEntry("Destination", m_migrateDestination);
}
