/*
 * messagehandler.cpp — Qt message output for the command line
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "messagehandler.h"

#include <QLoggingCategory>
#include <QMutex>

#include <atomic>
#include <cstdio>

namespace {

std::atomic<int> s_format{static_cast<int>(MessageHandler::Format::Text)};

QString textLevel(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return QStringLiteral("debug");
    case QtInfoMsg:     return QStringLiteral("info");
    case QtWarningMsg:  return QStringLiteral("warning");
    case QtCriticalMsg: return QStringLiteral("error");
    case QtFatalMsg:    return QStringLiteral("fatal");
    }
    return QStringLiteral("info");
}

QString workflowCommand(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return QStringLiteral("debug");
    case QtInfoMsg:     return QStringLiteral("notice");
    case QtWarningMsg:  return QStringLiteral("warning");
    case QtCriticalMsg:
    case QtFatalMsg:    return QStringLiteral("error");
    }
    return QStringLiteral("notice");
}

// Workflow command data must stay on one line.
QString escapeWorkflowData(const QString &message)
{
    QString escaped = message;
    escaped.replace(QLatin1Char('%'), QLatin1String("%25"));
    escaped.replace(QLatin1Char('\r'), QLatin1String("%0D"));
    escaped.replace(QLatin1Char('\n'), QLatin1String("%0A"));
    return escaped;
}

void handleMessage(QtMsgType type, const QMessageLogContext &, const QString &message)
{
    static QMutex mutex;
    const auto format = static_cast<MessageHandler::Format>(s_format.load());
    const QByteArray line = MessageHandler::formatMessage(format, type, message).toLocal8Bit();

    QMutexLocker locker(&mutex);
    std::fprintf(stderr, "%s\n", line.constData());
    std::fflush(stderr);
}

} // anonymous namespace

namespace MessageHandler {

QString formatName(Format format)
{
    switch (format) {
    case Format::Text:         return QStringLiteral("text");
    case Format::GitHubAction: return QStringLiteral("github-action");
    }
    return QStringLiteral("text");
}

std::optional<Format> formatFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("text"))
        return Format::Text;
    if (key == QLatin1String("github-action"))
        return Format::GitHubAction;
    return std::nullopt;
}

QString formatMessage(Format format, QtMsgType type, const QString &message)
{
    if (format == Format::GitHubAction)
        return QStringLiteral("::%1::%2").arg(workflowCommand(type), escapeWorkflowData(message));
    return QStringLiteral("%1: %2").arg(textLevel(type), message);
}

void install(Format format, bool verbose)
{
    s_format.store(static_cast<int>(format));
    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("*.debug=true")
                                             : QStringLiteral("*.debug=false"));
    qInstallMessageHandler(handleMessage);
}

} // namespace MessageHandler
