/*
 * messagehandler.h — Qt message output for the command line
 *
 * Text output writes "level: message" lines to stderr. GitHub Action output
 * writes workflow commands so messages show up as annotations.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MESSAGEHANDLER_H
#define DOKUMENTOR_MESSAGEHANDLER_H

#include <QString>
#include <QtGlobal>

#include <optional>

namespace MessageHandler {

enum class Format {
    Text,
    GitHubAction,
};

QString formatName(Format format);
std::optional<Format> formatFromName(const QString &name);

// One output line, without the trailing newline.
QString formatMessage(Format format, QtMsgType type, const QString &message);

// Installs the handler for the whole process. Debug messages are filtered
// out unless verbose is set.
void install(Format format, bool verbose);

} // namespace MessageHandler

#endif // DOKUMENTOR_MESSAGEHANDLER_H
