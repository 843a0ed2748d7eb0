/*
 * testhelpers.h — Conversions shared by the unit tests
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_TESTHELPERS_H
#define DOKUMENTOR_TESTHELPERS_H

#include "content/content.h"

#include <string>

inline Content md(const char *utf8)
{
    return Content(QString::fromUtf8(utf8));
}

inline std::string str(const Content &content)
{
    return content.toString().toStdString();
}

inline std::string str(const QString &text)
{
    return text.toStdString();
}

#endif // DOKUMENTOR_TESTHELPERS_H
