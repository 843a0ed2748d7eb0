/*
 * sectionidentifier.cpp — Named documentation sections in canonical order
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionidentifier.h"

namespace SectionIdentifiers {

const QList<SectionIdentifier> &all()
{
    static const QList<SectionIdentifier> ids = {
        SectionIdentifier::Header,   SectionIdentifier::Badges,       SectionIdentifier::Overview,
        SectionIdentifier::Contents, SectionIdentifier::Usage,        SectionIdentifier::Inputs,
        SectionIdentifier::Outputs,  SectionIdentifier::Secrets,      SectionIdentifier::Examples,
        SectionIdentifier::Contributing, SectionIdentifier::Security, SectionIdentifier::License,
        SectionIdentifier::Generated,
    };
    return ids;
}

QString name(SectionIdentifier id)
{
    switch (id) {
    case SectionIdentifier::Header: return QStringLiteral("header");
    case SectionIdentifier::Badges: return QStringLiteral("badges");
    case SectionIdentifier::Overview: return QStringLiteral("overview");
    case SectionIdentifier::Contents: return QStringLiteral("contents");
    case SectionIdentifier::Usage: return QStringLiteral("usage");
    case SectionIdentifier::Inputs: return QStringLiteral("inputs");
    case SectionIdentifier::Outputs: return QStringLiteral("outputs");
    case SectionIdentifier::Secrets: return QStringLiteral("secrets");
    case SectionIdentifier::Examples: return QStringLiteral("examples");
    case SectionIdentifier::Contributing: return QStringLiteral("contributing");
    case SectionIdentifier::Security: return QStringLiteral("security");
    case SectionIdentifier::License: return QStringLiteral("license");
    case SectionIdentifier::Generated: return QStringLiteral("generated");
    }
    return QString();
}

std::optional<SectionIdentifier> fromName(QStringView name)
{
    const QStringView key = name.trimmed();
    for (const SectionIdentifier id : all()) {
        if (key.compare(SectionIdentifiers::name(id), Qt::CaseInsensitive) == 0)
            return id;
    }
    return std::nullopt;
}

} // namespace SectionIdentifiers
