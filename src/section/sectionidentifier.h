/*
 * sectionidentifier.h — Named documentation sections in canonical order
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_SECTIONIDENTIFIER_H
#define DOKUMENTOR_SECTIONIDENTIFIER_H

#include <QList>
#include <QString>
#include <QStringView>

#include <optional>

// Declaration order is the canonical document order.
enum class SectionIdentifier {
    Header,
    Badges,
    Overview,
    Contents,
    Usage,
    Inputs,
    Outputs,
    Secrets,
    Examples,
    Contributing,
    Security,
    License,
    Generated,
};

namespace SectionIdentifiers {

const QList<SectionIdentifier> &all();

QString name(SectionIdentifier id);

// Case-insensitive, surrounding whitespace ignored.
std::optional<SectionIdentifier> fromName(QStringView name);

} // namespace SectionIdentifiers

#endif // DOKUMENTOR_SECTIONIDENTIFIER_H
