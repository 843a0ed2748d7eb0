/*
 * sectionmanifest.h — JSON description of documentation sections
 *
 *   { "sections": [ { "id": "inputs", "blocks": [
 *       { "heading": "Inputs", "level": 2 },
 *       { "table": { "headers": ["Name"], "rows": [["token"]] } } ] } ] }
 *
 * Each block object carries exactly one kind key: heading, paragraph, code,
 * inlineCode, list, table, badges, center, markdown or toc.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_SECTIONMANIFEST_H
#define DOKUMENTOR_SECTIONMANIFEST_H

#include "generate/manifestmodel.h"

#include <QByteArray>
#include <QList>
#include <QString>

class SectionManifest
{
public:
    struct Result;

    static Result parse(const QByteArray &json);
    static Result load(const QString &filePath);

    // Sections in canonical order.
    const QList<Manifest::Section> &sections() const { return m_sections; }
    bool contains(SectionIdentifier id) const;

private:
    QList<Manifest::Section> m_sections;
};

struct SectionManifest::Result {
    SectionManifest manifest;
    bool valid = true;
    QString errorMessage;
};

#endif // DOKUMENTOR_SECTIONMANIFEST_H
