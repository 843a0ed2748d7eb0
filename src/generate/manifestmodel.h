/*
 * manifestmodel.h — Section manifest block types (header-only, std::variant)
 *
 * The intermediate representation between the JSON section manifest and
 * Markdown rendering. Text fields hold raw text; escaping happens when a
 * block is rendered.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MANIFESTMODEL_H
#define DOKUMENTOR_MANIFESTMODEL_H

#include "section/sectionidentifier.h"

#include <QList>
#include <QString>
#include <QStringList>

#include <variant>

namespace Manifest {

struct Heading {
    QString text;
    int level = 2;
};

struct Paragraph {
    QString text;
};

struct Code {
    QString text;
    QString language;
};

struct InlineCode {
    QString text;
};

struct List {
    QStringList items;
    bool ordered = false;
};

struct Table {
    QStringList headers;
    QList<QStringList> rows;
};

struct Badge {
    QString label;
    QString image;   // badge image URL
    QString url;     // optional link target
};

struct Badges {
    QList<Badge> badges;
};

struct Center {
    QString text;    // Markdown placed inside <div align="center">
};

// Inserted verbatim.
struct Markdown {
    QString text;
};

// Table of contents over the headings of all other sections.
struct Toc {
    int maxLevel = 3;
};

using Block = std::variant<
    Heading,
    Paragraph,
    Code,
    InlineCode,
    List,
    Table,
    Badges,
    Center,
    Markdown,
    Toc
>;

struct Section {
    SectionIdentifier id = SectionIdentifier::Header;
    QList<Block> blocks;
};

} // namespace Manifest

#endif // DOKUMENTOR_MANIFESTMODEL_H
