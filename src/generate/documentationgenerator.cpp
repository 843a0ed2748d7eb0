/*
 * documentationgenerator.cpp — Render a section manifest into a destination
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentationgenerator.h"
#include "section/sectionmarkers.h"
#include "section/sectionwriter.h"
#include "storage/documentstorage.h"

#include <QDebug>
#include <QObject>

#include <type_traits>
#include <variant>

namespace {

QList<Content> toContents(const QStringList &strings)
{
    QList<Content> contents;
    contents.reserve(strings.size());
    for (const QString &s : strings)
        contents.append(Content(s));
    return contents;
}

bool hasToc(const Manifest::Section &section)
{
    for (const Manifest::Block &block : section.blocks) {
        if (std::holds_alternative<Manifest::Toc>(block))
            return true;
    }
    return false;
}

} // anonymous namespace

DocumentationGenerator::DocumentationGenerator(SectionWriter *writer)
    : m_writer(writer)
{
}

std::optional<Content>
DocumentationGenerator::renderBlock(const Manifest::Block &block,
                                    const QList<HeadingCollector::Heading> &outline,
                                    QString *errorMessage) const
{
    std::optional<Content> rendered;
    std::visit([&](const auto &b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Manifest::Heading>) {
            rendered = m_formatter.heading(Content(b.text), b.level);
        } else if constexpr (std::is_same_v<T, Manifest::Paragraph>) {
            rendered = m_formatter.paragraph(Content(b.text));
        } else if constexpr (std::is_same_v<T, Manifest::Code>) {
            rendered = m_formatter.code(Content(b.text), Content(b.language));
        } else if constexpr (std::is_same_v<T, Manifest::InlineCode>) {
            rendered = m_formatter.inlineCode(Content(b.text));
        } else if constexpr (std::is_same_v<T, Manifest::List>) {
            rendered = m_formatter.list(toContents(b.items), b.ordered);
        } else if constexpr (std::is_same_v<T, Manifest::Table>) {
            QList<QList<Content>> rows;
            for (const QStringList &row : b.rows)
                rows.append(toContents(row));
            const TableLayout::Result table = m_formatter.table(toContents(b.headers), rows);
            if (table.valid)
                rendered = table.markdown;
            else if (errorMessage)
                *errorMessage = table.errorMessage;
        } else if constexpr (std::is_same_v<T, Manifest::Badges>) {
            Content::Builder builder;
            for (const Manifest::Badge &badge : b.badges) {
                if (!builder.isEmpty())
                    builder.append(Content::kSpace);
                const Content image = m_formatter.badge(Content(badge.label), Content(badge.image));
                builder.append(badge.url.isEmpty() ? image : m_formatter.link(image, Content(badge.url)));
            }
            builder.append(Content::kNewLine);
            rendered = builder.build();
        } else if constexpr (std::is_same_v<T, Manifest::Center>) {
            rendered = m_formatter.center(Content(b.text));
        } else if constexpr (std::is_same_v<T, Manifest::Markdown>) {
            rendered = Content(b.text);
        } else if constexpr (std::is_same_v<T, Manifest::Toc>) {
            rendered = renderToc(b, outline);
        }
    }, block);
    return rendered;
}

Content DocumentationGenerator::renderToc(const Manifest::Toc &toc,
                                          const QList<HeadingCollector::Heading> &outline) const
{
    Content::Builder builder;
    for (const HeadingCollector::Heading &heading : outline) {
        if (heading.level < 2 || heading.level > toc.maxLevel)
            continue;
        const QString target = QLatin1Char('#') + heading.anchor;
        builder.appendRepeated(Content::kSpace, 2 * (heading.level - 2))
            .append(QLatin1StringView("- "))
            .append(m_formatter.link(Content(heading.text), Content(target)))
            .append(Content::kNewLine);
    }
    return builder.build();
}

std::optional<QList<QPair<SectionIdentifier, Content>>>
DocumentationGenerator::renderSections(const SectionManifest &manifest, QString *errorMessage) const
{
    // Pass 1: everything except tables of contents, which need the outline.
    QList<QPair<SectionIdentifier, Content>> bodies;
    Content::Builder outlineSource;
    for (const Manifest::Section &section : manifest.sections()) {
        Content::Builder body;
        if (!hasToc(section)) {
            for (const Manifest::Block &block : section.blocks) {
                QString error;
                const std::optional<Content> rendered = renderBlock(block, {}, &error);
                if (!rendered) {
                    if (errorMessage)
                        *errorMessage = QObject::tr("Section \"%1\": %2")
                                            .arg(SectionIdentifiers::name(section.id), error);
                    return std::nullopt;
                }
                if (!body.isEmpty())
                    body.append(Content::kNewLine);
                body.append(*rendered);
            }
            outlineSource.append(body.build()).append(Content::kNewLine);
        }
        bodies.append(qMakePair(section.id, body.build()));
    }

    // Pass 2: sections holding a table of contents.
    HeadingCollector collector;
    const QList<HeadingCollector::Heading> outline = collector.collect(outlineSource.build());
    for (qsizetype i = 0; i < manifest.sections().size(); ++i) {
        const Manifest::Section &section = manifest.sections().at(i);
        if (!hasToc(section))
            continue;
        Content::Builder body;
        for (const Manifest::Block &block : section.blocks) {
            QString error;
            const std::optional<Content> rendered = renderBlock(block, outline, &error);
            if (!rendered) {
                if (errorMessage)
                    *errorMessage = QObject::tr("Section \"%1\": %2")
                                        .arg(SectionIdentifiers::name(section.id), error);
                return std::nullopt;
            }
            if (!body.isEmpty())
                body.append(Content::kNewLine);
            body.append(*rendered);
        }
        bodies[i].second = body.build();
    }
    return bodies;
}

DocumentationGenerator::Result DocumentationGenerator::generate(const QString &destination,
                                                                const SectionManifest &manifest,
                                                                bool dryRun) const
{
    Result result;
    const auto bodies = renderSections(manifest, &result.errorMessage);
    if (!bodies) {
        result.valid = false;
        return result;
    }
    for (const auto &section : *bodies)
        result.sections.append(section.first);

    if (dryRun) {
        const std::optional<Content> current = m_writer->storage()->read(destination, &result.errorMessage);
        if (!current) {
            result.valid = false;
            return result;
        }
        Content document = *current;
        for (const auto &section : *bodies)
            document = SectionMarkers::applySection(document, section.first, section.second);
        result.document = document;
        return result;
    }

    qDebug() << "DocumentationGenerator: writing" << bodies->size() << "sections to" << destination;
    if (!m_writer->writeSections(destination, *bodies, &result.errorMessage))
        result.valid = false;
    return result;
}
