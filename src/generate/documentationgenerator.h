/*
 * documentationgenerator.h — Render a section manifest into a destination
 *
 * Each manifest section is rendered to Markdown through MarkdownFormatter
 * and written between its markers with SectionWriter. Table of contents
 * blocks are filled from the headings of every other section.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_DOCUMENTATIONGENERATOR_H
#define DOKUMENTOR_DOCUMENTATIONGENERATOR_H

#include "content/content.h"
#include "generate/sectionmanifest.h"
#include "markdown/headingcollector.h"
#include "markdown/markdownformatter.h"

#include <QList>
#include <QPair>
#include <QString>

#include <optional>

class SectionWriter;

class DocumentationGenerator
{
public:
    struct Result {
        Content document;                 // resulting document (dry run only)
        QList<SectionIdentifier> sections; // sections written, canonical order
        bool valid = true;
        QString errorMessage;
    };

    // writer is not owned.
    explicit DocumentationGenerator(SectionWriter *writer);

    const MarkdownFormatter &formatter() const { return m_formatter; }
    void setLinkFormat(LinkFormat format) { m_formatter.setLinkFormat(format); }

    // Section bodies in canonical order, or nullopt when a block fails to render.
    std::optional<QList<QPair<SectionIdentifier, Content>>>
    renderSections(const SectionManifest &manifest, QString *errorMessage = nullptr) const;

    Result generate(const QString &destination, const SectionManifest &manifest,
                    bool dryRun = false) const;

private:
    std::optional<Content> renderBlock(const Manifest::Block &block,
                                       const QList<HeadingCollector::Heading> &outline,
                                       QString *errorMessage) const;
    Content renderToc(const Manifest::Toc &toc,
                      const QList<HeadingCollector::Heading> &outline) const;

    SectionWriter *m_writer;
    MarkdownFormatter m_formatter;
};

#endif // DOKUMENTOR_DOCUMENTATIONGENERATOR_H
