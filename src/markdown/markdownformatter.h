/*
 * markdownformatter.h — Markdown rendering primitives for documentation sections
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_MARKDOWNFORMATTER_H
#define DOKUMENTOR_MARKDOWNFORMATTER_H

#include "content/content.h"
#include "markdown/linktransformer.h"
#include "markdown/tablelayout.h"
#include "section/sectionidentifier.h"

#include <QList>
#include <QString>

class MarkdownFormatter
{
public:
    struct ImageOptions {
        QString width;
        QString align;
    };

    MarkdownFormatter() = default;
    explicit MarkdownFormatter(LinkFormat linkFormat);

    LinkFormat linkFormat() const { return m_linkFormat; }
    void setLinkFormat(LinkFormat format) { m_linkFormat = format; }

    Content heading(const Content &content, int level = 1) const;
    Content paragraph(const Content &content) const;
    Content bold(const Content &content) const;
    Content italic(const Content &content) const;
    Content code(const Content &content, const Content &language = Content()) const;
    Content inlineCode(const Content &content) const;
    Content link(const Content &text, const Content &url) const;
    Content image(const Content &url, const Content &altText,
                  const ImageOptions &options = {}) const;
    Content badge(const Content &label, const Content &url) const;
    Content list(const QList<Content> &items, bool ordered = false) const;
    TableLayout::Result table(const QList<Content> &headers,
                              const QList<QList<Content>> &rows) const;
    Content horizontalRule() const;
    Content lineBreak() const;
    Content center(const Content &content) const;
    Content comment(const Content &content) const;

    Content section(SectionIdentifier id, const Content &content) const;
    Content sectionStart(SectionIdentifier id) const;
    Content sectionEnd(SectionIdentifier id) const;

private:
    Content indentListContinuations(const Content &content) const;

    LinkFormat m_linkFormat = LinkFormat::Auto;
};

#endif // DOKUMENTOR_MARKDOWNFORMATTER_H
