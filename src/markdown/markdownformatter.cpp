/*
 * markdownformatter.cpp — Markdown rendering primitives for documentation sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownformatter.h"
#include "codefence.h"
#include "section/sectionmarkers.h"

#include <QRegularExpression>

namespace {

const Content &newLine()
{
    static const Content nl(QStringLiteral("\n"));
    return nl;
}

bool looksLikeInlineMarkdownLink(const Content &content)
{
    static const QRegularExpression re(QStringLiteral(R"(^\s*!?\[[^\]]*\]\([^)]*\)\s*$)"));
    return content.test(re);
}

} // anonymous namespace

MarkdownFormatter::MarkdownFormatter(LinkFormat linkFormat)
    : m_linkFormat(linkFormat)
{
}

Content MarkdownFormatter::heading(const Content &content, int level) const
{
    Content::Builder builder;
    builder.appendRepeated(QLatin1Char('#'), qBound(1, level, 6))
        .append(Content::kSpace)
        .append(content)
        .append(Content::kNewLine);
    return builder.build();
}

Content MarkdownFormatter::paragraph(const Content &content) const
{
    const Content linked = LinkTransformer::transformUrls(content, m_linkFormat);
    return indentListContinuations(linked).append(newLine());
}

Content MarkdownFormatter::bold(const Content &content) const
{
    Content::Builder builder;
    builder.append(QLatin1StringView("**"))
        .append(content.escape(u"*"))
        .append(QLatin1StringView("**"));
    return builder.build();
}

Content MarkdownFormatter::italic(const Content &content) const
{
    Content::Builder builder;
    builder.append(QLatin1Char('*')).append(content.escape(u"*")).append(QLatin1Char('*'));
    return builder.build();
}

Content MarkdownFormatter::code(const Content &content, const Content &language) const
{
    return CodeFence::codeBlock(content, language);
}

Content MarkdownFormatter::inlineCode(const Content &content) const
{
    if (content.isMultiLine())
        return CodeFence::codeBlock(content);
    return CodeFence::inlineCode(content);
}

Content MarkdownFormatter::link(const Content &text, const Content &url) const
{
    // Pre-rendered badges and images are kept intact as link text.
    const Content label = looksLikeInlineMarkdownLink(text) ? text : text.escape(u"[]");
    Content::Builder builder;
    builder.append(QLatin1Char('['))
        .append(label)
        .append(QLatin1StringView("]("))
        .append(url.escape(u")"))
        .append(QLatin1Char(')'));
    return builder.build();
}

Content MarkdownFormatter::image(const Content &url, const Content &altText,
                                 const ImageOptions &options) const
{
    Content::Builder builder;
    if (options.width.isEmpty() && options.align.isEmpty()) {
        builder.append(QLatin1StringView("!["))
            .append(altText.escape(u"[]"))
            .append(QLatin1StringView("]("))
            .append(url.escape(u"[]"))
            .append(QLatin1Char(')'));
        return builder.build();
    }

    builder.append(QLatin1StringView("<img src=\"")).append(url.htmlEscape()).append(QLatin1Char('"'));
    if (!options.width.isEmpty())
        builder.append(QStringLiteral(" width=\"%1\"").arg(options.width.toHtmlEscaped()));
    if (!options.align.isEmpty())
        builder.append(QStringLiteral(" align=\"%1\"").arg(options.align.toHtmlEscaped()));
    builder.append(QLatin1StringView(" alt=\""))
        .append(altText.escape(u"[]").htmlEscape())
        .append(QLatin1StringView("\" />"));
    return builder.build();
}

Content MarkdownFormatter::badge(const Content &label, const Content &url) const
{
    Content::Builder builder;
    builder.append(QLatin1StringView("!["))
        .append(label.escape(u"*)"))
        .append(QLatin1StringView("]("))
        .append(url.escape(u"*)"))
        .append(QLatin1Char(')'));
    return builder.build();
}

Content MarkdownFormatter::list(const QList<Content> &items, bool ordered) const
{
    Content::Builder builder;
    for (qsizetype i = 0; i < items.size(); ++i) {
        if (ordered)
            builder.append(QStringLiteral("%1. ").arg(i + 1));
        else
            builder.append(QLatin1StringView("- "));
        builder.append(items.at(i)).append(Content::kNewLine);
    }
    return builder.build();
}

TableLayout::Result MarkdownFormatter::table(const QList<Content> &headers,
                                             const QList<QList<Content>> &rows) const
{
    return TableLayout::render({headers, rows});
}

Content MarkdownFormatter::horizontalRule() const
{
    return Content(QStringLiteral("---\n"));
}

Content MarkdownFormatter::lineBreak() const
{
    return newLine();
}

Content MarkdownFormatter::center(const Content &content) const
{
    const Content trimmed = content.trim();
    Content::Builder builder;
    builder.append(QLatin1StringView("<div align=\"center\">\n"));
    if (!trimmed.isEmpty()) {
        for (const Content &line : trimmed.splitLines()) {
            if (line.trim().isEmpty())
                continue;
            builder.append(QLatin1StringView("  ")).append(line.trim()).append(Content::kNewLine);
        }
    }
    builder.append(QLatin1StringView("</div>\n"));
    return builder.build();
}

Content MarkdownFormatter::comment(const Content &content) const
{
    Content::Builder builder;
    builder.append(QLatin1StringView("<!-- "))
        .append(content.trim().htmlEscape())
        .append(QLatin1StringView(" -->\n"));
    return builder.build();
}

Content MarkdownFormatter::section(SectionIdentifier id, const Content &content) const
{
    return SectionMarkers::section(id, content);
}

Content MarkdownFormatter::sectionStart(SectionIdentifier id) const
{
    return SectionMarkers::start(id);
}

Content MarkdownFormatter::sectionEnd(SectionIdentifier id) const
{
    return SectionMarkers::end(id);
}

// Lazy continuation lines of a list item are indented so they stay inside
// the item. Fenced code is copied untouched.
Content MarkdownFormatter::indentListContinuations(const Content &content) const
{
    if (content.isEmpty())
        return content;

    static const QRegularExpression unorderedRe(QStringLiteral(R"(^[-*+]\s+)"));
    static const QRegularExpression orderedRe(QStringLiteral(R"(^\d+\.\s+)"));

    Content::Builder builder;
    bool inList = false;
    CodeFence::FenceTracker fences;
    const QList<Content> lines = content.splitLines();
    for (qsizetype i = 0; i < lines.size(); ++i) {
        const Content &line = lines.at(i);
        const Content trimmed = line.trimStart();
        if (i > 0)
            builder.append(Content::kNewLine);

        if (fences.consume(trimmed)) {
            builder.append(line);
            continue;
        }
        if (trimmed.test(unorderedRe) || trimmed.test(orderedRe)) {
            inList = true;
            builder.append(line);
            continue;
        }
        if (inList) {
            if (trimmed.isEmpty()) {
                inList = false;
            } else if (!line.startsWith(u" ") && !line.startsWith(u"\t")) {
                builder.append(QLatin1StringView("  "));
            }
        }
        builder.append(line);
    }
    return builder.build();
}
