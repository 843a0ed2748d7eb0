/*
 * linktransformer.cpp — Turn bare URLs in prose into Markdown links
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linktransformer.h"
#include "codefence.h"

#include <QList>
#include <QRegularExpression>

namespace LinkTransformer {

namespace {

struct Range {
    qsizetype start;
    qsizetype end;
};

QList<Range> protectedRanges(const Content &content, const QString &text)
{
    QList<Range> ranges;
    const QList<CodeFence::CodeBlockRange> blocks = CodeFence::findCodeBlocks(content);
    for (const CodeFence::CodeBlockRange &block : blocks)
        ranges.append({block.start, block.end});
    for (const CodeFence::InlineCodeRange &span : CodeFence::findInlineCode(content, blocks))
        ranges.append({span.start, span.end});

    static const QRegularExpression linkRe(
        QStringLiteral(R"(\[([^\]]{0,200})\]\(([^)]{0,500})\))"));
    auto it = linkRe.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        ranges.append({m.capturedStart(), m.capturedEnd()});
    }
    return ranges;
}

bool isProtected(const QList<Range> &ranges, qsizetype position)
{
    for (const Range &range : ranges) {
        if (position >= range.start && position < range.end)
            return true;
    }
    return false;
}

} // anonymous namespace

QString linkFormatName(LinkFormat format)
{
    switch (format) {
    case LinkFormat::Auto: return QStringLiteral("auto");
    case LinkFormat::Full: return QStringLiteral("full");
    case LinkFormat::None: return QStringLiteral("none");
    }
    return QString();
}

std::optional<LinkFormat> linkFormatFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("auto")) return LinkFormat::Auto;
    if (key == QLatin1String("full")) return LinkFormat::Full;
    if (key == QLatin1String("none")) return LinkFormat::None;
    return std::nullopt;
}

Content transformUrls(const Content &content, LinkFormat format)
{
    if (format == LinkFormat::None || content.isEmpty())
        return content;

    static const QRegularExpression urlRe(QStringLiteral(R"(https?://[^\s)\]>]{1,500})"));
    static const QRegularExpression trailingPunctRe(QStringLiteral(R"([.,;!?]{1,5}$)"));

    const Content flat = content.compacted();
    const QString text = flat.toString();
    const QList<Range> ranges = protectedRanges(flat, text);

    Content::Builder builder;
    qsizetype copied = 0;
    auto it = urlRe.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const qsizetype start = m.capturedStart();
        if (isProtected(ranges, start))
            continue;
        if (start > 0 && text.at(start - 1) == QLatin1Char('<'))
            continue;

        QString url = m.captured();
        QString trailing;
        const QRegularExpressionMatch punct = trailingPunctRe.match(url);
        if (punct.hasMatch()) {
            trailing = punct.captured();
            url.chop(trailing.size());
        }

        builder.append(flat.slice(copied, start));
        if (format == LinkFormat::Full) {
            builder.append(QLatin1Char('['))
                .append(url)
                .append(QLatin1StringView("]("))
                .append(url)
                .append(QLatin1Char(')'));
        } else {
            builder.append(QLatin1Char('<')).append(url).append(QLatin1Char('>'));
        }
        builder.append(trailing);
        copied = m.capturedEnd();
    }

    if (copied == 0)
        return content;
    builder.append(flat.slice(copied));
    return builder.build();
}

} // namespace LinkTransformer
