/*
 * codefence.cpp — Code fence sizing, detection and HTML fallback
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "codefence.h"

namespace CodeFence {

namespace {

constexpr QChar kBacktick = QLatin1Char('`');
constexpr QChar kTilde = QLatin1Char('~');

qsizetype runLength(const Content &content, qsizetype position, QChar marker)
{
    qsizetype end = position;
    while (end < content.size() && content.at(end) == marker)
        ++end;
    return end - position;
}

qsizetype nextLineStart(const Content &content, qsizetype position)
{
    const qsizetype newline = content.search(Content::kNewLine, position);
    return newline == -1 ? content.size() : newline + 1;
}

Content defaultLanguage(const Content &language)
{
    const Content trimmed = language.trim();
    return trimmed.isEmpty() ? Content(QStringLiteral("text")) : trimmed;
}

// Leading blanks on a wrapped line collapse to one space; blank lines vanish.
Content collapseLeadingWhitespace(const Content &line)
{
    qsizetype first = 0;
    while (first < line.size()) {
        const QChar ch = line.at(first);
        if (ch != Content::kSpace && ch != Content::kTab && ch != Content::kCarriageReturn)
            break;
        ++first;
    }
    if (first == 0)
        return line;
    if (first == line.size())
        return Content();
    return Content(QStringLiteral(" ")).append(line.slice(first));
}

} // anonymous namespace

bool isFenceLine(const Content &line)
{
    return line.startsWith(u"```");
}

bool FenceTracker::consume(const Content &line)
{
    const QChar first = line.at(0);
    const qsizetype run = (first == kBacktick || first == kTilde) ? runLength(line, 0, first) : 0;

    if (m_length == 0) {
        if (run < kMinimumFenceLength)
            return false;
        m_marker = first;
        m_length = run;
        return true;
    }
    if (first == m_marker && run >= m_length)
        m_length = 0;
    return true;
}

qsizetype fenceLengthFor(const Content &content)
{
    const Content flat = content.compacted();
    qsizetype longest = 0;
    qsizetype position = flat.search(kBacktick);
    while (position != -1) {
        const qsizetype run = runLength(flat, position, kBacktick);
        longest = qMax(longest, run);
        position = flat.search(kBacktick, position + run);
    }
    return qMax(kMinimumFenceLength, longest + 1);
}

Content fenceFor(const Content &content)
{
    return Content::repeated(kBacktick, fenceLengthFor(content));
}

Content codeBlock(const Content &content, const Content &language)
{
    const Content fence = fenceFor(content);
    Content::Builder builder;
    builder.append(fence)
        .append(defaultLanguage(language))
        .append(Content::kNewLine)
        .append(content.trim())
        .append(Content::kNewLine)
        .append(fence)
        .append(Content::kNewLine);
    return builder.build();
}

Content inlineCode(const Content &content)
{
    Content::Builder builder;
    builder.append(kBacktick)
        .append(content.escape(u"`*").htmlEscape())
        .append(kBacktick);
    return builder.build();
}

Content htmlFallback(const Content &content, const Content &language)
{
    Content::Builder builder;
    builder.append(QLatin1StringView("<!-- textlint-disable --><pre lang=\""))
        .append(defaultLanguage(language).htmlEscape())
        .append(QLatin1StringView("\">"));

    const QList<Content> lines = content.splitLines();
    for (qsizetype i = 0; i < lines.size(); ++i) {
        if (i > 0)
            builder.append(QLatin1StringView("&#13;"));
        builder.append(collapseLeadingWhitespace(lines.at(i)).escape(u"`*").htmlEscape());
    }

    builder.append(QLatin1StringView("</pre><!-- textlint-enable -->"));
    return builder.build();
}

QList<CodeBlockRange> findCodeBlocks(const Content &content)
{
    const Content flat = content.compacted();
    QList<CodeBlockRange> blocks;

    qsizetype lineStart = 0;
    while (lineStart < flat.size()) {
        const QChar marker = flat.at(lineStart);
        if (marker != kBacktick && marker != kTilde) {
            lineStart = nextLineStart(flat, lineStart);
            continue;
        }

        const qsizetype openLength = runLength(flat, lineStart, marker);
        if (openLength < kMinimumFenceLength) {
            lineStart = nextLineStart(flat, lineStart);
            continue;
        }

        const qsizetype infoEnd = flat.search(Content::kNewLine, lineStart + openLength);
        if (infoEnd == -1)
            break;

        qsizetype closeStart = -1;
        qsizetype closeLength = 0;
        for (qsizetype scan = infoEnd + 1; scan < flat.size(); scan = nextLineStart(flat, scan)) {
            if (flat.at(scan) != marker)
                continue;
            const qsizetype run = runLength(flat, scan, marker);
            if (run >= openLength) {
                closeStart = scan;
                closeLength = run;
                break;
            }
        }

        // Unclosed fences are plain text.
        if (closeStart == -1) {
            lineStart = infoEnd + 1;
            continue;
        }

        CodeBlockRange block;
        block.start = lineStart;
        block.end = nextLineStart(flat, closeStart + closeLength);
        block.innerStart = infoEnd + 1;
        block.innerEnd = closeStart;
        if (block.innerEnd > block.innerStart && flat.at(block.innerEnd - 1) == Content::kNewLine)
            --block.innerEnd;
        block.marker = marker;
        block.fenceLength = openLength;
        block.language = flat.slice(lineStart + openLength, infoEnd).trim();
        blocks.append(block);

        lineStart = block.end;
    }

    return blocks;
}

QList<InlineCodeRange> findInlineCode(const Content &content, const QList<CodeBlockRange> &excluded)
{
    const Content flat = content.compacted();
    QList<InlineCodeRange> spans;

    auto excludedAt = [&excluded](qsizetype position) -> const CodeBlockRange * {
        for (const CodeBlockRange &block : excluded) {
            if (block.contains(position))
                return &block;
        }
        return nullptr;
    };
    auto nextExcludedStart = [&excluded, &flat](qsizetype position) {
        qsizetype limit = flat.size();
        for (const CodeBlockRange &block : excluded) {
            if (block.start >= position)
                limit = qMin(limit, block.start);
        }
        return limit;
    };

    qsizetype position = flat.search(kBacktick);
    while (position != -1) {
        if (const CodeBlockRange *block = excludedAt(position)) {
            position = flat.search(kBacktick, block->end);
            continue;
        }

        const qsizetype openLength = runLength(flat, position, kBacktick);
        const qsizetype limit = nextExcludedStart(position);

        qsizetype close = flat.search(kBacktick, position + openLength);
        while (close != -1 && close < limit) {
            const qsizetype run = runLength(flat, close, kBacktick);
            if (run == openLength)
                break;
            close = flat.search(kBacktick, close + run);
        }

        if (close == -1 || close >= limit) {
            position = flat.search(kBacktick, position + openLength);
            continue;
        }

        spans.append(InlineCodeRange{position, close + openLength, openLength});
        position = flat.search(kBacktick, close + openLength);
    }

    return spans;
}

} // namespace CodeFence
