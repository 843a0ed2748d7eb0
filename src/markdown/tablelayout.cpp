/*
 * tablelayout.cpp — Aligned GitHub-flavored Markdown tables from Content cells
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tablelayout.h"
#include "codefence.h"

#include <QObject>

using CodeFence::CodeBlockRange;
using CodeFence::InlineCodeRange;

namespace TableLayout {

namespace {

constexpr QChar kPipe = QLatin1Char('|');
constexpr QChar kDash = QLatin1Char('-');

// Width in characters; a surrogate pair counts once.
qsizetype displayWidth(const Content &content)
{
    const QString text = content.toString();
    qsizetype width = text.size();
    for (const QChar ch : text) {
        if (ch.isLowSurrogate())
            --width;
    }
    return width;
}

// A newline is protected when splitting there would cut a fenced block or
// an inline code span in two. The line break ending a fenced block is not.
bool isProtectedBreak(qsizetype position,
                      const QList<CodeBlockRange> &blocks,
                      const QList<InlineCodeRange> &spans)
{
    for (const CodeBlockRange &block : blocks) {
        if (position >= block.start && position < block.end - 1)
            return true;
    }
    for (const InlineCodeRange &span : spans) {
        if (span.contains(position))
            return true;
    }
    return false;
}

// Inline code renders line endings as spaces, so a span can be flattened.
Content flattenInlineCode(const Content &text)
{
    const QList<InlineCodeRange> spans = CodeFence::findInlineCode(text);
    if (spans.isEmpty())
        return text;

    Content::Builder builder;
    qsizetype copied = 0;
    for (const InlineCodeRange &span : spans) {
        const Content code = text.slice(span.start, span.end);
        if (!code.isMultiLine())
            continue;
        builder.append(text.slice(copied, span.start));
        const QList<Content> parts = code.splitLines();
        for (qsizetype i = 0; i < parts.size(); ++i) {
            if (i > 0)
                builder.append(Content::kSpace);
            builder.append(parts.at(i));
        }
        copied = span.end;
    }
    if (copied == 0)
        return text;
    builder.append(text.slice(copied));
    return builder.build();
}

Content renderLine(const Content &line)
{
    const QList<CodeBlockRange> blocks = CodeFence::findCodeBlocks(line);
    if (blocks.isEmpty())
        return flattenInlineCode(line.trim()).escape(u"|");

    Content::Builder builder;
    auto appendText = [&builder](const Content &text) {
        const Content trimmed = text.trim();
        if (trimmed.isEmpty())
            return;
        if (!builder.isEmpty())
            builder.append(Content::kSpace);
        builder.append(flattenInlineCode(trimmed));
    };

    qsizetype copied = 0;
    for (const CodeBlockRange &block : blocks) {
        appendText(line.slice(copied, block.start));
        if (!builder.isEmpty())
            builder.append(Content::kSpace);
        builder.append(CodeFence::htmlFallback(line.slice(block.innerStart, block.innerEnd),
                                               block.language));
        copied = block.end;
    }
    appendText(line.slice(copied));
    return builder.build().escape(u"|");
}

void appendPhysicalRow(Content::Builder &builder, const QList<Content> &cells,
                       const QList<qsizetype> &widths)
{
    builder.append(kPipe);
    for (qsizetype column = 0; column < cells.size(); ++column) {
        const Content &cell = cells.at(column);
        builder.append(Content::kSpace)
            .append(cell)
            .appendRepeated(Content::kSpace, widths.at(column) - displayWidth(cell))
            .append(Content::kSpace)
            .append(kPipe);
    }
    builder.append(Content::kNewLine);
}

void appendSeparator(Content::Builder &builder, const QList<qsizetype> &widths)
{
    builder.append(kPipe);
    for (const qsizetype width : widths) {
        builder.append(Content::kSpace)
            .appendRepeated(kDash, width)
            .append(Content::kSpace)
            .append(kPipe);
    }
    builder.append(Content::kNewLine);
}

// Expand one logical row into its physical rows, starting at firstLine.
void appendLogicalRow(Content::Builder &builder, const QList<QList<Content>> &cellLines,
                      const QList<qsizetype> &widths, qsizetype firstLine, qsizetype lastLine)
{
    for (qsizetype line = firstLine; line < lastLine; ++line) {
        QList<Content> cells;
        cells.reserve(cellLines.size());
        for (const QList<Content> &lines : cellLines)
            cells.append(line < lines.size() ? lines.at(line) : Content());
        appendPhysicalRow(builder, cells, widths);
    }
}

qsizetype rowHeight(const QList<QList<Content>> &cellLines)
{
    qsizetype height = 1;
    for (const QList<Content> &lines : cellLines)
        height = qMax(height, lines.size());
    return height;
}

} // anonymous namespace

QList<Content> displayLines(const Content &cell)
{
    const Content text = cell.trim().compacted();
    if (text.isEmpty())
        return {Content()};

    const QList<CodeBlockRange> blocks = CodeFence::findCodeBlocks(text);
    const QList<InlineCodeRange> spans = CodeFence::findInlineCode(text, blocks);

    QList<Content> lines;
    qsizetype lineStart = 0;
    qsizetype newline = text.search(Content::kNewLine);
    while (newline != -1) {
        if (!isProtectedBreak(newline, blocks, spans)) {
            lines.append(renderLine(text.slice(lineStart, newline)));
            lineStart = newline + 1;
        }
        newline = text.search(Content::kNewLine, newline + 1);
    }
    lines.append(renderLine(text.slice(lineStart)));
    return lines;
}

Result render(const Table &table)
{
    Result result;
    const qsizetype columns = table.headers.size();

    for (qsizetype i = 0; i < table.rows.size(); ++i) {
        const qsizetype cells = table.rows.at(i).size();
        if (cells != columns) {
            result.valid = false;
            result.errorMessage = QObject::tr("Table row %1 has %2 cells, expected %3")
                                      .arg(i + 1)
                                      .arg(cells)
                                      .arg(columns);
            return result;
        }
    }
    if (columns == 0)
        return result;

    QList<QList<Content>> headerLines;
    for (const Content &header : table.headers)
        headerLines.append(displayLines(header));

    QList<QList<QList<Content>>> rowLines;
    rowLines.reserve(table.rows.size());
    for (const QList<Content> &row : table.rows) {
        QList<QList<Content>> cellLines;
        for (const Content &cell : row)
            cellLines.append(displayLines(cell));
        rowLines.append(cellLines);
    }

    // Every column is as wide as its widest atomic line, and at least one
    // character so the delimiter row stays valid.
    QList<qsizetype> widths(columns, 1);
    auto widen = [&widths](const QList<QList<Content>> &cellLines) {
        for (qsizetype column = 0; column < cellLines.size(); ++column) {
            for (const Content &line : cellLines.at(column))
                widths[column] = qMax(widths.at(column), displayWidth(line));
        }
    };
    widen(headerLines);
    for (const QList<QList<Content>> &cellLines : rowLines)
        widen(cellLines);

    // A header row holds a single line; further header lines follow the
    // delimiter row as the first body rows.
    Content::Builder builder;
    const qsizetype headerHeight = rowHeight(headerLines);
    appendLogicalRow(builder, headerLines, widths, 0, 1);
    appendSeparator(builder, widths);
    appendLogicalRow(builder, headerLines, widths, 1, headerHeight);
    for (const QList<QList<Content>> &cellLines : rowLines)
        appendLogicalRow(builder, cellLines, widths, 0, rowHeight(cellLines));

    result.markdown = builder.build();
    return result;
}

} // namespace TableLayout
