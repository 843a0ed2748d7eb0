/*
 * codefence.h — Code fence sizing, detection and HTML fallback
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_CODEFENCE_H
#define DOKUMENTOR_CODEFENCE_H

#include "content/content.h"

#include <QList>

namespace CodeFence {

// A fenced code block, in offsets of the scanned content.
struct CodeBlockRange {
    qsizetype start = 0;        // first opening fence character
    qsizetype end = 0;          // past the closing fence line and its line break
    qsizetype innerStart = 0;   // past the info string line
    qsizetype innerEnd = 0;     // before the line break preceding the closing fence
    QChar marker;               // '`' or '~'
    qsizetype fenceLength = 0;
    Content language;           // trimmed info string, possibly empty

    bool contains(qsizetype position) const { return position >= start && position < end; }
};

// An inline code span delimited by equal-length backtick runs.
struct InlineCodeRange {
    qsizetype start = 0;
    qsizetype end = 0;
    qsizetype delimiterLength = 0;

    bool contains(qsizetype position) const { return position >= start && position < end; }
};

constexpr qsizetype kMinimumFenceLength = 3;

bool isFenceLine(const Content &line);

// Follows fenced blocks of either marker across successive lines. A block
// opened by N markers closes on a line starting with at least N of the same.
class FenceTracker
{
public:
    // line has its leading whitespace removed. Returns true when the line is
    // a fence or lies inside a fenced block.
    bool consume(const Content &line);
    bool inFence() const { return m_length > 0; }

private:
    QChar m_marker;
    qsizetype m_length = 0;
};

// Length of a backtick fence that cannot be closed by any run inside content.
qsizetype fenceLengthFor(const Content &content);
Content fenceFor(const Content &content);

// Fenced block with the body trimmed. An empty language defaults to "text".
Content codeBlock(const Content &content, const Content &language = Content());
Content inlineCode(const Content &content);

// Single-line <pre> rendering for contexts that cannot hold line breaks.
Content htmlFallback(const Content &content, const Content &language = Content());

QList<CodeBlockRange> findCodeBlocks(const Content &content);
QList<InlineCodeRange> findInlineCode(const Content &content,
                                      const QList<CodeBlockRange> &excluded = {});

} // namespace CodeFence

#endif // DOKUMENTOR_CODEFENCE_H
