/*
 * content.h — Immutable text content over shared string segments
 *
 * A Content value is a sequence of (buffer, offset, length) segments whose
 * buffers are implicitly shared QStrings. Slicing only adjusts offsets and
 * appending only concatenates segment lists, so chained operations over a
 * large document never copy the underlying text. Text is materialized once,
 * by toString()/toUtf8() or compacted().
 *
 * All operations are const and return new values. Out-of-range offsets are
 * clamped to [0, size()].
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_CONTENT_H
#define DOKUMENTOR_CONTENT_H

#include <QByteArray>
#include <QByteArrayView>
#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringView>

#include <optional>

class Content
{
    struct Segment {
        QString text;
        qsizetype offset = 0;
        qsizetype length = 0;
    };

public:
    static constexpr QChar kSpace = QLatin1Char(' ');
    static constexpr QChar kTab = QLatin1Char('\t');
    static constexpr QChar kNewLine = QLatin1Char('\n');
    static constexpr QChar kCarriageReturn = QLatin1Char('\r');

    // Regex subjects longer than this are refused by execRegExp().
    static constexpr qsizetype kRegExpSafeMaxLength = 24 * 1024;

    static constexpr qsizetype kToEnd = -1;

    struct RegExpMatch {
        qsizetype start = -1;
        qsizetype end = -1;
        QList<Content> captures;   // [0] = whole match; empty for unmatched groups
    };

    // Accumulates text and Content pieces, then produces one Content.
    class Builder
    {
    public:
        Builder &append(const Content &content);
        Builder &append(const QString &text);
        Builder &append(QLatin1StringView text);
        Builder &append(QChar ch);
        Builder &appendRepeated(QChar ch, qsizetype count);

        qsizetype size() const { return m_size; }
        bool isEmpty() const { return m_size == 0; }
        bool endsWith(QChar ch) const;

        Content build() const;

    private:
        void flushPending();

        QList<Segment> m_segments;
        QString m_pending;
        qsizetype m_size = 0;
    };

    Content() = default;
    explicit Content(const QString &text);
    explicit Content(QLatin1StringView text);

    static Content fromUtf8(QByteArrayView bytes);
    static Content repeated(QChar ch, qsizetype count);

    qsizetype size() const { return m_size; }
    bool isEmpty() const { return m_size == 0; }
    bool isMultiLine() const;

    QChar at(qsizetype position) const;
    bool includesAt(QChar ch, qsizetype position) const;
    bool startsWith(QStringView prefix, qsizetype position = 0) const;
    bool endsWith(QStringView suffix) const;
    bool equals(const Content &other) const;
    bool equals(QStringView text) const;

    qsizetype search(QChar ch, qsizetype from = 0) const;
    qsizetype search(QStringView needle, qsizetype from = 0) const;
    qsizetype search(const Content &needle, qsizetype from = 0) const;
    // from < 0 searches from the end.
    qsizetype searchLast(QStringView needle, qsizetype from = -1) const;
    bool includes(QStringView needle) const { return search(needle) != -1; }

    bool test(const QRegularExpression &re) const;
    // Matches at or after *cursor and advances it past the match, so that
    // repeated calls walk all non-overlapping matches. On failure the cursor
    // is reset to 0.
    std::optional<RegExpMatch> execRegExp(const QRegularExpression &re,
                                          qsizetype *cursor = nullptr) const;

    // end == kToEnd slices to the end; any other bound is clamped to [0, size()].
    Content slice(qsizetype start, qsizetype end = kToEnd) const;
    Content append(const Content &other) const;
    Content append(const QString &text) const;

    // Prefix every occurrence of any character in chars with escapeChar.
    Content escape(QStringView chars, QChar escapeChar = QLatin1Char('\\')) const;
    // Replace &, <, > and " with HTML entities.
    Content htmlEscape() const;
    // Right-pad with fill until size() reaches width.
    Content padEnd(qsizetype width, QChar fill = kSpace) const;
    Content trim() const;
    Content trimStart() const;
    Content toUpper() const;

    // Lines split on LF, with a trailing CR removed. Always at least one line.
    QList<Content> splitLines() const;

    // Single-segment copy of this content; returns *this if already flat.
    Content compacted() const;

    QString toString() const;
    QByteArray toUtf8() const;

    bool operator==(const Content &other) const { return equals(other); }
    bool operator!=(const Content &other) const { return !equals(other); }

    static bool isWhitespace(QChar ch)
    {
        return ch == kSpace || ch == kTab || ch == kNewLine || ch == kCarriageReturn;
    }

private:
    void appendSegment(const Segment &segment);
    QStringView singleView() const;

    // Run fn over a contiguous view of the content, flattening only when
    // the content spans more than one segment.
    template <typename Fn>
    auto withView(Fn &&fn) const
    {
        if (m_segments.size() <= 1)
            return fn(singleView());
        const QString flat = toString();
        return fn(QStringView(flat));
    }

    QList<Segment> m_segments;
    qsizetype m_size = 0;
};

#endif // DOKUMENTOR_CONTENT_H
