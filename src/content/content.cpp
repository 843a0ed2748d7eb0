/*
 * content.cpp — Immutable text content over shared string segments
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "content.h"

#include <QDebug>

// --- Builder ---

Content::Builder &Content::Builder::append(const Content &content)
{
    if (content.isEmpty())
        return *this;
    flushPending();
    for (const Segment &segment : content.m_segments) {
        if (!m_segments.isEmpty()) {
            Segment &last = m_segments.last();
            if (last.text.constData() == segment.text.constData()
                && last.offset + last.length == segment.offset) {
                last.length += segment.length;
                continue;
            }
        }
        m_segments.append(segment);
    }
    m_size += content.size();
    return *this;
}

Content::Builder &Content::Builder::append(const QString &text)
{
    m_pending.append(text);
    m_size += text.size();
    return *this;
}

Content::Builder &Content::Builder::append(QLatin1StringView text)
{
    m_pending.append(text);
    m_size += text.size();
    return *this;
}

Content::Builder &Content::Builder::append(QChar ch)
{
    m_pending.append(ch);
    ++m_size;
    return *this;
}

Content::Builder &Content::Builder::appendRepeated(QChar ch, qsizetype count)
{
    if (count <= 0)
        return *this;
    m_pending.append(QString(count, ch));
    m_size += count;
    return *this;
}

bool Content::Builder::endsWith(QChar ch) const
{
    if (!m_pending.isEmpty())
        return m_pending.back() == ch;
    if (m_segments.isEmpty())
        return false;
    const Segment &last = m_segments.last();
    return last.text.at(last.offset + last.length - 1) == ch;
}

void Content::Builder::flushPending()
{
    if (m_pending.isEmpty())
        return;
    Segment segment;
    segment.length = m_pending.size();
    segment.text = std::move(m_pending);
    m_pending = QString();
    m_segments.append(segment);
}

Content Content::Builder::build() const
{
    Content result;
    result.m_segments = m_segments;
    if (!m_pending.isEmpty())
        result.m_segments.append(Segment{m_pending, 0, m_pending.size()});
    result.m_size = m_size;
    return result;
}

// --- Construction ---

Content::Content(const QString &text)
{
    if (!text.isEmpty()) {
        m_segments.append(Segment{text, 0, text.size()});
        m_size = text.size();
    }
}

Content::Content(QLatin1StringView text)
    : Content(QString(text))
{
}

Content Content::fromUtf8(QByteArrayView bytes)
{
    return Content(QString::fromUtf8(bytes));
}

Content Content::repeated(QChar ch, qsizetype count)
{
    if (count <= 0)
        return Content();
    return Content(QString(count, ch));
}

void Content::appendSegment(const Segment &segment)
{
    if (segment.length <= 0)
        return;
    if (!m_segments.isEmpty()) {
        Segment &last = m_segments.last();
        if (last.text.constData() == segment.text.constData()
            && last.offset + last.length == segment.offset) {
            last.length += segment.length;
            m_size += segment.length;
            return;
        }
    }
    m_segments.append(segment);
    m_size += segment.length;
}

QStringView Content::singleView() const
{
    if (m_segments.isEmpty())
        return QStringView();
    const Segment &segment = m_segments.first();
    return QStringView(segment.text).mid(segment.offset, segment.length);
}

// --- Inspection ---

bool Content::isMultiLine() const
{
    return search(kNewLine) != -1;
}

QChar Content::at(qsizetype position) const
{
    if (position < 0 || position >= m_size)
        return QChar();
    for (const Segment &segment : m_segments) {
        if (position < segment.length)
            return segment.text.at(segment.offset + position);
        position -= segment.length;
    }
    return QChar();
}

bool Content::includesAt(QChar ch, qsizetype position) const
{
    return position >= 0 && position < m_size && at(position) == ch;
}

bool Content::startsWith(QStringView prefix, qsizetype position) const
{
    if (position < 0 || position + prefix.size() > m_size)
        return false;
    if (m_segments.size() == 1)
        return singleView().mid(position, prefix.size()) == prefix;
    for (qsizetype i = 0; i < prefix.size(); ++i) {
        if (at(position + i) != prefix.at(i))
            return false;
    }
    return true;
}

bool Content::endsWith(QStringView suffix) const
{
    if (suffix.size() > m_size)
        return false;
    return startsWith(suffix, m_size - suffix.size());
}

bool Content::equals(const Content &other) const
{
    if (m_size != other.m_size)
        return false;
    if (m_size == 0)
        return true;
    if (m_segments.size() == 1 && other.m_segments.size() == 1)
        return singleView() == other.singleView();
    return toString() == other.toString();
}

bool Content::equals(QStringView text) const
{
    if (m_size != text.size())
        return false;
    return startsWith(text);
}

qsizetype Content::search(QChar ch, qsizetype from) const
{
    from = qBound(qsizetype(0), from, m_size);
    qsizetype base = 0;
    for (const Segment &segment : m_segments) {
        if (from < base + segment.length) {
            const QStringView view = QStringView(segment.text).mid(segment.offset, segment.length);
            const qsizetype found = view.indexOf(ch, qMax(qsizetype(0), from - base));
            if (found != -1)
                return base + found;
        }
        base += segment.length;
    }
    return -1;
}

qsizetype Content::search(QStringView needle, qsizetype from) const
{
    from = qBound(qsizetype(0), from, m_size);
    if (needle.isEmpty())
        return from;
    return withView([&](QStringView view) { return view.indexOf(needle, from); });
}

qsizetype Content::search(const Content &needle, qsizetype from) const
{
    const QString text = needle.toString();
    return search(QStringView(text), from);
}

qsizetype Content::searchLast(QStringView needle, qsizetype from) const
{
    if (from >= m_size)
        from = -1;
    return withView([&](QStringView view) { return view.lastIndexOf(needle, from); });
}

bool Content::test(const QRegularExpression &re) const
{
    if (isEmpty())
        return false;
    return withView([&](QStringView view) { return re.matchView(view).hasMatch(); });
}

std::optional<Content::RegExpMatch> Content::execRegExp(const QRegularExpression &re,
                                                        qsizetype *cursor) const
{
    const qsizetype from = cursor ? qBound(qsizetype(0), *cursor, m_size) : 0;
    if (m_size - from > kRegExpSafeMaxLength) {
        qWarning() << "Content: refusing regular expression match over" << (m_size - from)
                   << "characters, limit is" << kRegExpSafeMaxLength;
        if (cursor)
            *cursor = 0;
        return std::nullopt;
    }

    const Content subject = compacted();
    const QRegularExpressionMatch match = re.matchView(subject.singleView(), from);
    if (!match.hasMatch()) {
        if (cursor)
            *cursor = 0;
        return std::nullopt;
    }

    RegExpMatch result;
    result.start = match.capturedStart();
    result.end = match.capturedEnd();
    for (int i = 0; i <= match.lastCapturedIndex(); ++i) {
        const qsizetype start = match.capturedStart(i);
        result.captures.append(start < 0 ? Content() : subject.slice(start, match.capturedEnd(i)));
    }
    while (result.captures.size() <= re.captureCount())
        result.captures.append(Content());

    if (cursor)
        *cursor = result.end > result.start ? result.end : result.end + 1;
    return result;
}

// --- Derivation ---

Content Content::slice(qsizetype start, qsizetype end) const
{
    end = end == kToEnd ? m_size : qBound(qsizetype(0), end, m_size);
    start = qBound(qsizetype(0), start, m_size);
    if (start >= end)
        return Content();
    if (start == 0 && end == m_size)
        return *this;

    Content result;
    qsizetype base = 0;
    for (const Segment &segment : m_segments) {
        const qsizetype segmentEnd = base + segment.length;
        if (segmentEnd > start && base < end) {
            const qsizetype from = qMax(start, base) - base;
            const qsizetype to = qMin(end, segmentEnd) - base;
            result.appendSegment(Segment{segment.text, segment.offset + from, to - from});
        }
        if (segmentEnd >= end)
            break;
        base = segmentEnd;
    }
    return result;
}

Content Content::append(const Content &other) const
{
    if (other.isEmpty())
        return *this;
    if (isEmpty())
        return other;
    Content result = *this;
    for (const Segment &segment : other.m_segments)
        result.appendSegment(segment);
    return result;
}

Content Content::append(const QString &text) const
{
    return append(Content(text));
}

Content Content::escape(QStringView chars, QChar escapeChar) const
{
    const Content flat = compacted();
    const QStringView view = flat.singleView();
    Builder builder;
    qsizetype copied = 0;
    for (qsizetype i = 0; i < view.size(); ++i) {
        if (!chars.contains(view.at(i)))
            continue;
        builder.append(flat.slice(copied, i));
        builder.append(escapeChar);
        copied = i;
    }
    if (copied == 0 && builder.isEmpty())
        return *this;
    builder.append(flat.slice(copied));
    return builder.build();
}

Content Content::htmlEscape() const
{
    const Content flat = compacted();
    const QStringView view = flat.singleView();
    Builder builder;
    qsizetype copied = 0;
    bool changed = false;
    for (qsizetype i = 0; i < view.size(); ++i) {
        QLatin1StringView entity;
        switch (view.at(i).unicode()) {
        case '&': entity = QLatin1StringView("&amp;"); break;
        case '<': entity = QLatin1StringView("&lt;"); break;
        case '>': entity = QLatin1StringView("&gt;"); break;
        case '"': entity = QLatin1StringView("&quot;"); break;
        default: continue;
        }
        builder.append(flat.slice(copied, i));
        builder.append(entity);
        copied = i + 1;
        changed = true;
    }
    if (!changed)
        return *this;
    builder.append(flat.slice(copied));
    return builder.build();
}

Content Content::padEnd(qsizetype width, QChar fill) const
{
    if (m_size >= width)
        return *this;
    return append(repeated(fill, width - m_size));
}

Content Content::trim() const
{
    qsizetype start = 0;
    qsizetype end = m_size;
    while (start < end && isWhitespace(at(start)))
        ++start;
    while (end > start && isWhitespace(at(end - 1)))
        --end;
    return slice(start, end);
}

Content Content::trimStart() const
{
    qsizetype start = 0;
    while (start < m_size && isWhitespace(at(start)))
        ++start;
    return slice(start);
}

Content Content::toUpper() const
{
    return Content(toString().toUpper());
}

QList<Content> Content::splitLines() const
{
    const Content flat = compacted();
    QList<Content> lines;
    qsizetype lineStart = 0;
    while (true) {
        const qsizetype newline = flat.search(kNewLine, lineStart);
        const qsizetype lineEnd = newline == -1 ? flat.size() : newline;
        qsizetype contentEnd = lineEnd;
        if (contentEnd > lineStart && flat.at(contentEnd - 1) == kCarriageReturn)
            --contentEnd;
        lines.append(flat.slice(lineStart, contentEnd));
        if (newline == -1)
            break;
        lineStart = newline + 1;
    }
    return lines;
}

Content Content::compacted() const
{
    if (m_segments.size() <= 1)
        return *this;
    return Content(toString());
}

QString Content::toString() const
{
    if (m_segments.size() == 1) {
        const Segment &segment = m_segments.first();
        if (segment.offset == 0 && segment.length == segment.text.size())
            return segment.text;
    }
    QString result;
    result.reserve(m_size);
    for (const Segment &segment : m_segments)
        result.append(QStringView(segment.text).mid(segment.offset, segment.length));
    return result;
}

QByteArray Content::toUtf8() const
{
    return toString().toUtf8();
}
