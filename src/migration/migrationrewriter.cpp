/*
 * migrationrewriter.cpp — Rewrite a third-party tool's markers into canonical sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "migrationrewriter.h"
#include "markdown/codefence.h"
#include "section/sectionmarkers.h"

#include <QDebug>
#include <QIODevice>
#include <QObject>
#include <QStringDecoder>

using SectionMarkers::Marker;

namespace {

struct Span {
    SectionIdentifier id;
    qsizetype start;        // start marker
    qsizetype innerStart;   // past the start marker
    qsizetype innerEnd;     // at the end marker
    qsizetype end;          // past the end marker
};

// A span is a start marker directly followed by the end marker of the same
// section. Anything else between markers is left alone.
QList<Span> findSpans(const QList<Marker> &markers)
{
    QList<Span> spans;
    for (qsizetype i = 0; i + 1 < markers.size(); ++i) {
        const Marker &open = markers.at(i);
        const Marker &close = markers.at(i + 1);
        if (open.kind != Marker::Start || close.kind != Marker::End || open.id != close.id)
            continue;
        spans.append({open.id, open.start, open.end, close.start, close.end});
        ++i;
    }
    return spans;
}

int headingLevel(QStringView line)
{
    int level = 0;
    while (level < line.size() && line.at(level) == QLatin1Char('#'))
        ++level;
    if (level == 0 || level > 6)
        return 0;
    if (level < line.size() && line.at(level) != QLatin1Char(' ') && line.at(level) != QLatin1Char('\t'))
        return 0;
    return level;
}

constexpr qsizetype kUtf8MaxSequenceLength = 4;

// True when bytes stop after the lead byte of a multi-byte sequence but
// before its last continuation byte.
bool endsInsideSequence(const QByteArray &bytes)
{
    qsizetype continuations = 0;
    for (qsizetype i = bytes.size() - 1; i >= 0; --i) {
        const uchar byte = uchar(bytes.at(i));
        if ((byte & 0xC0) == 0x80) {
            ++continuations;
            continue;
        }
        qsizetype expected = 1;
        if ((byte & 0xE0) == 0xC0)
            expected = 2;
        else if ((byte & 0xF0) == 0xE0)
            expected = 3;
        else if ((byte & 0xF8) == 0xF0)
            expected = 4;
        return continuations + 1 < expected;
    }
    return false;
}

} // anonymous namespace

// --- LineProcessor ---

class MigrationRewriter::LineProcessor
{
public:
    explicit LineProcessor(const MigrationTool &tool)
        : m_tool(tool)
        , m_alternating(tool.markersIdentical())
    {
    }

    void processLine(const QString &line, bool terminated)
    {
        if (m_tool.style == MigrationTool::MarkerStyle::Heading) {
            processHeadingLine(line, terminated);
            return;
        }
        if (line.size() > Content::kRegExpSafeMaxLength) {
            qWarning() << "MigrationRewriter: line of" << line.size()
                       << "characters left unchanged";
            emitLine(line, terminated);
            return;
        }

        QString processed;
        if (m_alternating) {
            processed = replaceMarkers(line, m_tool.startPattern, Role::Alternating);
        } else {
            // End markers first so a start replacement never rewrites inside
            // an end marker on the same line.
            processed = replaceMarkers(line, m_tool.endPattern, Role::End);
            processed = replaceMarkers(processed, m_tool.startPattern, Role::Start);
        }
        emitLine(processed, terminated);
    }

    Result finish()
    {
        Result result;
        if (m_headingSection)
            closeHeadingSection();
        if (m_alternating && m_alternatingCount % 2 != 0) {
            result.valid = false;
            result.errorMessage = QObject::tr("Found %1 %2 markers; start and end markers "
                                              "must come in pairs")
                                      .arg(m_alternatingCount)
                                      .arg(m_tool.name);
            return result;
        }
        result.content = m_output.build();
        return result;
    }

private:
    enum class Role { Start, End, Alternating };

    QString replaceMarkers(const QString &line, const QRegularExpression &pattern, Role role)
    {
        if (!pattern.isValid() || pattern.pattern().isEmpty())
            return line;

        QString result;
        qsizetype copied = 0;
        auto it = pattern.globalMatch(line);
        while (it.hasNext()) {
            const QRegularExpressionMatch m = it.next();
            result.append(QStringView(line).mid(copied, m.capturedStart() - copied));
            copied = m.capturedEnd();

            const QString sectionName = m.captured(QStringLiteral("name"));
            const std::optional<SectionIdentifier> id = m_tool.mapName(sectionName);
            if (!id) {
                qDebug() << "MigrationRewriter: dropping unmapped" << m_tool.name
                         << "marker" << sectionName;
                continue;
            }

            bool isStart = role == Role::Start;
            if (role == Role::Alternating)
                isStart = (m_alternatingCount++ % 2) == 0;
            result.append((isStart ? SectionMarkers::start(*id) : SectionMarkers::end(*id)).toString());
        }
        if (copied == 0)
            return line;
        result.append(QStringView(line).mid(copied));
        return result;
    }

    void processHeadingLine(const QString &line, bool terminated)
    {
        const QString trimmed = line.trimmed();
        if (!m_fences.consume(Content(trimmed))) {
            const int level = headingLevel(trimmed);
            if (level > 0 && m_headingSection && level <= m_headingLevel)
                closeHeadingSection();

            const QRegularExpressionMatch m = m_tool.startPattern.match(trimmed);
            if (m.hasMatch()) {
                const std::optional<SectionIdentifier> id = m_tool.mapName(m.captured(QStringLiteral("name")));
                if (id) {
                    if (m_headingSection)
                        closeHeadingSection();
                    m_output.append(SectionMarkers::start(*id)).append(Content::kNewLine);
                    m_headingSection = id;
                    m_headingLevel = int(m.captured(QStringLiteral("level")).size());
                }
            }
        }
        emitLine(line, terminated);
    }

    void closeHeadingSection()
    {
        if (!m_output.isEmpty() && !m_output.endsWith(Content::kNewLine))
            m_output.append(Content::kNewLine);
        m_output.append(SectionMarkers::end(*m_headingSection)).append(Content::kNewLine);
        m_headingSection.reset();
        m_headingLevel = 0;
    }

    void emitLine(const QString &line, bool terminated)
    {
        m_output.append(line);
        if (terminated)
            m_output.append(Content::kNewLine);
    }

    const MigrationTool &m_tool;
    const bool m_alternating;
    int m_alternatingCount = 0;
    std::optional<SectionIdentifier> m_headingSection;
    int m_headingLevel = 0;
    CodeFence::FenceTracker m_fences;
    Content::Builder m_output;
};

// --- MigrationRewriter ---

MigrationRewriter::MigrationRewriter(const MigrationTool &tool)
    : m_tool(tool)
{
}

MigrationRewriter::Result MigrationRewriter::rewriteMarkers(QIODevice *source) const
{
    Result result;
    if (!source || !source->isReadable()) {
        result.valid = false;
        result.errorMessage = QObject::tr("The document is not readable");
        return result;
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    LineProcessor processor(m_tool);
    QString pending;
    QByteArray tail;

    while (true) {
        const QByteArray chunk = source->read(m_chunkSize);
        if (chunk.isEmpty())
            break;
        tail = (tail + chunk).right(kUtf8MaxSequenceLength);

        const QString decoded = decoder.decode(chunk);
        pending.append(decoded);
        if (decoder.hasError()) {
            result.valid = false;
            result.errorMessage = QObject::tr("The document is not valid UTF-8");
            return result;
        }

        qsizetype lineStart = 0;
        qsizetype newline = pending.indexOf(QLatin1Char('\n'));
        while (newline != -1) {
            processor.processLine(pending.mid(lineStart, newline - lineStart), true);
            lineStart = newline + 1;
            newline = pending.indexOf(QLatin1Char('\n'), lineStart);
        }
        pending.remove(0, lineStart);
    }

    if (endsInsideSequence(tail)) {
        result.valid = false;
        result.errorMessage = QObject::tr("The document is not valid UTF-8");
        return result;
    }

    if (!pending.isEmpty())
        processor.processLine(pending, false);
    return processor.finish();
}

MigrationRewriter::Result MigrationRewriter::migrate(QIODevice *source,
                                                     const QList<SectionIdentifier> &supported) const
{
    Result result = rewriteMarkers(source);
    if (!result.valid)
        return result;
    result.content = fillMissingSections(mergeConsecutiveSections(result.content), supported);
    return result;
}

Content MigrationRewriter::mergeConsecutiveSections(const Content &document)
{
    const Content flat = document.compacted();
    const QList<Span> spans = findSpans(SectionMarkers::findMarkers(flat));

    Content::Builder builder;
    qsizetype copied = 0;
    for (qsizetype i = 0; i < spans.size();) {
        qsizetype last = i;
        while (last + 1 < spans.size()
               && spans.at(last + 1).id == spans.at(i).id
               && flat.slice(spans.at(last).end, spans.at(last + 1).start).trim().isEmpty()) {
            ++last;
        }

        if (last > i) {
            Content::Builder inner;
            for (qsizetype k = i; k <= last; ++k) {
                const Content part = flat.slice(spans.at(k).innerStart, spans.at(k).innerEnd).trim();
                if (part.isEmpty())
                    continue;
                if (!inner.isEmpty())
                    inner.append(QLatin1StringView("\n\n"));
                inner.append(part);
            }
            qDebug() << "MigrationRewriter: merged" << (last - i + 1)
                     << SectionIdentifiers::name(spans.at(i).id) << "sections";
            builder.append(flat.slice(copied, spans.at(i).start))
                .append(SectionMarkers::section(spans.at(i).id, inner.build()).trim());
            copied = spans.at(last).end;
        }
        i = last + 1;
    }

    if (copied == 0)
        return document;
    builder.append(flat.slice(copied));
    return builder.build();
}

Content MigrationRewriter::fillMissingSections(const Content &document,
                                               const QList<SectionIdentifier> &supported)
{
    const QList<SectionIdentifier> &order = SectionIdentifiers::all();
    Content result = document.compacted();

    for (const SectionIdentifier id : order) {
        if (!supported.contains(id))
            continue;

        const QList<Marker> markers = SectionMarkers::findMarkers(result);
        QList<SectionIdentifier> present;
        for (const Marker &marker : markers) {
            if (marker.kind == Marker::Start && !present.contains(marker.id))
                present.append(marker.id);
        }
        if (present.contains(id))
            continue;

        // End of the nearest preceding section that is present and closed.
        qsizetype anchor = -1;
        for (qsizetype k = order.indexOf(id) - 1; k >= 0 && anchor == -1; --k) {
            const SectionIdentifier candidate = order.at(k);
            if (!present.contains(candidate))
                continue;
            bool opened = false;
            for (const Marker &marker : markers) {
                if (marker.id != candidate)
                    continue;
                if (marker.kind == Marker::Start) {
                    opened = true;
                } else if (opened) {
                    anchor = marker.end;
                    break;
                }
            }
        }

        const Content startMarker = SectionMarkers::start(id);
        const Content endMarker = SectionMarkers::end(id);
        Content::Builder builder;
        if (anchor != -1) {
            builder.append(result.slice(0, anchor))
                .append(QLatin1StringView("\n\n"))
                .append(startMarker)
                .append(Content::kNewLine)
                .append(endMarker)
                .append(result.slice(anchor));
        } else {
            qDebug() << "MigrationRewriter: no section precedes"
                     << SectionIdentifiers::name(id) << "- appending it";
            builder.append(result);
            if (!result.isEmpty()) {
                if (!result.endsWith(u"\n"))
                    builder.append(Content::kNewLine);
                builder.append(Content::kNewLine);
            }
            builder.append(startMarker)
                .append(Content::kNewLine)
                .append(endMarker)
                .append(Content::kNewLine);
        }
        result = builder.build().compacted();
    }
    return result;
}
