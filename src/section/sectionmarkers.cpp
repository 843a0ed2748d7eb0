/*
 * sectionmarkers.cpp — Canonical section markers and idempotent section placement
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionmarkers.h"

#include <QDebug>

namespace SectionMarkers {

namespace {

constexpr QStringView kCommentOpen = u"<!--";
constexpr QStringView kCommentClose = u"-->";

Content marker(SectionIdentifier id, QLatin1StringView kind)
{
    return Content(QStringLiteral("<!-- %1:%2 -->").arg(SectionIdentifiers::name(id), kind));
}

qsizetype skipBlanks(const Content &document, qsizetype position)
{
    while (position < document.size()) {
        const QChar ch = document.at(position);
        if (ch != Content::kSpace && ch != Content::kTab)
            break;
        ++position;
    }
    return position;
}

bool isNameChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_') || ch == QLatin1Char('-');
}

enum class ScanState {
    Copy,
    Replace,   // inside the span being replaced
    Drop,      // inside a duplicate span of the same section
};

} // anonymous namespace

Content start(SectionIdentifier id)
{
    return marker(id, QLatin1StringView("start"));
}

Content end(SectionIdentifier id)
{
    return marker(id, QLatin1StringView("end"));
}

Content section(SectionIdentifier id, const Content &body)
{
    const Content trimmed = body.trim();
    Content::Builder builder;
    builder.append(start(id)).append(Content::kNewLine);
    if (!trimmed.isEmpty())
        builder.append(Content::kNewLine).append(trimmed).append(QLatin1StringView("\n\n"));
    builder.append(end(id)).append(Content::kNewLine);
    return builder.build();
}

std::optional<Marker> markerAt(const Content &document, qsizetype position)
{
    if (!document.startsWith(kCommentOpen, position))
        return std::nullopt;

    qsizetype cursor = skipBlanks(document, position + kCommentOpen.size());
    const qsizetype nameStart = cursor;
    while (cursor < document.size() && isNameChar(document.at(cursor)))
        ++cursor;
    const auto id = SectionIdentifiers::fromName(document.slice(nameStart, cursor).toString());
    if (!id || !document.includesAt(QLatin1Char(':'), cursor))
        return std::nullopt;
    ++cursor;

    Marker result;
    result.id = *id;
    result.start = position;
    if (document.startsWith(u"start", cursor)) {
        result.kind = Marker::Start;
        cursor += 5;
    } else if (document.startsWith(u"end", cursor)) {
        result.kind = Marker::End;
        cursor += 3;
    } else {
        return std::nullopt;
    }

    cursor = skipBlanks(document, cursor);
    if (!document.startsWith(kCommentClose, cursor))
        return std::nullopt;
    result.end = cursor + kCommentClose.size();
    return result;
}

QList<Marker> findMarkers(const Content &document)
{
    const Content flat = document.compacted();
    QList<Marker> markers;
    qsizetype position = flat.search(kCommentOpen);
    while (position != -1) {
        const std::optional<Marker> found = markerAt(flat, position);
        if (found) {
            markers.append(*found);
            position = flat.search(kCommentOpen, found->end);
        } else {
            position = flat.search(kCommentOpen, position + kCommentOpen.size());
        }
    }
    return markers;
}

Content applySection(const Content &document, SectionIdentifier id, const Content &body)
{
    const Content flat = document.compacted();
    const Content rendered = section(id, body);
    const Content startMarker = start(id);
    const Content endMarker = end(id);

    Content::Builder output;
    Content::Builder skipped;
    ScanState state = ScanState::Copy;
    bool placed = false;
    bool lastLineBlank = true;

    qsizetype lineStart = 0;
    while (lineStart < flat.size()) {
        const qsizetype newline = flat.search(Content::kNewLine, lineStart);
        const qsizetype lineEnd = newline == -1 ? flat.size() : newline;
        const Content line = flat.slice(lineStart, lineEnd);
        const Content trimmed = line.trim();
        lineStart = lineEnd + 1;

        if (state == ScanState::Copy) {
            if (trimmed == startMarker) {
                state = placed ? ScanState::Drop : ScanState::Replace;
                if (!placed)
                    output.append(rendered);
                placed = true;
                skipped = Content::Builder();
                skipped.append(line).append(Content::kNewLine);
                lastLineBlank = false;
                continue;
            }
            output.append(line).append(Content::kNewLine);
            lastLineBlank = trimmed.isEmpty();
            continue;
        }

        skipped.append(line).append(Content::kNewLine);
        if (trimmed == endMarker)
            state = ScanState::Copy;
    }

    if (state != ScanState::Copy) {
        qWarning() << "SectionMarkers: unterminated" << SectionIdentifiers::name(id)
                   << "section, keeping the original lines";
        output.append(skipped.build());
    }

    if (!placed) {
        if (!output.isEmpty() && !lastLineBlank)
            output.append(Content::kNewLine);
        output.append(rendered);
    }
    return output.build();
}

} // namespace SectionMarkers
