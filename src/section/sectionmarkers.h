/*
 * sectionmarkers.h — Canonical section markers and idempotent section placement
 *
 * A section is rendered as
 *
 *   <!-- id:start -->
 *
 *   trimmed body
 *
 *   <!-- id:end -->
 *
 * and an empty body collapses to the two marker lines.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_SECTIONMARKERS_H
#define DOKUMENTOR_SECTIONMARKERS_H

#include "content/content.h"
#include "section/sectionidentifier.h"

#include <QList>

#include <optional>

namespace SectionMarkers {

struct Marker {
    enum Kind { Start, End };

    SectionIdentifier id = SectionIdentifier::Header;
    Kind kind = Start;
    qsizetype start = 0;   // offset of "<!--"
    qsizetype end = 0;     // past "-->"
};

Content start(SectionIdentifier id);
Content end(SectionIdentifier id);
Content section(SectionIdentifier id, const Content &body);

// Canonical marker beginning exactly at position, if any. Whitespace inside
// the comment is tolerated and the identifier is matched case-insensitively.
std::optional<Marker> markerAt(const Content &document, qsizetype position);

// Every canonical marker in document order.
QList<Marker> findMarkers(const Content &document);

// Replace the section's span in document with the freshly rendered section,
// or append it when the document has no start marker for id. Applying the
// same section twice yields the same document as applying it once.
Content applySection(const Content &document, SectionIdentifier id, const Content &body);

} // namespace SectionMarkers

#endif // DOKUMENTOR_SECTIONMARKERS_H
