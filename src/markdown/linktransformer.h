/*
 * linktransformer.h — Turn bare URLs in prose into Markdown links
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_LINKTRANSFORMER_H
#define DOKUMENTOR_LINKTRANSFORMER_H

#include "content/content.h"

#include <QString>

#include <optional>

enum class LinkFormat {
    Auto,   // <url>
    Full,   // [url](url)
    None,
};

namespace LinkTransformer {

QString linkFormatName(LinkFormat format);
std::optional<LinkFormat> linkFormatFromName(const QString &name);

// URLs inside code, existing links and angle-bracket autolinks are left alone.
// Trailing sentence punctuation stays outside the link.
Content transformUrls(const Content &content, LinkFormat format);

} // namespace LinkTransformer

#endif // DOKUMENTOR_LINKTRANSFORMER_H
