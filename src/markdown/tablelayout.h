/*
 * tablelayout.h — Aligned GitHub-flavored Markdown tables from Content cells
 *
 * Each logical cell is split into atomic display lines. Fenced code blocks
 * and inline code spans never straddle a line split; a line holding a fenced
 * block is rendered through the single-line HTML fallback. A logical row is
 * as tall as its tallest cell; shorter cells are padded with empty lines.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_TABLELAYOUT_H
#define DOKUMENTOR_TABLELAYOUT_H

#include "content/content.h"

#include <QList>
#include <QString>

namespace TableLayout {

struct Table {
    QList<Content> headers;
    QList<QList<Content>> rows;
};

struct Result {
    Content markdown;
    bool valid = true;
    QString errorMessage;
};

// Atomic display lines of one cell, escaped for use inside a table row.
QList<Content> displayLines(const Content &cell);

// Render the table. Rows whose arity differs from the header are rejected.
// A table with no headers and no rows renders as empty content.
Result render(const Table &table);

} // namespace TableLayout

#endif // DOKUMENTOR_TABLELAYOUT_H
