/*
 * headingcollector.h — MD4C heading outline of a Markdown document
 *
 * Collects ATX and setext headings with their plain text and the anchor
 * GitHub assigns to them, for building tables of contents.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef DOKUMENTOR_HEADINGCOLLECTOR_H
#define DOKUMENTOR_HEADINGCOLLECTOR_H

#include "content/content.h"

#include <QHash>
#include <QList>
#include <QString>

#include <md4c.h>

class HeadingCollector
{
public:
    struct Heading {
        int level = 0;
        QString text;
        QString anchor;   // without '#', unique within one collect() call
    };

    QList<Heading> collect(const Content &markdown);

    // GitHub heading slug: lower case, punctuation dropped, spaces to '-'.
    static QString slugFor(const QString &text);

private:
    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    QString uniqueAnchor(const QString &text);

    QList<Heading> m_headings;
    QHash<QString, int> m_anchorCounts;
    bool m_inHeading = false;
    int m_level = 0;
    QString m_text;
};

#endif // DOKUMENTOR_HEADINGCOLLECTOR_H
