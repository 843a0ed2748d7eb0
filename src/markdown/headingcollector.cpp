/*
 * headingcollector.cpp — MD4C heading outline of a Markdown document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "headingcollector.h"

#include <QDebug>

namespace {

QString resolveEntity(const QString &entity)
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),  QStringLiteral("&")},
        {QStringLiteral("&lt;"),   QStringLiteral("<")},
        {QStringLiteral("&gt;"),   QStringLiteral(">")},
        {QStringLiteral("&quot;"), QStringLiteral("\"")},
        {QStringLiteral("&apos;"), QStringLiteral("'")},
        {QStringLiteral("&nbsp;"), QString(QChar(0x00A0))},
    };
    const auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();

    // &#NNN; and &#xHHH;
    if (entity.startsWith(QLatin1String("&#")) && entity.endsWith(QLatin1Char(';'))) {
        bool ok = false;
        const QStringView digits = QStringView(entity).mid(2, entity.size() - 3);
        uint codePoint = 0;
        if (digits.startsWith(QLatin1Char('x'), Qt::CaseInsensitive))
            codePoint = digits.mid(1).toUInt(&ok, 16);
        else
            codePoint = digits.toUInt(&ok, 10);
        if (ok && codePoint > 0 && codePoint <= 0x10FFFF) {
            const char32_t ucs4 = codePoint;
            return QString::fromUcs4(&ucs4, 1);
        }
    }
    return entity;
}

} // anonymous namespace

QList<HeadingCollector::Heading> HeadingCollector::collect(const Content &markdown)
{
    m_headings.clear();
    m_anchorCounts.clear();
    m_inHeading = false;
    m_text.clear();

    const QByteArray utf8 = markdown.toUtf8();

    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_DIALECT_GITHUB;
    parser.enter_block = &HeadingCollector::sEnterBlock;
    parser.leave_block = &HeadingCollector::sLeaveBlock;
    parser.enter_span = &HeadingCollector::sEnterSpan;
    parser.leave_span = &HeadingCollector::sLeaveSpan;
    parser.text = &HeadingCollector::sText;

    const int status = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()), &parser, this);
    if (status != 0)
        qWarning() << "HeadingCollector: md4c failed with status" << status;

    return m_headings;
}

QString HeadingCollector::slugFor(const QString &text)
{
    QString slug;
    slug.reserve(text.size());
    for (const QChar ch : text.trimmed().toLower()) {
        if (ch.isLetterOrNumber() || ch == QLatin1Char('-') || ch == QLatin1Char('_'))
            slug.append(ch);
        else if (ch == QLatin1Char(' '))
            slug.append(QLatin1Char('-'));
    }
    return slug;
}

QString HeadingCollector::uniqueAnchor(const QString &text)
{
    const QString slug = slugFor(text);
    const int seen = m_anchorCounts.value(slug, 0);
    m_anchorCounts.insert(slug, seen + 1);
    if (seen == 0)
        return slug;
    return slug + QLatin1Char('-') + QString::number(seen);
}

// --- Static callbacks ---

int HeadingCollector::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<HeadingCollector *>(userdata)->enterBlock(type, detail); }
int HeadingCollector::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<HeadingCollector *>(userdata)->leaveBlock(type, detail); }
int HeadingCollector::sEnterSpan(MD_SPANTYPE, void *, void *)
{ return 0; }
int HeadingCollector::sLeaveSpan(MD_SPANTYPE, void *, void *)
{ return 0; }
int HeadingCollector::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata)
{ return static_cast<HeadingCollector *>(userdata)->onText(type, text, size); }

// --- Handlers ---

int HeadingCollector::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    if (type == MD_BLOCK_H) {
        auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        m_inHeading = true;
        m_level = static_cast<int>(d->level);
        m_text.clear();
    }
    return 0;
}

int HeadingCollector::leaveBlock(MD_BLOCKTYPE type, void *)
{
    if (type == MD_BLOCK_H && m_inHeading) {
        Heading heading;
        heading.level = m_level;
        heading.text = m_text.simplified();
        heading.anchor = uniqueAnchor(heading.text);
        m_headings.append(heading);
        m_inHeading = false;
    }
    return 0;
}

int HeadingCollector::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    if (!m_inHeading)
        return 0;

    const QString str = QString::fromUtf8(text, static_cast<qsizetype>(size));
    switch (type) {
    case MD_TEXT_NORMAL:
    case MD_TEXT_CODE:
    case MD_TEXT_LATEXMATH:
        m_text.append(str);
        break;
    case MD_TEXT_ENTITY:
        m_text.append(resolveEntity(str));
        break;
    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR:
        m_text.append(QLatin1Char(' '));
        break;
    case MD_TEXT_NULLCHAR:
        m_text.append(QChar(0xFFFD));
        break;
    case MD_TEXT_HTML:
        break;
    }
    return 0;
}
