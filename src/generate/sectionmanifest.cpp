/*
 * sectionmanifest.cpp — JSON description of documentation sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionmanifest.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QObject>

#include <algorithm>
#include <optional>

namespace {

const QStringList &blockKinds()
{
    static const QStringList kinds = {
        QStringLiteral("heading"),   QStringLiteral("paragraph"), QStringLiteral("code"),
        QStringLiteral("inlineCode"), QStringLiteral("list"),     QStringLiteral("table"),
        QStringLiteral("badges"),    QStringLiteral("center"),    QStringLiteral("markdown"),
        QStringLiteral("toc"),
    };
    return kinds;
}

std::optional<QStringList> stringList(const QJsonValue &value)
{
    if (!value.isArray())
        return std::nullopt;
    QStringList strings;
    for (const QJsonValue &item : value.toArray()) {
        if (!item.isString())
            return std::nullopt;
        strings.append(item.toString());
    }
    return strings;
}

std::optional<Manifest::Block> parseBlock(const QJsonObject &obj, QString *error)
{
    QString kind;
    for (const QString &candidate : blockKinds()) {
        if (!obj.contains(candidate))
            continue;
        if (!kind.isEmpty()) {
            *error = QObject::tr("block has both \"%1\" and \"%2\"").arg(kind, candidate);
            return std::nullopt;
        }
        kind = candidate;
    }
    if (kind.isEmpty()) {
        *error = QObject::tr("block has no known kind");
        return std::nullopt;
    }

    const QJsonValue value = obj.value(kind);
    auto requireString = [&](const QJsonValue &v) -> std::optional<QString> {
        if (!v.isString()) {
            *error = QObject::tr("\"%1\" expects a string").arg(kind);
            return std::nullopt;
        }
        return v.toString();
    };

    if (kind == QLatin1String("heading")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        const int level = obj.value(QStringLiteral("level")).toInt(2);
        if (level < 1 || level > 6) {
            *error = QObject::tr("heading level %1 is out of range").arg(level);
            return std::nullopt;
        }
        return Manifest::Heading{*text, level};
    }
    if (kind == QLatin1String("paragraph")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        return Manifest::Paragraph{*text};
    }
    if (kind == QLatin1String("code")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        return Manifest::Code{*text, obj.value(QStringLiteral("language")).toString()};
    }
    if (kind == QLatin1String("inlineCode")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        return Manifest::InlineCode{*text};
    }
    if (kind == QLatin1String("list")) {
        const auto items = stringList(value);
        if (!items) {
            *error = QObject::tr("\"list\" expects an array of strings");
            return std::nullopt;
        }
        return Manifest::List{*items, obj.value(QStringLiteral("ordered")).toBool(false)};
    }
    if (kind == QLatin1String("table")) {
        const QJsonObject table = value.toObject();
        const auto headers = stringList(table.value(QStringLiteral("headers")));
        if (!value.isObject() || !headers) {
            *error = QObject::tr("\"table\" expects an object with a \"headers\" array of strings");
            return std::nullopt;
        }
        Manifest::Table result{*headers, {}};
        for (const QJsonValue &row : table.value(QStringLiteral("rows")).toArray()) {
            const auto cells = stringList(row);
            if (!cells) {
                *error = QObject::tr("table rows must be arrays of strings");
                return std::nullopt;
            }
            result.rows.append(*cells);
        }
        return result;
    }
    if (kind == QLatin1String("badges")) {
        if (!value.isArray()) {
            *error = QObject::tr("\"badges\" expects an array");
            return std::nullopt;
        }
        Manifest::Badges result;
        for (const QJsonValue &item : value.toArray()) {
            const QJsonObject badge = item.toObject();
            if (!badge.value(QStringLiteral("label")).isString()
                || !badge.value(QStringLiteral("image")).isString()) {
                *error = QObject::tr("badges need a \"label\" and an \"image\"");
                return std::nullopt;
            }
            result.badges.append({badge.value(QStringLiteral("label")).toString(),
                                  badge.value(QStringLiteral("image")).toString(),
                                  badge.value(QStringLiteral("url")).toString()});
        }
        return result;
    }
    if (kind == QLatin1String("center")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        return Manifest::Center{*text};
    }
    if (kind == QLatin1String("markdown")) {
        const auto text = requireString(value);
        if (!text)
            return std::nullopt;
        return Manifest::Markdown{*text};
    }

    // toc
    const int maxLevel = obj.value(QStringLiteral("maxLevel")).toInt(3);
    if (maxLevel < 2 || maxLevel > 6) {
        *error = QObject::tr("toc maxLevel %1 is out of range").arg(maxLevel);
        return std::nullopt;
    }
    return Manifest::Toc{maxLevel};
}

} // anonymous namespace

SectionManifest::Result SectionManifest::parse(const QByteArray &json)
{
    Result result;
    auto fail = [&result](const QString &message) {
        result.valid = false;
        result.errorMessage = message;
        result.manifest.m_sections.clear();
        return result;
    };

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(QObject::tr("Invalid section manifest at offset %1: %2")
                        .arg(parseError.offset)
                        .arg(parseError.errorString()));
    if (!doc.isObject() || !doc.object().value(QStringLiteral("sections")).isArray())
        return fail(QObject::tr("Section manifest needs a \"sections\" array"));

    const QJsonArray sections = doc.object().value(QStringLiteral("sections")).toArray();
    for (qsizetype i = 0; i < sections.size(); ++i) {
        const QJsonObject obj = sections.at(i).toObject();
        const QString name = obj.value(QStringLiteral("id")).toString();
        const std::optional<SectionIdentifier> id = SectionIdentifiers::fromName(name);
        if (!id)
            return fail(QObject::tr("Section %1 has unknown id \"%2\"").arg(i + 1).arg(name));
        if (result.manifest.contains(*id))
            return fail(QObject::tr("Section \"%1\" is listed twice").arg(SectionIdentifiers::name(*id)));

        Manifest::Section section;
        section.id = *id;
        const QJsonArray blocks = obj.value(QStringLiteral("blocks")).toArray();
        for (qsizetype b = 0; b < blocks.size(); ++b) {
            QString error;
            const std::optional<Manifest::Block> block = parseBlock(blocks.at(b).toObject(), &error);
            if (!block)
                return fail(QObject::tr("Section \"%1\", block %2: %3")
                                .arg(SectionIdentifiers::name(*id))
                                .arg(b + 1)
                                .arg(error));
            section.blocks.append(*block);
        }
        result.manifest.m_sections.append(section);
    }

    std::stable_sort(result.manifest.m_sections.begin(), result.manifest.m_sections.end(),
                     [](const Manifest::Section &a, const Manifest::Section &b) {
                         return a.id < b.id;
                     });
    return result;
}

SectionManifest::Result SectionManifest::load(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        Result result;
        result.valid = false;
        result.errorMessage = QObject::tr("Cannot open %1: %2").arg(filePath, file.errorString());
        return result;
    }
    return parse(file.readAll());
}

bool SectionManifest::contains(SectionIdentifier id) const
{
    return std::any_of(m_sections.cbegin(), m_sections.cend(),
                       [id](const Manifest::Section &section) { return section.id == id; });
}
