/*
 * migrationtool.cpp — Marker syntax of third-party documentation tools
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "migrationtool.h"

std::optional<SectionIdentifier> MigrationTool::mapName(const QString &sectionName) const
{
    QString key = sectionName.trimmed().toLower();
    if (normalizeName)
        key = normalizeName(key);
    const auto it = sectionMappings.constFind(key);
    if (it == sectionMappings.constEnd())
        return std::nullopt;
    return it.value();
}

bool MigrationTool::markersIdentical() const
{
    return style == MarkerStyle::Comment
        && startPattern.pattern() == endPattern.pattern()
        && startPattern.patternOptions() == endPattern.patternOptions();
}

namespace MigrationTools {

// <!-- action-docs-inputs source="action.yml" --> opens and closes alike.
MigrationTool actionDocs()
{
    MigrationTool tool;
    tool.name = QStringLiteral("action-docs");
    const QString marker = QStringLiteral(R"(<!--\s*action-docs-(?<name>\w+)\s+source=["'][^"']+["']\s*-->)");
    tool.startPattern = QRegularExpression(marker);
    tool.endPattern = QRegularExpression(marker);
    tool.detectionPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*action-docs-\w+\s+source=["'][^"']+["']\s*-->)"));
    tool.sectionMappings = {
        {QStringLiteral("header"), SectionIdentifier::Header},
        {QStringLiteral("description"), SectionIdentifier::Overview},
        {QStringLiteral("inputs"), SectionIdentifier::Inputs},
        {QStringLiteral("outputs"), SectionIdentifier::Outputs},
        {QStringLiteral("runs"), SectionIdentifier::Usage},
    };
    return tool;
}

// <!-- actdocs inputs start --> ... <!-- actdocs inputs end -->
MigrationTool actdocs()
{
    MigrationTool tool;
    tool.name = QStringLiteral("actdocs");
    tool.startPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*actdocs\s+(?<name>\w+)\s+start\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.endPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*actdocs\s+(?<name>\w+)\s+end\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.detectionPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*actdocs\s+\w+\s+(start|end)\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.sectionMappings = {
        {QStringLiteral("description"), SectionIdentifier::Overview},
        {QStringLiteral("inputs"), SectionIdentifier::Inputs},
        {QStringLiteral("secrets"), SectionIdentifier::Secrets},
        {QStringLiteral("outputs"), SectionIdentifier::Outputs},
        {QStringLiteral("permissions"), SectionIdentifier::Security},
    };
    return tool;
}

// <!-- start inputs --> ... <!-- end inputs -->
MigrationTool githubActionReadmeGenerator()
{
    MigrationTool tool;
    tool.name = QStringLiteral("github-action-readme-generator");
    tool.startPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*start\s+(?<name>[\w[\]/.-]+)\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.endPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*end\s+(?<name>[\w[\]/.-]+)\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.detectionPattern = QRegularExpression(
        QStringLiteral(R"(<!--\s*(start|end)\s+[\w[\]/.-]+\s*-->)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.sectionMappings = {
        {QStringLiteral("branding"), SectionIdentifier::Header},
        {QStringLiteral("title"), SectionIdentifier::Header},
        {QStringLiteral("badges"), SectionIdentifier::Badges},
        {QStringLiteral("description"), SectionIdentifier::Overview},
        {QStringLiteral("usage"), SectionIdentifier::Usage},
        {QStringLiteral("inputs"), SectionIdentifier::Inputs},
        {QStringLiteral("outputs"), SectionIdentifier::Outputs},
        {QStringLiteral("examples"), SectionIdentifier::Examples},
    };
    // Example blocks are keyed by their source directory.
    tool.normalizeName = [](const QString &name) {
        if (name.contains(QLatin1String(".github/ghadocs/examples")))
            return QStringLiteral("examples");
        return name;
    };
    return tool;
}

// ## Inputs, ## Outputs, ## Secrets, ## Description
MigrationTool autoDoc()
{
    MigrationTool tool;
    tool.name = QStringLiteral("auto-doc");
    tool.style = MigrationTool::MarkerStyle::Heading;
    tool.startPattern = QRegularExpression(
        QStringLiteral(R"(^(?<level>##)\s+(?<name>Inputs|Outputs|Secrets|Description)\s*$)"),
        QRegularExpression::CaseInsensitiveOption);
    tool.detectionPattern = QRegularExpression(
        QStringLiteral(R"(^##\s+(Inputs|Outputs|Secrets|Description)\s*$)"),
        QRegularExpression::MultilineOption);
    tool.sectionMappings = {
        {QStringLiteral("inputs"), SectionIdentifier::Inputs},
        {QStringLiteral("outputs"), SectionIdentifier::Outputs},
        {QStringLiteral("secrets"), SectionIdentifier::Secrets},
        {QStringLiteral("description"), SectionIdentifier::Overview},
    };
    return tool;
}

QList<MigrationTool> builtins()
{
    return {actionDocs(), actdocs(), githubActionReadmeGenerator(), autoDoc()};
}

} // namespace MigrationTools
