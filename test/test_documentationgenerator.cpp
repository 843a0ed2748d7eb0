#include <gtest/gtest.h>

#include "generate/documentationgenerator.h"
#include "section/destinationlockregistry.h"
#include "section/sectionwriter.h"
#include "storage/memorydocumentstorage.h"
#include "testhelpers.h"

class DocumentationGeneratorTest : public ::testing::Test
{
protected:
    static SectionManifest manifest(const char *json)
    {
        const SectionManifest::Result result = SectionManifest::parse(json);
        EXPECT_TRUE(result.valid) << str(result.errorMessage);
        return result.manifest;
    }

    MemoryDocumentStorage storage;
    DestinationLockRegistry locks;
    SectionWriter writer{&storage, &locks};
    DocumentationGenerator generator{&writer};
};

TEST_F(DocumentationGeneratorTest, RendersBlocksSeparatedByBlankLines)
{
    const auto bodies = generator.renderSections(manifest(R"({"sections": [
        {"id": "inputs", "blocks": [
            {"heading": "Inputs"},
            {"table": {"headers": ["Name", "Age"], "rows": [["John", "25"], ["Jane", "30"]]}}
        ]}]})"));
    ASSERT_TRUE(bodies.has_value());
    ASSERT_EQ(bodies->size(), 1);
    EXPECT_EQ(bodies->at(0).first, SectionIdentifier::Inputs);
    EXPECT_EQ(str(bodies->at(0).second),
              "## Inputs\n\n"
              "| Name | Age |\n"
              "| ---- | --- |\n"
              "| John | 25  |\n"
              "| Jane | 30  |\n");
}

TEST_F(DocumentationGeneratorTest, BadgesAndCenter)
{
    const auto bodies = generator.renderSections(manifest(R"({"sections": [
        {"id": "badges", "blocks": [{"badges": [
            {"label": "CI", "image": "https://img/ci.svg", "url": "https://ci"},
            {"label": "License", "image": "https://img/mit.svg"}]}]},
        {"id": "header", "blocks": [{"center": "# Tool\nDoes things"}]}
    ]})"));
    ASSERT_TRUE(bodies.has_value());
    ASSERT_EQ(bodies->size(), 2);
    EXPECT_EQ(str(bodies->at(0).second), "<div align=\"center\">\n  # Tool\n  Does things\n</div>\n");
    EXPECT_EQ(str(bodies->at(1).second),
              "[![CI](https://img/ci.svg)](https://ci) ![License](https://img/mit.svg)\n");
}

TEST_F(DocumentationGeneratorTest, TableOfContentsListsOtherSections)
{
    const auto bodies = generator.renderSections(manifest(R"({"sections": [
        {"id": "contents", "blocks": [{"heading": "Contents"}, {"toc": true}]},
        {"id": "usage", "blocks": [{"heading": "Usage"}, {"heading": "With Docker", "level": 3},
                                   {"heading": "Deep", "level": 4}]},
        {"id": "inputs", "blocks": [{"heading": "Inputs"}]}
    ]})"));
    ASSERT_TRUE(bodies.has_value());
    ASSERT_EQ(bodies->size(), 3);
    EXPECT_EQ(bodies->at(0).first, SectionIdentifier::Contents);
    EXPECT_EQ(str(bodies->at(0).second),
              "## Contents\n\n"
              "- [Usage](#usage)\n"
              "  - [With Docker](#with-docker)\n"
              "- [Inputs](#inputs)\n");
}

TEST_F(DocumentationGeneratorTest, TableErrorFailsRendering)
{
    QString error;
    const auto bodies = generator.renderSections(manifest(R"({"sections": [
        {"id": "outputs", "blocks": [{"table": {"headers": ["A", "B"], "rows": [["1"]]}}]}]})"), &error);
    EXPECT_FALSE(bodies.has_value());
    EXPECT_EQ(str(error), "Section \"outputs\": Table row 1 has 1 cells, expected 2");
}

TEST_F(DocumentationGeneratorTest, GenerateWritesSectionsIntoDestination)
{
    storage.setDocument(QStringLiteral("README.md"),
                        "# My Action\n\n<!-- usage:start -->\nstale\n<!-- usage:end -->\n\nNotes\n");
    const DocumentationGenerator::Result result = generator.generate(QStringLiteral("README.md"),
        manifest(R"({"sections": [
            {"id": "usage", "blocks": [{"code": "uses: me/action@v1", "language": "yaml"}]},
            {"id": "license", "blocks": [{"paragraph": "MIT"}]}]})"));
    ASSERT_TRUE(result.valid) << str(result.errorMessage);
    EXPECT_EQ(result.sections,
              (QList<SectionIdentifier>{SectionIdentifier::Usage, SectionIdentifier::License}));
    EXPECT_EQ(QString::fromUtf8(storage.document(QStringLiteral("README.md"))).toStdString(),
              "# My Action\n\n"
              "<!-- usage:start -->\n\n```yaml\nuses: me/action@v1\n```\n\n<!-- usage:end -->\n\n"
              "Notes\n\n"
              "<!-- license:start -->\n\nMIT\n\n<!-- license:end -->\n");
    EXPECT_EQ(storage.writeCount(), 1);
}

TEST_F(DocumentationGeneratorTest, DryRunReturnsDocumentWithoutWriting)
{
    generator.setLinkFormat(LinkFormat::Full);
    const DocumentationGenerator::Result result = generator.generate(QStringLiteral("README.md"),
        manifest(R"({"sections": [{"id": "overview", "blocks": [{"paragraph": "See https://x.io"}]}]})"),
        true);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(str(result.document),
              "<!-- overview:start -->\n\nSee [https://x.io](https://x.io)\n\n<!-- overview:end -->\n");
    EXPECT_FALSE(storage.exists(QStringLiteral("README.md")));
}
