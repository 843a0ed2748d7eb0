#include <gtest/gtest.h>

#include "migration/migrationservice.h"
#include "section/destinationlockregistry.h"
#include "section/sectionwriter.h"
#include "storage/memorydocumentstorage.h"
#include "testhelpers.h"

class MigrationServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service.setSupportedSections({SectionIdentifier::Inputs, SectionIdentifier::Outputs});
    }

    MemoryDocumentStorage storage;
    DestinationLockRegistry locks;
    SectionWriter writer{&storage, &locks};
    MigrationService service{&writer};
};

TEST_F(MigrationServiceTest, BuiltinToolsAreRegistered)
{
    EXPECT_EQ(service.toolNames(),
              (QStringList{QStringLiteral("action-docs"), QStringLiteral("actdocs"),
                           QStringLiteral("github-action-readme-generator"), QStringLiteral("auto-doc")}));
    EXPECT_TRUE(service.tool(QStringLiteral("ActDocs")).has_value());
    EXPECT_FALSE(service.tool(QStringLiteral("nope")).has_value());
}

TEST_F(MigrationServiceTest, RegisterToolReplacesByName)
{
    MigrationTool custom = MigrationTools::actdocs();
    custom.name = QStringLiteral("ACTDOCS");
    custom.sectionMappings.clear();
    service.registerTool(custom);
    EXPECT_EQ(service.toolNames().size(), 4);
    EXPECT_TRUE(service.tool(QStringLiteral("actdocs"))->sectionMappings.isEmpty());

    custom.name = QStringLiteral("mine");
    service.registerTool(custom);
    EXPECT_EQ(service.toolNames().last(), QStringLiteral("mine"));
}

TEST_F(MigrationServiceTest, DetectsToolFromMarkers)
{
    storage.setDocument(QStringLiteral("a.md"), "text\n<!-- start inputs -->\n<!-- end inputs -->\n");
    storage.setDocument(QStringLiteral("b.md"), "# X\n\n## Outputs\n");
    storage.setDocument(QStringLiteral("c.md"), "nothing here\n");

    EXPECT_EQ(service.detect(QStringLiteral("a.md"))->name, QStringLiteral("github-action-readme-generator"));
    EXPECT_EQ(service.detect(QStringLiteral("b.md"))->name, QStringLiteral("auto-doc"));
    EXPECT_FALSE(service.detect(QStringLiteral("c.md")).has_value());
    EXPECT_FALSE(service.detect(QStringLiteral("missing.md")).has_value());
}

TEST_F(MigrationServiceTest, DetectsMarkerBeyondFirstChunk)
{
    QByteArray doc(3 * MigrationService::kDetectionChunkSize, 'x');
    doc.append("\n<!-- actdocs inputs start -->\n");
    storage.setDocument(QStringLiteral("big.md"), doc);
    EXPECT_EQ(service.detect(QStringLiteral("big.md"))->name, QStringLiteral("actdocs"));
}

TEST_F(MigrationServiceTest, MigratesAndWrites)
{
    storage.setDocument(QStringLiteral("README.md"),
                        "<!-- actdocs inputs start -->\nI\n<!-- actdocs inputs end -->\n");
    const MigrationService::Result result = service.migrate(QStringLiteral("README.md"));
    ASSERT_TRUE(result.valid) << str(result.errorMessage);
    EXPECT_EQ(str(result.toolName), "actdocs");
    const char *expected = "<!-- inputs:start -->\nI\n<!-- inputs:end -->\n\n"
                           "<!-- outputs:start -->\n<!-- outputs:end -->\n";
    EXPECT_EQ(str(result.content), expected);
    EXPECT_EQ(storage.document(QStringLiteral("README.md")), QByteArray(expected));
}

TEST_F(MigrationServiceTest, DryRunLeavesDestinationUntouched)
{
    const QByteArray original("<!-- start inputs -->\nI\n<!-- end inputs -->\n");
    storage.setDocument(QStringLiteral("README.md"), original);
    const MigrationService::Result result =
        service.migrate(QStringLiteral("README.md"), QStringLiteral("github-action-readme-generator"), true);
    ASSERT_TRUE(result.valid);
    EXPECT_TRUE(result.content.includes(u"<!-- inputs:start -->"));
    EXPECT_EQ(storage.document(QStringLiteral("README.md")), original);
    EXPECT_EQ(storage.writeCount(), 0);
}

TEST_F(MigrationServiceTest, Failures)
{
    storage.setDocument(QStringLiteral("README.md"), "plain\n");
    EXPECT_FALSE(service.migrate(QStringLiteral("README.md"), QStringLiteral("unknown")).valid);
    EXPECT_FALSE(service.migrate(QStringLiteral("README.md")).valid);

    storage.setDocument(QStringLiteral("odd.md"), "<!-- action-docs-inputs source=\"action.yml\" -->\n");
    const MigrationService::Result odd = service.migrate(QStringLiteral("odd.md"));
    EXPECT_FALSE(odd.valid);
    EXPECT_EQ(storage.writeCount(), 0);
}

TEST_F(MigrationServiceTest, MissingDestinationIsNothingToDo)
{
    const MigrationService::Result result = service.migrate(QStringLiteral("missing.md"));
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.content.isEmpty());
    EXPECT_EQ(storage.writeCount(), 0);
}
