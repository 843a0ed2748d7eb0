#include <gtest/gtest.h>

#include "cli/commandrunner.h"
#include "storage/memorydocumentstorage.h"
#include "testhelpers.h"

#include <QBuffer>

class CommandRunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        output.open(QIODevice::WriteOnly);
        runner.setConcurrency(3);
    }

    std::string printed() const { return output.data().toStdString(); }

    static SectionManifest manifest(const char *json)
    {
        const SectionManifest::Result result = SectionManifest::parse(json);
        EXPECT_TRUE(result.valid) << str(result.errorMessage);
        return result.manifest;
    }

    MemoryDocumentStorage storage;
    QBuffer output;
    CommandRunner runner{&storage, &output};
};

TEST_F(CommandRunnerTest, ListsTools)
{
    EXPECT_EQ(runner.listTools(), CommandRunner::Success);
    EXPECT_EQ(printed(), "action-docs\nactdocs\ngithub-action-readme-generator\nauto-doc\n");
}

TEST_F(CommandRunnerTest, GeneratesEveryDestination)
{
    const QStringList destinations = {QStringLiteral("a.md"), QStringLiteral("b.md"), QStringLiteral("c.md"),
                                      QStringLiteral("a.md")};
    const int code = runner.generate(
        manifest(R"({"sections": [{"id": "usage", "blocks": [{"paragraph": "Run it"}]}]})"),
        LinkFormat::Auto, destinations, false);
    EXPECT_EQ(code, CommandRunner::Success);
    for (const char *name : {"a.md", "b.md", "c.md"}) {
        EXPECT_EQ(storage.document(QString::fromUtf8(name)),
                  QByteArray("<!-- usage:start -->\n\nRun it\n\n<!-- usage:end -->\n"))
            << name;
    }
    EXPECT_TRUE(printed().empty());
}

TEST_F(CommandRunnerTest, DryRunPrintsWithoutWriting)
{
    const int code = runner.generate(
        manifest(R"({"sections": [{"id": "license", "blocks": [{"paragraph": "MIT"}]}]})"),
        LinkFormat::Auto, {QStringLiteral("README.md")}, true);
    EXPECT_EQ(code, CommandRunner::Success);
    EXPECT_EQ(printed(), "<!-- license:start -->\n\nMIT\n\n<!-- license:end -->\n");
    EXPECT_EQ(storage.writeCount(), 0);
}

TEST_F(CommandRunnerTest, DryRunOverSeveralDestinationsLabelsOutput)
{
    const int code = runner.generate(
        manifest(R"({"sections": [{"id": "license", "blocks": [{"paragraph": "MIT"}]}]})"),
        LinkFormat::Auto, {QStringLiteral("one.md"), QStringLiteral("two.md")}, true);
    EXPECT_EQ(code, CommandRunner::Success);
    EXPECT_NE(printed().find("==> one.md <=="), std::string::npos);
    EXPECT_NE(printed().find("==> two.md <=="), std::string::npos);
}

TEST_F(CommandRunnerTest, FailureInOneDestinationFailsTheRun)
{
    storage.setDocument(QStringLiteral("bad.md"), QByteArray("\xff"));
    const int code = runner.generate(
        manifest(R"({"sections": [{"id": "usage", "blocks": [{"paragraph": "x"}]}]})"),
        LinkFormat::Auto, {QStringLiteral("good.md"), QStringLiteral("bad.md")}, false);
    EXPECT_EQ(code, CommandRunner::ProcessingFailure);
    EXPECT_TRUE(storage.exists(QStringLiteral("good.md")));
}

TEST_F(CommandRunnerTest, MigrateUsageErrors)
{
    EXPECT_EQ(runner.migrate(QStringLiteral("nope"), {QStringLiteral("README.md")}, false),
              CommandRunner::UsageError);
    EXPECT_EQ(runner.migrate(QString(), {}, false), CommandRunner::UsageError);
}

TEST_F(CommandRunnerTest, MigratesDestinations)
{
    storage.setDocument(QStringLiteral("README.md"),
                        "<!-- actdocs inputs start -->\nI\n<!-- actdocs inputs end -->\n");
    EXPECT_EQ(runner.migrate(QStringLiteral("actdocs"), {QStringLiteral("README.md")}, false),
              CommandRunner::Success);
    const QByteArray migrated = storage.document(QStringLiteral("README.md"));
    EXPECT_TRUE(migrated.startsWith("<!-- inputs:start -->\nI\n<!-- inputs:end -->\n"));
    EXPECT_TRUE(migrated.contains("<!-- license:start -->"));
}
