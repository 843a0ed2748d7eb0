#include <gtest/gtest.h>

#include "section/destinationlockregistry.h"
#include "section/sectionwriter.h"
#include "storage/memorydocumentstorage.h"
#include "testhelpers.h"

#include <QIODevice>
#include <QThreadPool>

class SectionWriterTest : public ::testing::Test
{
protected:
    std::string document(const char *name) const
    {
        return QString::fromUtf8(storage.document(QString::fromUtf8(name))).toStdString();
    }

    MemoryDocumentStorage storage;
    DestinationLockRegistry locks;
    SectionWriter writer{&storage, &locks};
};

TEST_F(SectionWriterTest, CreatesMissingDestination)
{
    QString error;
    ASSERT_TRUE(writer.writeSection(QStringLiteral("README.md"), SectionIdentifier::Inputs,
                                    md("| a |"), &error));
    EXPECT_EQ(document("README.md"), "<!-- inputs:start -->\n\n| a |\n\n<!-- inputs:end -->\n");
}

TEST_F(SectionWriterTest, TruncatedDestinationIsLeftUntouched)
{
    storage.setDocument(QStringLiteral("README.md"), QByteArray("ok\xe2\x9c"));
    QString error;
    EXPECT_FALSE(writer.writeSection(QStringLiteral("README.md"), SectionIdentifier::Usage,
                                     md("u"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(storage.document(QStringLiteral("README.md")), QByteArray("ok\xe2\x9c"));
    EXPECT_EQ(storage.writeCount(), 0);
}

TEST_F(SectionWriterTest, ReplacesOnlyTheNamedSection)
{
    storage.setDocument(QStringLiteral("README.md"),
                        "# Action\n\n<!-- inputs:start -->\nold\n<!-- inputs:end -->\n\nFooter\n");
    ASSERT_TRUE(writer.writeSection(QStringLiteral("README.md"), SectionIdentifier::Inputs, md("new")));
    EXPECT_EQ(document("README.md"),
              "# Action\n\n<!-- inputs:start -->\n\nnew\n\n<!-- inputs:end -->\n\nFooter\n");
}

TEST_F(SectionWriterTest, WriteSectionsAppliesInOrderInOneWrite)
{
    ASSERT_TRUE(writer.writeSections(QStringLiteral("README.md"),
                                     {qMakePair(SectionIdentifier::Usage, md("u")),
                                      qMakePair(SectionIdentifier::License, md("l"))}));
    EXPECT_EQ(storage.writeCount(), 1);
    EXPECT_EQ(document("README.md"),
              "<!-- usage:start -->\n\nu\n\n<!-- usage:end -->\n\n"
              "<!-- license:start -->\n\nl\n\n<!-- license:end -->\n");
}

TEST_F(SectionWriterTest, InvalidDocumentIsNotOverwritten)
{
    storage.setDocument(QStringLiteral("bad.md"), QByteArray("\xc3("));
    QString error;
    EXPECT_FALSE(writer.writeSection(QStringLiteral("bad.md"), SectionIdentifier::Usage, md("u"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(storage.writeCount(), 0);
}

TEST_F(SectionWriterTest, ReplaceContent)
{
    ASSERT_TRUE(writer.replaceContent(QStringLiteral("a.md"), md("all new\n")));
    EXPECT_EQ(document("a.md"), "all new\n");
}

TEST_F(SectionWriterTest, RewriteStreamsCurrentDocument)
{
    storage.setDocument(QStringLiteral("a.md"), "abc");
    const bool ok = writer.rewrite(QStringLiteral("a.md"),
        [](QIODevice *source, QString *) -> std::optional<Content> {
            return Content(QString::fromUtf8(source->readAll()).toUpper());
        });
    ASSERT_TRUE(ok);
    EXPECT_EQ(document("a.md"), "ABC");

    QString error;
    EXPECT_FALSE(writer.rewrite(QStringLiteral("a.md"),
        [](QIODevice *, QString *message) -> std::optional<Content> {
            *message = QStringLiteral("refused");
            return std::nullopt;
        }, &error));
    EXPECT_EQ(str(error), "refused");
    EXPECT_EQ(document("a.md"), "ABC");
}

TEST_F(SectionWriterTest, ConcurrentWritersDoNotLoseSections)
{
    const QList<SectionIdentifier> &ids = SectionIdentifiers::all();
    QThreadPool pool;
    pool.setMaxThreadCount(4);
    for (const SectionIdentifier id : ids) {
        pool.start([this, id]() {
            EXPECT_TRUE(writer.writeSection(QStringLiteral("README.md"), id,
                                            Content(SectionIdentifiers::name(id))));
        });
    }
    pool.waitForDone();

    const std::string result = document("README.md");
    for (const SectionIdentifier id : ids) {
        const std::string start = "<!-- " + SectionIdentifiers::name(id).toStdString() + ":start -->";
        EXPECT_NE(result.find(start), std::string::npos) << start;
    }
    EXPECT_EQ(locks.activeKeyCount(), 0);
}
