#include <gtest/gtest.h>

#include "storage/filedocumentstorage.h"
#include "storage/memorydocumentstorage.h"
#include "testhelpers.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

TEST(MemoryDocumentStorageTest, MissingDocumentReadsEmpty)
{
    MemoryDocumentStorage storage;
    EXPECT_FALSE(storage.exists(QStringLiteral("README.md")));
    const std::optional<Content> content = storage.read(QStringLiteral("README.md"));
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->isEmpty());

    QString error;
    EXPECT_FALSE(storage.open(QStringLiteral("README.md"), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(MemoryDocumentStorageTest, WriteThenRead)
{
    MemoryDocumentStorage storage;
    ASSERT_TRUE(storage.write(QStringLiteral("doc.md"), md("caf\xc3\xa9\n")));
    EXPECT_TRUE(storage.exists(QStringLiteral("doc.md")));
    EXPECT_EQ(storage.document(QStringLiteral("doc.md")), QByteArray("caf\xc3\xa9\n"));
    EXPECT_EQ(str(*storage.read(QStringLiteral("doc.md"))), "caf\xc3\xa9\n");
    EXPECT_EQ(storage.writeCount(), 1);
}

TEST(MemoryDocumentStorageTest, InvalidUtf8IsAnError)
{
    MemoryDocumentStorage storage;
    storage.setDocument(QStringLiteral("bad.md"), QByteArray("ok \xff\xfe"));
    QString error;
    EXPECT_FALSE(storage.read(QStringLiteral("bad.md"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}

TEST(MemoryDocumentStorageTest, TruncatedSequenceAtEndIsAnError)
{
    MemoryDocumentStorage storage;
    storage.setDocument(QStringLiteral("cut.md"), QByteArray("ok\xe2\x9c"));
    QString error;
    EXPECT_FALSE(storage.read(QStringLiteral("cut.md"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}

TEST(FileDocumentStorageTest, WritesAtomicallyAndCreatesDirectories)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("docs/nested/README.md"));

    FileDocumentStorage storage;
    EXPECT_FALSE(storage.exists(path));
    QString error;
    ASSERT_TRUE(storage.write(path, md("# Hello\n"), &error)) << str(error);
    EXPECT_TRUE(storage.exists(path));
    EXPECT_EQ(str(*storage.read(path)), "# Hello\n");

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), QByteArray("# Hello\n"));
}

TEST(FileDocumentStorageTest, KeyIsCleanAbsolutePath)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    FileDocumentStorage storage;
    const QString a = dir.filePath(QStringLiteral("x/../README.md"));
    const QString b = dir.filePath(QStringLiteral("./README.md"));
    EXPECT_EQ(storage.destinationKey(a), storage.destinationKey(b));
    EXPECT_TRUE(QDir::isAbsolutePath(storage.destinationKey(QStringLiteral("README.md"))));
}
