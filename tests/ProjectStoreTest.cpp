#include "ProjectStore.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

class ProjectStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_path = m_dir.filePath("projects_data.json");
    }

    void writeRaw(const QByteArray& bytes)
    {
        QFile file(m_path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(bytes);
    }

    QJsonObject readBack() const
    {
        QFile file(m_path);
        if (!file.open(QIODevice::ReadOnly))
            return {};
        return QJsonDocument::fromJson(file.readAll()).object();
    }

    QTemporaryDir m_dir;
    QString       m_path;
};

}

TEST_F(ProjectStoreTest, LoadFromMissingFileIsZero)
{
    ProjectStore store(m_path);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 0.0);
    EXPECT_TRUE(store.projects().isEmpty());
    EXPECT_FALSE(QFile::exists(m_path));
}

TEST_F(ProjectStoreTest, SaveThenLoadReturnsExactValue)
{
    ProjectStore store(m_path);
    for (double value : {0.0, 15.0, 812.5, 0.1, 1234567.891011, 1e-9}) {
        ASSERT_TRUE(store.save("Thesis", value)) << store.lastError().toStdString();
        EXPECT_EQ(store.load("Thesis"), value);
    }
}

TEST_F(ProjectStoreTest, SaveKeepsOtherProjects)
{
    ProjectStore store(m_path);
    ASSERT_TRUE(store.save("Thesis", 5400.0));
    ASSERT_TRUE(store.save("Website", 60.0));
    ASSERT_TRUE(store.save("Thesis", 5410.0));

    EXPECT_DOUBLE_EQ(store.load("Website"), 60.0);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 5410.0);
    EXPECT_EQ(store.projects(), QStringList({"Thesis", "Website"}));
}

TEST_F(ProjectStoreTest, NewStoreInstanceSeesSavedValues)
{
    {
        ProjectStore writer(m_path);
        ASSERT_TRUE(writer.save("Thesis", 15.0));
    }
    ProjectStore reader(m_path);
    EXPECT_DOUBLE_EQ(reader.load("Thesis"), 15.0);
    EXPECT_DOUBLE_EQ(reader.load("Unknown"), 0.0);
}

TEST_F(ProjectStoreTest, FileIsHumanReadableJsonObject)
{
    ProjectStore store(m_path);
    ASSERT_TRUE(store.save("Thesis", 90.0));

    const QJsonObject root = readBack();
    ASSERT_TRUE(root.contains("Thesis"));
    EXPECT_DOUBLE_EQ(root.value("Thesis").toDouble(), 90.0);
}

TEST_F(ProjectStoreTest, CorruptFileLoadsAsZero)
{
    writeRaw("{ this is not json");
    ProjectStore store(m_path);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 0.0);
    EXPECT_TRUE(store.projects().isEmpty());
}

TEST_F(ProjectStoreTest, NonObjectDocumentLoadsAsZero)
{
    writeRaw("[1, 2, 3]");
    ProjectStore store(m_path);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 0.0);
}

TEST_F(ProjectStoreTest, MalformedEntriesAreSkipped)
{
    writeRaw(R"({
        "Thesis": 300,
        "Negative": -5,
        "Text": "12",
        "Nested": { "2024-01-01T10:00:00": 1.5 },
        "": 7,
        "Website": 42.5
    })");

    ProjectStore store(m_path);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 300.0);
    EXPECT_DOUBLE_EQ(store.load("Website"), 42.5);
    EXPECT_DOUBLE_EQ(store.load("Negative"), 0.0);
    EXPECT_DOUBLE_EQ(store.load("Text"), 0.0);
    EXPECT_DOUBLE_EQ(store.load("Nested"), 0.0);
    EXPECT_EQ(store.projects(), QStringList({"Thesis", "Website"}));
}

TEST_F(ProjectStoreTest, PaddedKeysAreSkippedNotMerged)
{
    writeRaw(R"({ "A": 10, " A": 99, "B ": 5 })");

    ProjectStore store(m_path);
    EXPECT_DOUBLE_EQ(store.load("A"), 10.0);
    EXPECT_DOUBLE_EQ(store.load("B"), 0.0);
    EXPECT_EQ(store.projects(), QStringList({"A"}));
}

TEST_F(ProjectStoreTest, SaveOverCorruptFileWritesValidDocument)
{
    writeRaw("garbage");
    ProjectStore store(m_path);
    ASSERT_TRUE(store.save("Thesis", 10.0));
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 10.0);
}

TEST_F(ProjectStoreTest, SaveRejectsInvalidInput)
{
    ProjectStore store(m_path);
    EXPECT_FALSE(store.save("  ", 10.0));
    EXPECT_FALSE(store.lastError().isEmpty());
    EXPECT_FALSE(store.save("Thesis", -1.0));
    EXPECT_FALSE(QFile::exists(m_path));
}

TEST_F(ProjectStoreTest, SaveFailureReportsErrorAndKeepsNothingBroken)
{
    // A regular file where the parent directory should be makes the path
    // unwritable for every user, root included.
    const QString blocker = m_dir.filePath("blocker");
    {
        QFile file(blocker);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    }
    ProjectStore store(blocker + "/projects_data.json");
    EXPECT_FALSE(store.save("Thesis", 10.0));
    EXPECT_FALSE(store.lastError().isEmpty());
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 0.0);
}

TEST_F(ProjectStoreTest, AddProjectCreatesZeroEntryOnce)
{
    ProjectStore store(m_path);
    ASSERT_TRUE(store.save("Thesis", 100.0));
    ASSERT_TRUE(store.addProject(" Website "));
    ASSERT_TRUE(store.addProject("Thesis"));

    EXPECT_DOUBLE_EQ(store.load("Website"), 0.0);
    EXPECT_DOUBLE_EQ(store.load("Thesis"), 100.0);
    EXPECT_EQ(store.projects(), QStringList({"Thesis", "Website"}));
    EXPECT_FALSE(store.addProject(""));
}
