#include <gtest/gtest.h>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "test_support.hpp"
#include "tforge/artifact_locator.hpp"

namespace tforge {
namespace {

class ArtifactLocatorTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir_.isValid()); }

    QString place(const QString& name, const QDateTime& modified) {
        const QString path = QDir(dir_.path()).filePath(name);
        EXPECT_TRUE(test::writeTextFile(path, name));
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::ReadWrite));
        EXPECT_TRUE(file.setFileTime(modified, QFileDevice::FileModificationTime));
        return path;
    }

    QTemporaryDir dir_;
    const QDateTime base_ = QDateTime::currentDateTimeUtc().addSecs(-3600);
};

TEST_F(ArtifactLocatorTest, PicksNewestByModificationTime) {
    place("com.example.demo_0.9_iphoneos-arm.deb", base_);
    const QString newest = place("com.example.demo_1.0_iphoneos-arm.deb", base_.addSecs(120));
    place("com.example.demo_0.8_iphoneos-arm.deb", base_.addSecs(60));

    EXPECT_EQ(ArtifactLocator::findLatest(dir_.path(), ".deb"), newest);
}

TEST_F(ArtifactLocatorTest, ModificationTimeBeatsFileNameOrder) {
    const QString older = place("z_old.deb", base_);
    const QString newer = place("a_new.deb", base_.addSecs(120));

    EXPECT_EQ(ArtifactLocator::findLatest(dir_.path(), ".deb"), newer);
    EXPECT_EQ(ArtifactLocator::listArtifacts(dir_.path(), ".deb"), QStringList({newer, older}));
}

TEST_F(ArtifactLocatorTest, IgnoresOtherExtensions) {
    const QString package = place("tweak.deb", base_);
    place("build.log", base_.addSecs(300));
    place("tweak.deb.partial", base_.addSecs(600));

    EXPECT_EQ(ArtifactLocator::findLatest(dir_.path(), ".deb"), package);
}

TEST_F(ArtifactLocatorTest, ListsNewestFirst) {
    const QString older = place("a.deb", base_);
    const QString newer = place("b.deb", base_.addSecs(30));

    EXPECT_EQ(ArtifactLocator::listArtifacts(dir_.path(), ".deb"), QStringList({newer, older}));
}

TEST_F(ArtifactLocatorTest, EmptyOrMissingDirectoryYieldsNothing) {
    EXPECT_TRUE(ArtifactLocator::findLatest(dir_.path(), ".deb").isEmpty());
    EXPECT_TRUE(ArtifactLocator::findLatest(QDir(dir_.path()).filePath("packages"), ".deb").isEmpty());
    EXPECT_TRUE(ArtifactLocator::listArtifacts(QDir(dir_.path()).filePath("packages"), ".deb").isEmpty());
}

}  // namespace
}  // namespace tforge
