#include "test_base.hpp"
#include "core/file_utils.hpp"
#include <regex>
#include <stdexcept>

class FileUtilsTest : public TestBase
{
};

TEST_F(FileUtilsTest, FileExtensionIsLowercaseWithoutDot)
{
    EXPECT_EQ(FileUtils::getFileExtension("INVOICE.PDF"), "pdf");
    EXPECT_EQ(FileUtils::getFileExtension("/tmp/scan.v2.JPeg"), "jpeg");
    EXPECT_EQ(FileUtils::getFileExtension("README"), "");
    EXPECT_EQ(FileUtils::getFileExtension("trailing."), "");
}

TEST_F(FileUtilsTest, ReadFileBytesReturnsContents)
{
    const std::vector<uint8_t> data = {0x00, 0xFF, 0x10, 0x20};
    const std::string path = writeFile("blob.bin", data);

    EXPECT_EQ(FileUtils::readFileBytes(path), data);
}

TEST_F(FileUtilsTest, ReadFileBytesThrowsForMissingFile)
{
    EXPECT_THROW(FileUtils::readFileBytes(testPath("missing.bin")), std::runtime_error);
}

TEST_F(FileUtilsTest, EnsureDirectoryCreatesParents)
{
    const std::string nested = testPath("a/b/c");
    FileUtils::ensureDirectory(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));

    // Existing directory is fine
    EXPECT_NO_THROW(FileUtils::ensureDirectory(nested));
}

TEST_F(FileUtilsTest, EnsureDirectoryFailsOnRegularFile)
{
    const std::string file = writeFile("plain.txt", {'x'});
    EXPECT_THROW(FileUtils::ensureDirectory(file), std::runtime_error);
}

TEST_F(FileUtilsTest, ArtifactNamesAreTimestampedAndUnique)
{
    const std::regex pattern(R"(ela_\d{8}_\d{6}_\d{6}_[0-9a-f]{8}\.png)");
    const std::string first = FileUtils::uniqueArtifactName("ela", "png");
    const std::string second = FileUtils::uniqueArtifactName("ela", "png");

    EXPECT_TRUE(std::regex_match(first, pattern)) << first;
    EXPECT_TRUE(std::regex_match(second, pattern)) << second;
    EXPECT_NE(first, second);
}

TEST_F(FileUtilsTest, RandomHexLength)
{
    EXPECT_EQ(FileUtils::randomHex(4).size(), 8u);
    EXPECT_EQ(FileUtils::randomHex(0), "");
}
