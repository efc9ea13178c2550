#include "fastdocx/archive/ZipReader.hpp"
#include "fastdocx/archive/ZipWriter.hpp"
#include "fastdocx/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace fastdocx {
namespace archive {

class ZipArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/ZipArchive_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);

        test_dir_ = "test_zip_archive";
        std::filesystem::create_directories(test_dir_);
        test_zip_path_ = test_dir_ + "/test.zip";
        std::filesystem::remove(test_zip_path_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        fastdocx::Logger::getInstance().shutdown();
    }

    std::string createTestString(size_t size) {
        std::string result;
        for (size_t i = 0; i < size; ++i) {
            result += static_cast<char>('A' + (i % 26));
        }
        return result;
    }

    std::string test_dir_;
    std::string test_zip_path_;
};

TEST_F(ZipArchiveTest, WriteThenRead) {
    const std::string big = createTestString(100000);
    {
        ZipWriter writer(test_zip_path_);
        ASSERT_TRUE(writer.open());
        EXPECT_EQ(writer.addFile("[Content_Types].xml", "<Types/>"), ZipError::Ok);
        EXPECT_EQ(writer.addFile("word/footer1.xml", big), ZipError::Ok);
        EXPECT_EQ(writer.entriesWritten(), 2u);
        EXPECT_TRUE(writer.close());
    }

    ZipReader reader(test_zip_path_);
    ASSERT_TRUE(reader.open());

    auto files = reader.listFiles();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "[Content_Types].xml");
    EXPECT_EQ(files[1], "word/footer1.xml");

    std::string content;
    EXPECT_EQ(reader.extractFile("word/footer1.xml", content), ZipError::Ok);
    EXPECT_EQ(content, big);

    ZipReader::EntryInfo info;
    ASSERT_TRUE(reader.getEntryInfo("word/footer1.xml", info));
    EXPECT_EQ(info.uncompressed_size, big.size());
    EXPECT_LT(info.compressed_size, info.uncompressed_size);

    EXPECT_EQ(reader.fileExists("word/missing.xml"), ZipError::FileNotFound);
    EXPECT_EQ(reader.extractFile("word/missing.xml", content), ZipError::FileNotFound);
}

TEST_F(ZipArchiveTest, StoredEntries) {
    {
        ZipWriter writer(test_zip_path_);
        EXPECT_EQ(writer.setCompressionLevel(0), ZipError::Ok);
        EXPECT_EQ(writer.setCompressionLevel(12), ZipError::InvalidParameter);
        ASSERT_TRUE(writer.open());
        EXPECT_EQ(writer.addFile("a.txt", "stored"), ZipError::Ok);
        EXPECT_TRUE(writer.close());
    }

    ZipReader reader(test_zip_path_);
    ASSERT_TRUE(reader.open());
    std::string content;
    EXPECT_EQ(reader.extractFile("a.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "stored");
}

TEST_F(ZipArchiveTest, DuplicateEntryRejected) {
    ZipWriter writer(test_zip_path_);
    ASSERT_TRUE(writer.open());
    EXPECT_EQ(writer.addFile("a.xml", "1"), ZipError::Ok);
    EXPECT_EQ(writer.addFile("a.xml", "2"), ZipError::InvalidParameter);
    EXPECT_EQ(writer.addFile("", "x"), ZipError::InvalidParameter);
    EXPECT_TRUE(writer.close());
}

TEST_F(ZipArchiveTest, NotOpenErrors) {
    ZipWriter writer(test_zip_path_);
    EXPECT_EQ(writer.addFile("a.xml", "1"), ZipError::NotOpen);

    ZipReader reader(test_dir_ + "/does_not_exist.zip");
    EXPECT_FALSE(reader.open());
    std::string content;
    EXPECT_NE(reader.extractFile("a.xml", content), ZipError::Ok);
}

}} // namespace fastdocx::archive
