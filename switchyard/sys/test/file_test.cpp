#include "switchyard/file.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>

namespace switchyard {

class FileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _dir = std::filesystem::temp_directory_path() /
           ("switchyard-file-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(_dir);
  }

  void TearDown() override { std::filesystem::remove_all(_dir); }

  std::string writeFile(const std::string& name, const std::string& content) const {
    const auto path = _dir / name;
    std::ofstream(path, std::ios::binary) << content;
    return path.string();
  }

  std::filesystem::path _dir;
};

TEST_F(FileTest, ReadsContentAtOffsets) {
  const std::string path = writeFile("data.txt", "hello switchyard");
  File file(path);
  ASSERT_TRUE(file);
  EXPECT_EQ(file.openErrno(), 0);
  EXPECT_EQ(file.size(), 16U);

  char buf[5];
  ASSERT_EQ(file.readAt(buf, 6), 5U);
  EXPECT_EQ(std::string(buf, 5), "switc");
  EXPECT_EQ(file.readAt(buf, 16), 0U);
}

TEST_F(FileTest, DetectsContentType) {
  EXPECT_EQ(File(writeFile("site.css", "body{}")).detectedContentType(), "text/css");
  EXPECT_EQ(File(writeFile("blob.bin", "x")).detectedContentType(), "application/octet-stream");
}

TEST_F(FileTest, MissingFileIsNotFound) {
  File file((_dir / "missing.txt").string());
  EXPECT_FALSE(file);
  EXPECT_EQ(file.openErrno(), ENOENT);
  EXPECT_TRUE(file.notFound());
}

TEST_F(FileTest, DirectoryIsNotARegularFile) {
  File file(_dir.string());
  EXPECT_FALSE(file);
  EXPECT_EQ(file.openErrno(), EISDIR);
  EXPECT_TRUE(file.notFound());
}

}  // namespace switchyard
