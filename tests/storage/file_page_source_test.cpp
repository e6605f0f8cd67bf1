/**
 * @file file_page_source_test.cpp
 * @brief Unit tests for FilePageSource
 */

#include <gtest/gtest.h>

#include <vector>

#include "storage/file_page_source.hpp"
#include "test_utils.hpp"

namespace mdfkit {
namespace {

class FilePageSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_file_ = std::make_unique<test::TempFile>("fps_test_");
        std::vector<uint8_t> bytes(3 * config::kPageSize);
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(i / config::kPageSize + 1);
        }
        temp_file_->write(bytes);
    }

    void TearDown() override {
        source_.reset();
        temp_file_.reset();
    }

    std::unique_ptr<test::TempFile> temp_file_;
    std::unique_ptr<FilePageSource> source_;
};

TEST_F(FilePageSourceTest, OpenAndReadPage) {
    ASSERT_TRUE(FilePageSource::open(temp_file_->string(), &source_).ok());
    EXPECT_EQ(source_->file_ids(), std::vector<file_id_t>{config::kPrimaryFileId});
    EXPECT_EQ(source_->page_count(1), 3u);

    std::vector<uint8_t> buffer(config::kPageSize);
    ASSERT_TRUE(source_->read_page(PagePointer(1, 2), buffer).ok());
    EXPECT_EQ(buffer[0], 3);
    EXPECT_EQ(buffer[config::kPageSize - 1], 3);

    ASSERT_TRUE(source_->read_page(PagePointer(1, 0), buffer).ok());
    EXPECT_EQ(buffer[0], 1);
}

TEST_F(FilePageSourceTest, PageBeyondEndIsNotFound) {
    ASSERT_TRUE(FilePageSource::open(temp_file_->string(), &source_).ok());

    std::vector<uint8_t> buffer(config::kPageSize);
    EXPECT_TRUE(source_->read_page(PagePointer(1, 3), buffer).is_not_found());
    EXPECT_TRUE(source_->read_page(PagePointer(2, 0), buffer).is_not_found());
}

TEST_F(FilePageSourceTest, TrailingPartialPageIsIgnored) {
    std::vector<uint8_t> bytes(2 * config::kPageSize + 100, 0x11);
    temp_file_->write(bytes);

    ASSERT_TRUE(FilePageSource::open(temp_file_->string(), &source_).ok());
    EXPECT_EQ(source_->page_count(1), 2u);
}

TEST_F(FilePageSourceTest, MissingFileIsIOError) {
    Status status = FilePageSource::open("/nonexistent/dir/file.mdf", &source_);
    EXPECT_TRUE(status.is_io_error());
    EXPECT_EQ(source_, nullptr);
}

TEST_F(FilePageSourceTest, SecondaryFile) {
    ASSERT_TRUE(FilePageSource::open(temp_file_->string(), &source_).ok());

    test::TempFile secondary("fps_ndf_");
    secondary.write(std::vector<uint8_t>(config::kPageSize, 0x77));
    ASSERT_TRUE(source_->add_file(3, secondary.string()).ok());

    EXPECT_EQ(source_->file_ids(), (std::vector<file_id_t>{1, 3}));
    EXPECT_EQ(source_->total_page_count(), 4u);

    std::vector<uint8_t> buffer(config::kPageSize);
    ASSERT_TRUE(source_->read_page(PagePointer(3, 0), buffer).ok());
    EXPECT_EQ(buffer[10], 0x77);

    EXPECT_EQ(source_->add_file(3, secondary.string()).code(), StatusCode::kInvalidArgument);
}

TEST_F(FilePageSourceTest, RejectsWrongBufferSize) {
    ASSERT_TRUE(FilePageSource::open(temp_file_->string(), &source_).ok());

    std::vector<uint8_t> buffer(10);
    EXPECT_EQ(source_->read_page(PagePointer(1, 0), buffer).code(),
              StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace mdfkit
