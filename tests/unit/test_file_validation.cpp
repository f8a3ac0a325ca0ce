#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "handoff/transfer/file_validation.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/crypto/random.hpp"
#include <algorithm>
#include <stdexcept>

using namespace handoff::transfer;
using namespace handoff::core;

namespace {

std::vector<std::uint8_t> png_bytes(std::size_t size) {
    std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    data.resize(size, 0x42);
    return data;
}

std::shared_ptr<FileSource> memory_file(const std::string& name, std::size_t size, std::string mime = "") {
    return std::make_shared<MemoryFileSource>(name, std::vector<std::uint8_t>(size, 0x61), std::move(mime));
}

class MockFileSource : public FileSource {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, mime_type, (), (const, override));
    MOCK_METHOD(std::uint64_t, size, (), (const, override));
    MOCK_METHOD(std::uint64_t, last_modified, (), (const, override));
    MOCK_METHOD(std::size_t, read, (std::uint64_t, std::span<std::uint8_t>), (override));
};

bool has_message(const std::vector<std::string>& messages, const std::string& text) {
    return std::find(messages.begin(), messages.end(), text) != messages.end();
}

}

class FileValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(handoff::crypto::SecureRandom::initialize());
    }
    
    TransferLimits limits;
};

TEST_F(FileValidationTest, SanitizeStripsTraversalAndSeparators) {
    EXPECT_EQ(sanitize_file_name("../../etc/passwd"), "etcpasswd");
    EXPECT_EQ(sanitize_file_name("..\\..\\boot.ini"), "boot.ini");
    EXPECT_EQ(sanitize_file_name("a<b>:c|d?.txt"), "abcd.txt");
    EXPECT_EQ(sanitize_file_name("report\x01\x7f.pdf"), "report.pdf");
    EXPECT_EQ(sanitize_file_name("holiday photo.jpg"), "holiday photo.jpg");
    
    // Dropped characters must not leave a new ".." behind.
    EXPECT_EQ(sanitize_file_name("./."), "unnamed_file");
    EXPECT_EQ(sanitize_file_name("..././"), "unnamed_file");
    EXPECT_EQ(sanitize_file_name(".?."), "unnamed_file");
    EXPECT_EQ(sanitize_file_name("<.>."), "unnamed_file");
    EXPECT_EQ(sanitize_file_name("a/./.b"), "a.b");
    EXPECT_EQ(sanitize_file_name("x.\x01.y").find(".."), std::string::npos);
}

TEST_F(FileValidationTest, SanitizeFallsBackForEmptyNames) {
    EXPECT_EQ(sanitize_file_name(""), "unnamed_file");
    EXPECT_EQ(sanitize_file_name("...."), "unnamed_file");
    EXPECT_EQ(sanitize_file_name("///"), "unnamed_file");
}

TEST_F(FileValidationTest, SanitizeCapsLengthAndKeepsExtension) {
    auto sanitized = sanitize_file_name(std::string(300, 'a') + ".pdf");
    EXPECT_EQ(sanitized.size(), MAX_FILE_NAME_LENGTH);
    EXPECT_EQ(sanitized.substr(sanitized.size() - 4), ".pdf");
    
    auto no_extension = sanitize_file_name(std::string(400, 'b'));
    EXPECT_EQ(no_extension.size(), MAX_FILE_NAME_LENGTH);
}

TEST_F(FileValidationTest, ExtensionHelpers) {
    EXPECT_EQ(file_extension("Archive.TAR.GZ"), ".gz");
    EXPECT_EQ(file_extension("README"), "");
    EXPECT_TRUE(is_blocked_extension("setup.EXE"));
    EXPECT_TRUE(is_blocked_extension("install.sh"));
    EXPECT_FALSE(is_blocked_extension("photo.png"));
    EXPECT_TRUE(is_allowed_mime_type("image/png"));
    EXPECT_FALSE(is_allowed_mime_type("application/x-msdownload"));
}

TEST_F(FileValidationTest, ValidImageHasNoFindings) {
    MemoryFileSource source("photo.png", png_bytes(2048));
    auto result = validate_file(source, limits);
    
    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(FileValidationTest, SignatureMismatchIsOnlyAWarning) {
    MemoryFileSource source("photo.png", std::vector<std::uint8_t>(64, 0x00));
    auto result = validate_file(source, limits);
    
    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(has_message(result.warnings, "File signature does not match declared type"));
}

TEST_F(FileValidationTest, EmptyAndBlockedFilesAreErrors) {
    MemoryFileSource empty("notes.txt", {});
    auto empty_result = validate_file(empty, limits);
    EXPECT_FALSE(empty_result.is_valid());
    EXPECT_TRUE(has_message(empty_result.errors, "File is empty"));
    
    MemoryFileSource blocked("setup.exe", std::vector<std::uint8_t>(16, 0x4D));
    auto blocked_result = validate_file(blocked, limits);
    EXPECT_FALSE(blocked_result.is_valid());
    EXPECT_TRUE(has_message(blocked_result.errors, "This file type is not allowed for security reasons"));
}

TEST_F(FileValidationTest, OversizedFileIsRejected) {
    limits.max_file_size = 10;
    MemoryFileSource source("notes.txt", std::vector<std::uint8_t>(11, 0x61));
    auto result = validate_file(source, limits);
    
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front().rfind("File exceeds maximum size of", 0), 0u);
}

TEST_F(FileValidationTest, UnknownTypesProduceWarnings) {
    MemoryFileSource unknown("data.xyz", std::vector<std::uint8_t>(8, 0x01));
    auto unknown_result = validate_file(unknown, limits);
    EXPECT_TRUE(unknown_result.is_valid());
    EXPECT_TRUE(has_message(unknown_result.warnings, "Unknown file type - proceed with caution"));
    
    MemoryFileSource zip("bundle.zip", {0x50, 0x4B, 0x03, 0x04, 0x00});
    auto zip_result = validate_file(zip, limits);
    EXPECT_TRUE(zip_result.is_valid());
    EXPECT_TRUE(has_message(zip_result.warnings, "File type \"application/zip\" may not be fully supported"));
}

TEST_F(FileValidationTest, RenamedFileIsFlagged) {
    MemoryFileSource source("my:notes.txt", std::vector<std::uint8_t>(8, 0x61));
    auto result = validate_file(source, limits);
    
    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(has_message(result.warnings, "File name was modified for security"));
}

TEST_F(FileValidationTest, ReadFailureIsAnError) {
    using ::testing::Return;
    using ::testing::Throw;
    
    ::testing::NiceMock<MockFileSource> source;
    ON_CALL(source, name()).WillByDefault(Return("broken.pdf"));
    ON_CALL(source, mime_type()).WillByDefault(Return("application/pdf"));
    ON_CALL(source, size()).WillByDefault(Return(1024));
    EXPECT_CALL(source, read(0, ::testing::_)).WillOnce(Throw(std::runtime_error("device not ready")));
    
    auto result = validate_file(source, limits);
    
    ASSERT_FALSE(result.is_valid());
    EXPECT_EQ(result.errors.front(), "File could not be read: device not ready");
}

TEST_F(FileValidationTest, BatchSeparatesValidAndRejected) {
    auto batch = validate_batch({memory_file("a.txt", 100), memory_file("b.exe", 10), memory_file("c.txt", 0)},
                                limits);
    
    EXPECT_TRUE(batch.accepted());
    EXPECT_EQ(batch.valid_files.size(), 1u);
    EXPECT_EQ(batch.rejected_files.size(), 2u);
    EXPECT_EQ(batch.total_size, 100u);
    EXPECT_EQ(batch.rejection_reason(), "");
}

TEST_F(FileValidationTest, BatchOverSessionLimitIsRefused) {
    limits.max_session_size = 100;
    auto batch = validate_batch({memory_file("a.txt", 60), memory_file("b.txt", 60)}, limits);
    
    EXPECT_FALSE(batch.within_session_limit);
    EXPECT_FALSE(batch.accepted());
    EXPECT_NE(batch.rejection_reason().find("exceeds the session limit"), std::string::npos);
}

TEST_F(FileValidationTest, BatchOverFileCountIsRefused) {
    limits.max_files_per_batch = 2;
    auto batch = validate_batch({memory_file("a.txt", 1), memory_file("b.txt", 1), memory_file("c.txt", 1)},
                                limits);
    
    EXPECT_FALSE(batch.accepted());
    EXPECT_EQ(batch.rejection_reason(), "Too many files in one batch (3)");
}

TEST_F(FileValidationTest, BatchWithNothingValidIsRefused) {
    auto batch = validate_batch({memory_file("a.exe", 10)}, limits);
    
    EXPECT_FALSE(batch.accepted());
    EXPECT_EQ(batch.rejection_reason(), "No valid files to send");
}

TEST_F(FileValidationTest, ChunkCount) {
    EXPECT_EQ(chunk_count(0, 64), 0u);
    EXPECT_EQ(chunk_count(1, 64), 1u);
    EXPECT_EQ(chunk_count(64, 64), 1u);
    EXPECT_EQ(chunk_count(65, 64), 2u);
    EXPECT_EQ(chunk_count(100, 0), 0u);
}

TEST_F(FileValidationTest, MetadataDescribesSource) {
    limits.chunk_size = 1024;
    auto data = png_bytes(2500);
    MemoryFileSource source("../photo.png", data, "", 1700000000000ULL);
    
    auto metadata = create_file_metadata(source, limits);
    
    EXPECT_EQ(metadata.id.size(), 16u);
    EXPECT_EQ(metadata.name, "../photo.png");
    EXPECT_EQ(metadata.sanitized_name, "photo.png");
    EXPECT_EQ(metadata.size, 2500u);
    EXPECT_EQ(metadata.mime_type, "image/png");
    EXPECT_EQ(metadata.last_modified, 1700000000000ULL);
    EXPECT_EQ(metadata.total_chunks, 3u);
    ASSERT_TRUE(metadata.hash.has_value());
    EXPECT_EQ(*metadata.hash, handoff::crypto::hash_utils::chunk_checksum(
        std::span<const std::uint8_t>(data.data(), 1024)));
}

TEST_F(FileValidationTest, MetadataDefaultsMimeType) {
    MemoryFileSource source("blob", std::vector<std::uint8_t>(10, 0x00));
    auto metadata = create_file_metadata(source, limits);
    
    EXPECT_EQ(metadata.mime_type, "application/octet-stream");
    EXPECT_EQ(metadata.total_chunks, 1u);
    
    auto other = create_file_metadata(source, limits);
    EXPECT_NE(metadata.id, other.id);
}
