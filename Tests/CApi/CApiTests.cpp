#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "TestHelpers/IOTestHelpers.h"
#include "afile/afile_file.h"

using afile::test_helpers::makePattern;
using afile::test_helpers::ScopedTempDir;

namespace {
    class CApiTest : public ::testing::Test {
    protected:
        void SetUp() override {
            AfileFileSystemConfig cfg;
            afile_file_system_config_init(&cfg);
            cfg.worker_threads = 2;
            AfileStatus st = AFILE_ERR_UNKNOWN;
            fs = afile_file_system_create(&cfg, &st);
            ASSERT_EQ(st, AFILE_OK);
            ASSERT_NE(fs, nullptr);
        }

        void TearDown() override {
            afile_file_system_destroy(fs);
        }

        // Waits and returns the final status
        AfileFileOpStatus finish(afile_Operation op) {
            AfileStatus st = AFILE_ERR_UNKNOWN;
            afile_operation_wait(op, &st);
            EXPECT_EQ(st, AFILE_OK);
            return afile_operation_status(op);
        }

        std::string takeString(afile_Operation op) {
            AfileOwnedBuffer buf{};
            AfileStatus st = AFILE_ERR_UNKNOWN;
            afile_operation_take_buffer(op, &buf, &st);
            EXPECT_EQ(st, AFILE_OK);
            std::string out;
            if (buf.ptr) out.assign(reinterpret_cast<const char*>(buf.ptr), static_cast<size_t>(buf.len));
            afile_buffer_dispose(buf);
            return out;
        }

        afile_FileSystem fs = nullptr;
    };
}

TEST(CApiBasics, StatusStrings) {
    EXPECT_STREQ(afile_status_to_string(AFILE_OK), "AFILE_OK");
    EXPECT_STREQ(afile_status_to_string(AFILE_ERR_INVALID_ARG), "AFILE_ERR_INVALID_ARG");
    EXPECT_STREQ(afile_status_to_string(static_cast<AfileStatus>(99)), "AFILE_STATUS_UNKNOWN");
}

TEST(CApiBasics, VersionAndEmptyBufferDispose) {
    uint32_t major = 0, minor = 0, patch = 0;
    afile_get_version(&major, &minor, &patch);
    EXPECT_GE(major, 1u);
    afile_buffer_dispose(AfileOwnedBuffer{nullptr, 0});
}

TEST(CApiBasics, NullArguments_ReportInvalidArg) {
    AfileStatus st = AFILE_OK;
    EXPECT_EQ(afile_file_system_create(nullptr, &st), nullptr);
    EXPECT_EQ(st, AFILE_ERR_INVALID_ARG);

    st = AFILE_OK;
    EXPECT_EQ(afile_file_system_open(nullptr, "x", 128, &st), nullptr);
    EXPECT_EQ(st, AFILE_ERR_INVALID_ARG);

    st = AFILE_OK;
    EXPECT_EQ(afile_file_read(nullptr, 4, 128, &st), nullptr);
    EXPECT_EQ(st, AFILE_ERR_INVALID_ARG);

    EXPECT_EQ(afile_operation_status(nullptr), AFILE_OP_FAILED);
    EXPECT_EQ(afile_file_is_busy(nullptr), AFILE_FALSE);
    afile_operation_destroy(nullptr);
    afile_file_destroy(nullptr);
    afile_file_system_destroy(nullptr);
}

TEST_F(CApiTest, ReadAllByPath_ReturnsOwnedBuffer) {
    ScopedTempDir tmp;
    const std::string reference = makePattern(3000);
    auto path = tmp.writeFile("capi.bin", reference);

    AfileStatus st = AFILE_ERR_UNKNOWN;
    afile_Operation op = afile_file_system_read_all(fs, path.c_str(), 128, &st);
    ASSERT_EQ(st, AFILE_OK);
    EXPECT_EQ(finish(op), AFILE_OP_COMPLETE);
    EXPECT_EQ(takeString(op), reference);

    // The buffer was moved out
    EXPECT_EQ(takeString(op), "");
    afile_operation_destroy(op);
}

TEST_F(CApiTest, OpenSeekReadMetadata) {
    ScopedTempDir tmp;
    const std::string reference = makePattern(2048);
    auto path = tmp.writeFile("seek.bin", reference);
    AfileStatus st = AFILE_ERR_UNKNOWN;

    afile_Operation open = afile_file_system_open(fs, path.c_str(), 128, &st);
    ASSERT_EQ(finish(open), AFILE_OP_COMPLETE);
    afile_File file = afile_operation_take_file(open, &st);
    ASSERT_EQ(st, AFILE_OK);
    ASSERT_NE(file, nullptr);
    afile_operation_destroy(open);

    afile_Operation seek = afile_file_seek(file, AFILE_SEEK_START, 1024, 128, &st);
    ASSERT_EQ(finish(seek), AFILE_OP_COMPLETE);
    EXPECT_EQ(afile_operation_position(seek, &st), 1024u);
    afile_operation_destroy(seek);

    afile_Operation read = afile_file_read(file, 16, 128, &st);
    ASSERT_EQ(finish(read), AFILE_OP_COMPLETE);
    EXPECT_EQ(takeString(read), reference.substr(1024, 16));
    afile_operation_destroy(read);

    afile_Operation meta = afile_file_metadata(file, 128, &st);
    ASSERT_EQ(finish(meta), AFILE_OP_COMPLETE);
    EXPECT_EQ(afile_operation_length(meta, &st), 2048u);
    EXPECT_EQ(st, AFILE_OK);
    afile_operation_destroy(meta);

    afile_Operation bad = afile_file_seek(file, AFILE_SEEK_START, -1, 128, &st);
    EXPECT_EQ(bad, nullptr);
    EXPECT_EQ(st, AFILE_ERR_INVALID_ARG);

    afile_file_destroy(file);
}

TEST_F(CApiTest, MissingFile_ReportsErrorInfo) {
    ScopedTempDir tmp;
    auto path = tmp.join("absent.bin").string();
    AfileStatus st = AFILE_ERR_UNKNOWN;

    afile_Operation exists = afile_file_system_exists(fs, path.c_str(), 128, &st);
    EXPECT_EQ(finish(exists), AFILE_OP_COMPLETE);
    EXPECT_EQ(afile_operation_exists(exists, &st), AFILE_FALSE);
    afile_operation_destroy(exists);

    afile_Operation open = afile_file_system_open(fs, path.c_str(), 128, &st);
    ASSERT_EQ(finish(open), AFILE_OP_FAILED);

    AfileFileErrorInfo info{};
    afile_operation_error_info(open, &info, &st);
    ASSERT_EQ(st, AFILE_OK);
    EXPECT_EQ(info.code, AFILE_FILE_ERROR_NOT_FOUND);
    EXPECT_EQ(info.system_errno, ENOENT);
    EXPECT_STREQ(info.path, path.c_str());
    EXPECT_GT(std::strlen(info.message), 0u);

    EXPECT_EQ(afile_operation_take_file(open, &st), nullptr);
    EXPECT_EQ(st, AFILE_ERR_UNAVAILABLE);
    afile_operation_destroy(open);
}

TEST(CApiRemote, MissingOrigin_ReportsConfigurationError) {
    AfileFileSystemConfig cfg;
    afile_file_system_config_init(&cfg);
    cfg.backend = AFILE_BACKEND_REMOTE;
    cfg.origin_env_var = "";
    cfg.worker_threads = 1;

    AfileStatus st = AFILE_ERR_UNKNOWN;
    afile_FileSystem fs = afile_file_system_create(&cfg, &st);
    ASSERT_EQ(st, AFILE_OK);

    afile_Operation op = afile_file_system_open(fs, "assets/a.bin", 128, &st);
    ASSERT_EQ(st, AFILE_OK);
    afile_operation_wait(op, &st);
    EXPECT_EQ(afile_operation_status(op), AFILE_OP_FAILED);

    AfileFileErrorInfo info{};
    afile_operation_error_info(op, &info, &st);
    EXPECT_EQ(info.code, AFILE_FILE_ERROR_CONFIGURATION);

    afile_operation_destroy(op);
    afile_file_system_destroy(fs);
}
