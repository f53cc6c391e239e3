#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "core/CodecEngine.hpp"
#include "core/tasks/CompressTask.hpp"
#include "core/tasks/DecompressTask.hpp"
#include "core/tasks/RoundTripTask.hpp"
#include "utils/FileSystem.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;

using ::testing::_;
using ::testing::AtLeast;
using ::testing::HasSubstr;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

// Task测试用例基类
class TaskTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "huffpack_task_test";
    fs::path inputFile = testDir / "sample_check.txt";
    fs::path compressedFile = testDir / "out" / "compressed_file.huff";
    fs::path restoredFile = testDir / "out" / "decompressed_file.txt";

    std::shared_ptr<MockLogger> mockLogger;

    void SetUp() override {
        fs::create_directories(testDir);

        std::ofstream(inputFile) << "Content of the sample file\nwith a second line\nand a third one\n";

        mockLogger = std::make_shared<MockLogger>();

        // 允许所有日志方法调用
        EXPECT_CALL(*mockLogger, info(_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*mockLogger, error(_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*mockLogger, warn(_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*mockLogger, debug(_)).WillRepeatedly(::testing::Return());
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(TaskTest, CompressTaskBasic) {
    CompressTask task(inputFile.string(), compressedFile.string(), mockLogger.get());
    EXPECT_EQ(task.getStatus(), TaskStatus::PENDING);

    EXPECT_CALL(*mockLogger, info(HasSubstr("File compressed to"))).Times(1);
    EXPECT_CALL(*mockLogger, debug(HasSubstr("Content SHA-256: "))).Times(1);

    EXPECT_TRUE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::COMPLETED);
    EXPECT_TRUE(fs::exists(compressedFile));
}

TEST_F(TaskTest, CompressTaskMissingInput) {
    CompressTask task((testDir / "missing.txt").string(), compressedFile.string(), mockLogger.get());

    EXPECT_CALL(*mockLogger, error(HasSubstr("Input file not found"))).Times(1);

    EXPECT_FALSE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::FAILED);
    EXPECT_FALSE(fs::exists(compressedFile));
}

TEST_F(TaskTest, DecompressTaskBasic) {
    CompressTask compressTask(inputFile.string(), compressedFile.string(), mockLogger.get());
    ASSERT_TRUE(compressTask.execute());

    DecompressTask task(compressedFile.string(), restoredFile.string(), mockLogger.get());

    EXPECT_CALL(*mockLogger, debug(HasSubstr("Stored content SHA-256: "))).Times(1);

    EXPECT_TRUE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::COMPLETED);
    EXPECT_EQ(readFile(inputFile), readFile(restoredFile));
}

TEST_F(TaskTest, DecompressTaskCorruptContainer) {
    // 普通文本文件不是压缩容器
    DecompressTask task(inputFile.string(), restoredFile.string(), mockLogger.get());

    EXPECT_CALL(*mockLogger, error(HasSubstr("CorruptContainerError"))).Times(1);

    EXPECT_FALSE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::FAILED);
}

TEST_F(TaskTest, DecompressTaskTruncatedPayload) {
    CompressTask compressTask(inputFile.string(), compressedFile.string(), mockLogger.get());
    ASSERT_TRUE(compressTask.execute());

    std::vector<uint8_t> bytes = FileSystem::readAllBytes(compressedFile.string());
    bytes.pop_back();
    FileSystem::writeAllBytes(compressedFile.string(), bytes);

    DecompressTask task(compressedFile.string(), restoredFile.string(), mockLogger.get());

    EXPECT_CALL(*mockLogger, error(HasSubstr("MalformedStreamError"))).Times(1);

    EXPECT_FALSE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::FAILED);
}

TEST_F(TaskTest, DecompressTaskWithoutVerificationWarns) {
    CompressTask compressTask(inputFile.string(), compressedFile.string(), mockLogger.get());
    ASSERT_TRUE(compressTask.execute());

    DecompressTask task(compressedFile.string(), restoredFile.string(), mockLogger.get(), false);

    EXPECT_CALL(*mockLogger, warn(HasSubstr("verification disabled"))).Times(1);

    EXPECT_TRUE(task.execute());
}

TEST_F(TaskTest, RoundTripTaskBasic) {
    RoundTripTask task(inputFile.string(), compressedFile.string(), restoredFile.string(), mockLogger.get());

    EXPECT_CALL(*mockLogger, info(HasSubstr("matches original"))).Times(1);

    EXPECT_TRUE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::COMPLETED);
    EXPECT_EQ(readFile(inputFile), readFile(restoredFile));
}

TEST_F(TaskTest, RoundTripTaskEmptyFile) {
    fs::path emptyFile = testDir / "empty.txt";
    std::ofstream(emptyFile.string());

    RoundTripTask task(emptyFile.string(), compressedFile.string(), restoredFile.string(), mockLogger.get());
    EXPECT_TRUE(task.execute());
    EXPECT_EQ(fs::file_size(restoredFile), 0u);
}

TEST_F(TaskTest, RoundTripTaskMissingInput) {
    RoundTripTask task((testDir / "missing.txt").string(), compressedFile.string(), restoredFile.string(),
                       mockLogger.get());

    EXPECT_CALL(*mockLogger, error(_)).Times(AtLeast(1));

    EXPECT_FALSE(task.execute());
    EXPECT_EQ(task.getStatus(), TaskStatus::FAILED);
}

TEST_F(TaskTest, CodecEngineEntryPoints) {
    EXPECT_TRUE(CodecEngine::compress(inputFile.string(), compressedFile.string(), mockLogger.get()));
    EXPECT_TRUE(CodecEngine::decompress(compressedFile.string(), restoredFile.string(), mockLogger.get()));
    EXPECT_EQ(readFile(inputFile), readFile(restoredFile));

    fs::path secondRestore = testDir / "out" / "second.txt";
    EXPECT_TRUE(CodecEngine::roundTrip(inputFile.string(), compressedFile.string(), secondRestore.string(),
                                       mockLogger.get()));
    EXPECT_FALSE(CodecEngine::decompress(inputFile.string(), secondRestore.string(), mockLogger.get()));
}
