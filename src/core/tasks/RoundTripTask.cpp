#include "RoundTripTask.hpp"
#include "CompressTask.hpp"
#include "DecompressTask.hpp"
#include "../CodecErrors.hpp"
#include "../../utils/FileSystem.hpp"

RoundTripTask::RoundTripTask(const std::string& input, const std::string& compressed, const std::string& restored,
                             ILogger* log, bool verify)
    : inputPath(input), compressedPath(compressed), restoredPath(restored),
      status(TaskStatus::PENDING), logger(log), verifyDigest(verify) {}

bool RoundTripTask::sameContent(const std::string& first, const std::string& second) {
    try {
        return FileSystem::readAllBytes(first) == FileSystem::readAllBytes(second);
    } catch (const IOError& e) {
        logger->error("Verification failed: " + describeError(e));
        return false;
    }
}

bool RoundTripTask::execute() {
    logger->info("Starting round trip for " + inputPath);
    status = TaskStatus::RUNNING;

    CompressTask compressTask(inputPath, compressedPath, logger);
    if (!compressTask.execute()) {
        status = TaskStatus::FAILED;
        return false;
    }

    DecompressTask decompressTask(compressedPath, restoredPath, logger, verifyDigest);
    if (!decompressTask.execute()) {
        status = TaskStatus::FAILED;
        return false;
    }

    logger->info("Verifying file integrity...");
    if (!sameContent(inputPath, restoredPath)) {
        logger->error("Decompressed file does not match original: " + restoredPath);
        status = TaskStatus::FAILED;
        return false;
    }

    logger->info("Decompressed file matches original");
    status = TaskStatus::COMPLETED;
    return true;
}

TaskStatus RoundTripTask::getStatus() const {
    return status;
}
