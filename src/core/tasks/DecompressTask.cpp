#include "DecompressTask.hpp"
#include "../CodecErrors.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/HuffmanCompressor.hpp"

DecompressTask::DecompressTask(const std::string& input, const std::string& output, ILogger* log, bool verify)
    : inputPath(input), outputPath(output), status(TaskStatus::PENDING), logger(log), verifyDigest(verify) {}

bool DecompressTask::execute() {
    logger->info("Starting decompression: " + inputPath + " -> " + outputPath);
    status = TaskStatus::RUNNING;

    if (!FileSystem::exists(inputPath)) {
        logger->error("Compressed file not found: " + inputPath);
        status = TaskStatus::FAILED;
        return false;
    }

    if (!verifyDigest) {
        logger->warn("Content digest verification disabled");
    }

    HuffmanCompressor compressor(verifyDigest);
    try {
        compressor.decompressFile(inputPath, outputPath);
    } catch (const std::exception& e) {
        logger->error("Decompression failed: " + describeError(e));
        status = TaskStatus::FAILED;
        return false;
    }

    const auto& stats = compressor.getLastStats();
    logger->debug("Decoded " + std::to_string(stats.payloadBits) + " payload bits over " +
                  std::to_string(stats.distinctSymbols) + " distinct symbols");
    if (!stats.contentDigest.empty()) {
        logger->debug("Stored content SHA-256: " + stats.contentDigest);
    }
    logger->info("  Restored size: " + std::to_string(stats.outputBytes) + " bytes");
    logger->info("File decompressed to " + outputPath);
    status = TaskStatus::COMPLETED;
    return true;
}

TaskStatus DecompressTask::getStatus() const {
    return status;
}
