#include "CompressTask.hpp"
#include "../CodecErrors.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/HuffmanCompressor.hpp"
#include <iomanip>
#include <sstream>

CompressTask::CompressTask(const std::string& input, const std::string& output, ILogger* log)
    : inputPath(input), outputPath(output), status(TaskStatus::PENDING), logger(log) {}

bool CompressTask::execute() {
    logger->info("Starting compression: " + inputPath + " -> " + outputPath);
    status = TaskStatus::RUNNING;

    if (!FileSystem::exists(inputPath)) {
        logger->error("Input file not found: " + inputPath);
        status = TaskStatus::FAILED;
        return false;
    }

    HuffmanCompressor compressor;
    try {
        compressor.compressFile(inputPath, outputPath);
    } catch (const std::exception& e) {
        logger->error("Compression failed: " + describeError(e));
        status = TaskStatus::FAILED;
        return false;
    }

    const auto& stats = compressor.getLastStats();
    logger->debug("Distinct symbols: " + std::to_string(stats.distinctSymbols) +
                  ", payload bits: " + std::to_string(stats.payloadBits));
    logger->debug("Content SHA-256: " + stats.contentDigest);
    logger->info("  Original size: " + std::to_string(stats.inputBytes) + " bytes");
    logger->info("  Compressed size: " + std::to_string(stats.outputBytes) + " bytes");
    if (stats.inputBytes > 0) {
        double ratio = (1.0 - static_cast<double>(stats.outputBytes) / stats.inputBytes) * 100;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << ratio;
        logger->info("  Compression ratio: " + oss.str() + "%");
    }
    if (stats.outputBytes >= stats.inputBytes) {
        logger->warn("Compressed file is not smaller than the original: " + inputPath);
    }

    logger->info("File compressed to " + outputPath);
    status = TaskStatus::COMPLETED;
    return true;
}

TaskStatus CompressTask::getStatus() const {
    return status;
}
