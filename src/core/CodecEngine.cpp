// core/CodecEngine.cpp
#include "CodecEngine.hpp"
#include "tasks/CompressTask.hpp"
#include "tasks/DecompressTask.hpp"
#include "tasks/RoundTripTask.hpp"

bool CodecEngine::compress(const std::string& inputPath, const std::string& outputPath, ILogger* logger) {
    CompressTask task(inputPath, outputPath, logger);
    return task.execute();
}

bool CodecEngine::decompress(const std::string& inputPath, const std::string& outputPath, ILogger* logger,
                             bool verifyDigest) {
    DecompressTask task(inputPath, outputPath, logger, verifyDigest);
    return task.execute();
}

bool CodecEngine::roundTrip(const std::string& inputPath, const std::string& compressedPath,
                            const std::string& restoredPath, ILogger* logger, bool verifyDigest) {
    RoundTripTask task(inputPath, compressedPath, restoredPath, logger, verifyDigest);
    return task.execute();
}
