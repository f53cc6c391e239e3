#pragma once
#include <string>

class ILogger;

class CodecEngine {
public:
    static bool compress(const std::string& inputPath, const std::string& outputPath, ILogger* logger);
    static bool decompress(const std::string& inputPath, const std::string& outputPath, ILogger* logger,
                           bool verifyDigest = true);
    static bool roundTrip(const std::string& inputPath, const std::string& compressedPath,
                          const std::string& restoredPath, ILogger* logger, bool verifyDigest = true);
};
