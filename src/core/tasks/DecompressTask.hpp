#pragma once
#include <string>
#include "../Types.hpp"
#include "../../utils/ILogger.hpp"

class DecompressTask {
private:
    std::string inputPath;
    std::string outputPath;

    TaskStatus status;
    ILogger* logger;
    // 用存储的SHA-256校验解码内容
    bool verifyDigest;

public:
    DecompressTask(const std::string& input, const std::string& output, ILogger* log, bool verify = true);
    bool execute();
    TaskStatus getStatus() const;
};
