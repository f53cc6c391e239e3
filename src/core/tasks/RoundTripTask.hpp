#pragma once
#include <string>
#include "../Types.hpp"
#include "../../utils/ILogger.hpp"

// 压缩、解压，然后比较还原文件与输入文件
class RoundTripTask {
private:
    std::string inputPath;
    std::string compressedPath;
    std::string restoredPath;

    TaskStatus status;
    ILogger* logger;
    bool verifyDigest;

    bool sameContent(const std::string& first, const std::string& second);

public:
    RoundTripTask(const std::string& input, const std::string& compressed, const std::string& restored,
                  ILogger* log, bool verify = true);
    bool execute();
    TaskStatus getStatus() const;
};
