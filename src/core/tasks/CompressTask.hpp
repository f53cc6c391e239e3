#pragma once
#include <string>
#include "../Types.hpp"
#include "../../utils/ILogger.hpp"

class CompressTask {
private:
    std::string inputPath;
    std::string outputPath;

    // 当前任务状态
    TaskStatus status;
    // 日志记录器
    ILogger* logger;

public:
    CompressTask(const std::string& input, const std::string& output, ILogger* log);
    bool execute();
    TaskStatus getStatus() const;
};
