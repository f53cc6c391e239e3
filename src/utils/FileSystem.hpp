#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在
    static bool exists(const std::string& path);

    // 创建目录（包括父目录）
    static bool createDirectories(const std::string& path);

    // 读取整个文件，失败时抛出IOError
    static std::vector<uint8_t> readAllBytes(const std::string& filePath);

    // 创建或覆盖文件并写入全部数据，自动创建父目录，失败时抛出IOError
    static void writeAllBytes(const std::string& filePath, const std::vector<uint8_t>& data);
};
