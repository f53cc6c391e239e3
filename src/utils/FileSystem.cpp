#include "FileSystem.hpp"
#include "../core/CodecErrors.hpp"
#include <fstream>
#include <iterator>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return status.type() != fs::file_type::not_found && !ec;
}

bool FileSystem::createDirectories(const std::string& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (!ec && status.type() == fs::file_type::directory) {
        return true;
    }

    bool result = fs::create_directories(path, ec);
    return result && !ec;
}

std::vector<uint8_t> FileSystem::readAllBytes(const std::string& filePath) {
    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile.is_open()) {
        throw IOError("Cannot open input file", filePath);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
    if (inFile.bad()) {
        throw IOError("Failed to read input file", filePath);
    }
    return data;
}

void FileSystem::writeAllBytes(const std::string& filePath, const std::vector<uint8_t>& data) {
    fs::path destPath(filePath);
    if (!destPath.parent_path().empty() && !createDirectories(destPath.parent_path().string())) {
        throw IOError("Cannot create output directory", destPath.parent_path().string());
    }

    std::ofstream outFile(filePath, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        throw IOError("Cannot create output file", filePath);
    }

    outFile.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    outFile.close();
    if (!outFile) {
        throw IOError("Failed to write output file", filePath);
    }
}
