#include <iostream>
#include <string>

#include "core/CodecEngine.hpp"
#include "utils/ConsoleLogger.hpp"

// 配置结构体定义
struct AppConfig {
    std::string inputFile = "sample_check.txt";
    std::string compressedFile = "compressed_file.huff";
    std::string decompressedFile = "decompressed_file.txt";
    LogLevel logLevel = LogLevel::INFO;
    bool verifyDigest = true;  // 解压后校验SHA-256
};

enum class Command {
    ROUNDTRIP,
    COMPRESS,
    DECOMPRESS,
    HELP
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    // 运行界面，返回进程退出码
    virtual int run() = 0;

    // 显示帮助信息
    virtual void showHelp() = 0;

    // 显示消息
    virtual void showMessage(const std::string& message) = 0;

    // 显示错误
    virtual void showError(const std::string& message) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;
    ConsoleLogger& logger;
    AppConfig config;

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger) {}

    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    int start() {
        return ui ? ui->run() : 1;
    }

    AppConfig& getConfig() {
        return config;
    }

    bool executeCompress() {
        logger.setLogLevel(config.logLevel);
        bool success = CodecEngine::compress(config.inputFile, config.compressedFile, &logger);
        report(success, "Compression");
        return success;
    }

    bool executeDecompress() {
        logger.setLogLevel(config.logLevel);
        bool success = CodecEngine::decompress(config.compressedFile, config.decompressedFile, &logger,
                                               config.verifyDigest);
        report(success, "Decompression");
        return success;
    }

    bool executeRoundTrip() {
        logger.setLogLevel(config.logLevel);
        bool success = CodecEngine::roundTrip(config.inputFile, config.compressedFile, config.decompressedFile,
                                              &logger, config.verifyDigest);
        report(success, "Round trip");
        return success;
    }

private:
    void report(bool success, const std::string& operation) {
        if (success) {
            logger.info(operation + " completed successfully.");
            if (ui) ui->showMessage(operation + " completed successfully");
        } else {
            logger.error(operation + " failed.");
            if (ui) ui->showError(operation + " failed");
        }
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;
    Command command = Command::ROUNDTRIP;

    // 参数错误时返回false
    bool parseArguments() {
        AppConfig& config = controller.getConfig();
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "compress" || arg == "-c") {
                command = Command::COMPRESS;
            } else if (arg == "decompress" || arg == "-d") {
                command = Command::DECOMPRESS;
            } else if (arg == "roundtrip" || arg == "-t") {
                command = Command::ROUNDTRIP;
            } else if (arg == "-h" || arg == "--help") {
                command = Command::HELP;
            } else if (arg == "--input" || arg == "--output" || arg == "--restored" || arg == "--log-level") {
                if (i + 1 >= argc) {
                    showError("Missing value for " + arg);
                    return false;
                }
                std::string value = argv[++i];
                if (arg == "--input") {
                    config.inputFile = value;
                } else if (arg == "--output") {
                    config.compressedFile = value;
                } else if (arg == "--restored") {
                    config.decompressedFile = value;
                } else if (!parseLogLevel(value, config.logLevel)) {
                    showError("Unknown log level: " + value);
                    return false;
                }
            } else if (arg == "--no-verify") {
                config.verifyDigest = false;
            } else {
                showError("Unknown argument: " + arg);
                return false;
            }
        }
        return true;
    }

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    int run() override {
        if (!parseArguments()) {
            std::cerr << "Try 'huffpack --help' for more information.\n";
            return 2;
        }

        bool success = true;
        switch (command) {
            case Command::HELP:
                showHelp();
                break;
            case Command::COMPRESS:
                success = controller.executeCompress();
                break;
            case Command::DECOMPRESS:
                success = controller.executeDecompress();
                break;
            case Command::ROUNDTRIP:
                success = controller.executeRoundTrip();
                break;
        }
        return success ? 0 : 1;
    }

    void showHelp() override {
        std::cout << "=== HuffPack Help Information ===\n";
        std::cout << "Usage: huffpack [command] [options]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  roundtrip, -t       Compress, decompress and compare (default)\n";
        std::cout << "  compress, -c        Compress --input into --output\n";
        std::cout << "  decompress, -d      Decompress --output into --restored\n";
        std::cout << "  -h, --help          Show this help information\n\n";
        std::cout << "Options:\n";
        std::cout << "  --input <path>      Original file (default: sample_check.txt)\n";
        std::cout << "  --output <path>     Compressed file (default: compressed_file.huff)\n";
        std::cout << "  --restored <path>   Decompressed file (default: decompressed_file.txt)\n";
        std::cout << "  --log-level <lvl>   debug, info, warn or error (default: info)\n";
        std::cout << "  --no-verify         Skip the SHA-256 check after decompression\n\n";
        std::cout << "Examples:\n";
        std::cout << "  huffpack                                   Round trip with default paths\n";
        std::cout << "  huffpack -c --input notes.txt --output notes.huff\n";
        std::cout << "  huffpack -d --output notes.huff --restored notes.out\n";
    }

    void showMessage(const std::string& message) override {
        std::cout << message << std::endl;
    }

    void showError(const std::string& message) override {
        std::cerr << "Error: " << message << std::endl;
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger;

    // 1. 先创建控制器，界面指针为空
    ApplicationController controller(nullptr, logger);

    // 2. 创建命令行界面并传入控制器引用
    CommandLineInterface cli(controller, argc, argv);

    // 3. 将界面设置给控制器
    controller.setUserInterface(&cli);

    return controller.start();
}
