#pragma once

#include <optional>
#include <string>

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> command;

    // Per-command overrides of config file values
    std::optional<std::string> cert;
    std::optional<std::string> key;
    std::optional<std::string> known_clients;
    std::optional<std::string> addr;
    std::optional<std::string> server_cert;
    std::optional<std::string> url;
    std::optional<std::string> dir;
    bool no_verify_hostname = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数; throws std::runtime_error on invalid input
    CliOptions Parse();

    // 显示帮助信息
    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // 当前解析的参数索引

    void parseOption(const std::string& arg, CliOptions& options);
    std::string nextValue(const std::string& arg);

    // 参数验证
    void validateOptions(const CliOptions& options);
};
