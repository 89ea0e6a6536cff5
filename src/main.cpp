#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "SafeConnection.hpp"
#include "Shell.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <iostream>
#include <vector>

using namespace safedb;

namespace {

void setupLogging(const LoggingConfig& logging) {
    try {
        auto level = spdlog::level::from_str(logging.level);
        std::vector<spdlog::sink_ptr> sinks;

        // stdout carries query results, so logs go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logging.log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.log_file, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logging.log_file << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("safedb", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    try {
        SafeConnection db(SafeOptions::fromConfig(config));
        Shell shell(db, config.output, std::cout, std::cerr);

        int failures = 0;
        for (const auto& statement : config.statements) {
            if (!shell.runLine(statement)) {
                ++failures;
            }
        }

        if (!config.script_file.empty()) {
            std::ifstream script(config.script_file);
            if (!script.is_open()) {
                spdlog::error("Cannot open script file: {}", config.script_file);
                return 1;
            }
            failures += shell.runScript(script);
        }

        if (config.statements.empty() && config.script_file.empty()) {
            failures += shell.runScript(std::cin);
        }

        if (failures > 0) {
            spdlog::debug("{} statement(s) failed", failures);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", ErrorHandler::describe(e));
        return 1;
    }

    return 0;
}
