/**
 * klog - Log book keeper for dated entries
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QStringList>

#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "cli/CommandRunner.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "store/EntryStore.hpp"
#include "store/StoreErrors.hpp"

namespace {

spdlog::level::level_enum levelFromVerbosity(const std::string& verbosity) {
    if (verbosity == "debug") return spdlog::level::debug;
    if (verbosity == "warning") return spdlog::level::warn;
    if (verbosity == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging(const std::filesystem::path& configPath) {
    // Console output is for problems only; stdout carries command output
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    auto logPath = configPath / "logs" / "klog.log";

    // Ensure log directory exists
    std::filesystem::create_directories(logPath.parent_path());

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), 1024 * 1024 * 5, 3);
    file_sink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>(
        "klog", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("klog");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("klog");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Keeps a log book of dated entries in a directory tree.\n\n" +
        QString::fromStdString(klog::CommandRunner::usage()));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption repositoryOption(
        QStringList() << "r" << "repository",
        "Log directory (overrides the configured repository)",
        "path"
    );
    parser.addOption(repositoryOption);

    parser.addPositionalArgument("command", "Command to run, see above");
    parser.process(app);

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = klog::Platform::getConfigPath();
    }

    try {
        setupLogging(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Cannot set up logging: " << e.what() << "\n";
        return 1;
    }

    auto& configManager = klog::ConfigManager::instance();
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }

    const auto& config = configManager.programConfig();
    spdlog::set_level(levelFromVerbosity(config.logVerbosity));

    std::filesystem::path repository;
    if (parser.isSet(repositoryOption)) {
        repository = parser.value(repositoryOption).toStdString();
    } else {
        repository = configManager.repositoryPath();
    }

    std::error_code ec;
    std::filesystem::create_directories(repository, ec);
    if (ec) {
        spdlog::error("Cannot create log directory {}: {}", repository.string(), ec.message());
        return 1;
    }

    std::vector<std::string> args;
    for (const auto& arg : parser.positionalArguments()) {
        args.push_back(arg.toStdString());
    }

    try {
        klog::EntryStore store(repository, config.defaultTopic);
        klog::CommandRunner runner(store, std::cin, std::cout, std::cerr);
        return static_cast<int>(runner.run(args));
    } catch (const klog::IOFailure& e) {
        spdlog::error("Cannot open log directory: {}", e.what());
        return static_cast<int>(klog::ExitCode::IoFailure);
    }
}
