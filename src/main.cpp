/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point of the `kestrel` command-line tool.
 *
 * @details
 * This file contains the `main` function which orchestrates:
 * 1. Settings resolution (JSON file, then flags).
 * 2. Generator construction (with optional algorithm fallback).
 * 3. Batch generation and output.
 *
 * Exit status: 0 on success, 1 on runtime failure or an invalid `--validate`
 * token, 2 on configuration errors.
 */

#include "kestrel/app/batch.hpp"
#include "kestrel/app/settings.hpp"
#include "kestrel/core/generator.hpp"
#include "kestrel/errors.hpp"
#include "kestrel/infra/logger.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using kestrel::infra::Logger;
using kestrel::infra::LogLevel;

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        // 1. Resolve Settings
        const kestrel::app::Settings settings = kestrel::app::Settings::from_arguments(args);
        Logger::set_level(settings.log_level);

        if (settings.help) {
            std::cout << kestrel::app::usage(argv[0]);
            return 0;
        }

        // 2. Validation Mode (no generator needed)
        if (settings.validate) {
            const bool valid = kestrel::core::is_token(*settings.validate);
            std::cout << (valid ? "valid" : "invalid") << std::endl;
            return valid ? 0 : 1;
        }

        // 3. Generator Bootstrap
        const kestrel::core::GeneratorConfig config = settings.generator_config();
        std::unique_ptr<kestrel::core::TokenGenerator> generator =
            settings.fallback ? kestrel::core::TokenGenerator::with_fallback(config)
                              : std::make_unique<kestrel::core::TokenGenerator>(config);

        Logger::log(LogLevel::INFO, "Batch: generating " + std::to_string(settings.count) +
                                        " token(s) on " + std::to_string(settings.threads) +
                                        " thread(s)");

        // 4. Generate & Emit
        const std::vector<std::string> tokens =
            kestrel::app::generate_batch(*generator, settings.count, settings.threads);

        if (settings.format == kestrel::app::OutputFormat::JSON) {
            std::cout << kestrel::app::render_json(*generator, tokens);
        } else {
            std::cout << kestrel::app::render_text(tokens);
        }
        std::cout.flush();

        Logger::log(LogLevel::DEBUG, "Batch: complete");

    } catch (const kestrel::ConfigError& e) {
        Logger::log(LogLevel::ERROR, "Config: " + std::string(e.what()));
        std::cerr << "Try '" << argv[0] << " --help' for usage." << std::endl;
        return 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
