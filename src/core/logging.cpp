/*
 * Copyright 2025 Tripwire Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tripwire Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>

#include "../control/config.hpp"

namespace tripwire::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
    quill::Backend::start();
}

quill::LogLevel parse_log_level(std::string_view level) {
    std::string level_lower{level};
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level_lower == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level_lower == "info") {
        return quill::LogLevel::Info;
    }
    if (level_lower == "warning" || level_lower == "warn") {
        return quill::LogLevel::Warning;
    }
    if (level_lower == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    quill::Logger* logger = nullptr;

    if (log_config.output == "console") {
        auto console_sink =
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>("tripwire_console");
        logger = quill::Frontend::create_or_get_logger("tripwire", std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        if (log_config.format == "json") {
            std::string log_path = fmt::format("{}/tripwire.json", log_config.output);
            auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
                log_path, config);
            logger = quill::Frontend::create_or_get_logger("tripwire", std::move(json_sink));
        } else {
            std::string log_path = fmt::format("{}/tripwire.log", log_config.output);
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger("tripwire", std::move(file_sink));
        }
    }

    logger->set_log_level(parse_log_level(log_config.level));

    g_logger.store(logger, std::memory_order_release);
    return logger;
}

void shutdown_logging() {
    if (auto* logger = g_logger.exchange(nullptr)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* get_logger() {
    return g_logger.load(std::memory_order_acquire);
}

}  // namespace tripwire::logging
