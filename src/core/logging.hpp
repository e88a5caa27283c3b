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

// Tripwire Logging - Header
// quill backend setup and structured logging helpers

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace tripwire::control {
struct LogConfig;
}

namespace tripwire::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create (or fetch) the process logger described by `config`.
// output == "console" logs to stdout, anything else is a directory that
// receives tripwire.log (text) or tripwire.json (json).
quill::Logger* init_logger(const tripwire::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Logger created by the last init_logger() call (nullptr if none)
quill::Logger* get_logger();

// Parse a level name ("debug", "info", "warning"/"warn", "error").
// Unknown names map to Info.
quill::LogLevel parse_log_level(std::string_view level);

// State transition logging
#define LOG_BREAKER_TRANSITION(logger, breaker, from_state, to_state, reason)   \
    LOG_INFO(logger, "Circuit breaker {}: {} -> {} ({})", breaker, from_state, \
             to_state, reason)

// Call failure logging with breaker context
#define LOG_BREAKER_FAILURE(logger, breaker, kind, detail, duration_ms, state)          \
    LOG_WARNING(logger,                                                                 \
                "Circuit breaker {} call failed: kind={}, detail={}, duration_ms={}, " \
                "state={}",                                                             \
                breaker, kind, detail, duration_ms, state)

}  // namespace tripwire::logging
