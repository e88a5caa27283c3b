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

// Tripwire - Main Entry Point
#include <cstdio>
#include <cstdlib>
#include <string>

#include "control/config.hpp"
#include "control/status.hpp"
#include "core/logging.hpp"
#include "resilience/events.hpp"
#include "resilience/registry.hpp"

namespace {

void print_validation(const tripwire::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <policies.json> [--check]\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    bool check_only = false;

    for (int i = 3; i < argc; ++i) {
        if (std::string(argv[i]) == "--check") {
            check_only = true;
        }
    }

    printf("Loading configuration from %s...\n", config_path.c_str());

    tripwire::control::ValidationResult validation;
    auto config = tripwire::control::ConfigLoader::load_from_file(config_path, &validation);
    print_validation(validation);

    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    if (check_only) {
        printf("Configuration OK: %zu policies\n", config->policies.size());
        return EXIT_SUCCESS;
    }

    tripwire::logging::init_logging_system();
    auto* logger = tripwire::logging::init_logger(config->logging);

    {
        tripwire::resilience::BreakerRegistry registry(
            {tripwire::resilience::make_logging_sink(logger)});

        for (const auto& [name, policy] : config->policies) {
            auto breaker =
                registry.get_breaker(name, tripwire::control::to_breaker_config(policy, name));
            LOG_INFO(logger, "Circuit breaker {} ready (timeout={}ms, threshold={})",
                     breaker->name(), policy.timeout, policy.threshold);
        }

        auto statuses = registry.get_all_statuses();
        printf("%s\n", tripwire::control::StatusResponse::to_json(statuses).c_str());
    }

    tripwire::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
