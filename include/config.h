#pragma once

#include "common.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace parley {

/// One configured component: registry kind plus constructor arguments
struct ComponentSpec {
    std::string kind;                               ///< e.g. "stdin", "purple_air"
    nlohmann::json args = nlohmann::json::object(); ///< Passed to the factory unchanged
};

struct ComponentsConfig {
    std::vector<ComponentSpec> inputs;
    std::vector<ComponentSpec> outputs;
    std::vector<ComponentSpec> services;
};

struct LoggingConfig {
    std::string level = "info";  ///< "debug" | "info" | "warn" | "error"
    std::string file;            ///< Append log lines here as well (empty = console only)
};

struct DispatcherConfig {
    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;  ///< Sleep between input sweeps
    std::string apology_text = DEFAULT_APOLOGY_TEXT;  ///< Said when no service claims an utterance
};

struct Config {
    std::vector<std::string> key_phrases;  ///< Raw phrase text, sanitised by the Dispatcher
    ComponentsConfig components;
    LoggingConfig logging;
    DispatcherConfig dispatcher;

    /**
     * @brief Load and validate a JSON config file, then apply environment overrides
     * @throws std::runtime_error if the file cannot be read or is invalid
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Build a config from a parsed document (no environment overrides)
     * @throws std::runtime_error if required fields are missing or mistyped
     */
    static Config from_json(const nlohmann::json& j);

    /// PARLEY_LOG_LEVEL / PARLEY_LOG_FILE override the logging section
    void apply_env_overrides();
};

} // namespace parley
