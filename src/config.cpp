#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

/// Accepts ["kind", {args}] (args may be null) or {"kind": ..., "args": {...}}
parley::ComponentSpec parse_component(const json& entry, const std::string& section) {
    parley::ComponentSpec spec;
    if (entry.is_array()) {
        if (entry.empty() || entry.size() > 2 || !entry[0].is_string()) {
            throw std::runtime_error("components." + section + ": expected [kind, args], got " + entry.dump());
        }
        spec.kind = entry[0].get<std::string>();
        if (entry.size() == 2 && !entry[1].is_null()) {
            spec.args = entry[1];
        }
    } else if (entry.is_object()) {
        if (!entry.contains("kind") || !entry["kind"].is_string()) {
            throw std::runtime_error("components." + section + ": entry without a \"kind\": " + entry.dump());
        }
        spec.kind = entry["kind"].get<std::string>();
        if (entry.contains("args") && !entry["args"].is_null()) {
            spec.args = entry["args"];
        }
    } else {
        throw std::runtime_error("components." + section + ": unsupported entry " + entry.dump());
    }

    if (!spec.args.is_object()) {
        throw std::runtime_error("components." + section + ": args for \"" + spec.kind + "\" must be an object");
    }
    return spec;
}

std::vector<parley::ComponentSpec> parse_section(const json& components, const std::string& section) {
    std::vector<parley::ComponentSpec> specs;
    if (!components.contains(section) || components[section].is_null()) {
        return specs;
    }
    if (!components[section].is_array()) {
        throw std::runtime_error("components." + section + " must be an array");
    }
    for (const auto& entry : components[section]) {
        specs.push_back(parse_component(entry, section));
    }
    return specs;
}

} // namespace

namespace parley {

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    Config cfg;

    // Key phrases (required)
    if (!j.contains("key_phrases") || !j["key_phrases"].is_array()) {
        throw std::runtime_error("Config needs a \"key_phrases\" array");
    }
    for (const auto& phrase : j["key_phrases"]) {
        if (!phrase.is_string()) {
            throw std::runtime_error("key_phrases entries must be strings, got " + phrase.dump());
        }
        cfg.key_phrases.push_back(phrase.get<std::string>());
    }

    // Components
    if (j.contains("components") && !j["components"].is_null()) {
        const auto& c = j["components"];
        if (!c.is_object()) {
            throw std::runtime_error("\"components\" must be an object");
        }
        cfg.components.inputs = parse_section(c, "inputs");
        cfg.components.outputs = parse_section(c, "outputs");
        cfg.components.services = parse_section(c, "services");
    }

    // Logging
    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"].get<std::string>();
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"].get<std::string>();
    }

    // Dispatcher
    if (j.contains("dispatcher") && j["dispatcher"].is_object()) {
        const auto& d = j["dispatcher"];
        if (d.contains("poll_interval_ms") && d["poll_interval_ms"].is_number_integer()) {
            cfg.dispatcher.poll_interval_ms = d["poll_interval_ms"].get<int>();
        }
        if (d.contains("apology_text") && d["apology_text"].is_string()) {
            cfg.dispatcher.apology_text = d["apology_text"].get<std::string>();
        }
    }
    if (cfg.dispatcher.poll_interval_ms < 0) {
        throw std::runtime_error("dispatcher.poll_interval_ms must not be negative");
    }

    if (cfg.key_phrases.empty()) {
        Logger::warn("No key phrases configured; nothing will ever be dispatched");
    }
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + std::string(e.what()));
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    Logger::info("Loaded config " + path + " (" + std::to_string(cfg.key_phrases.size()) + " key phrases, "
        + std::to_string(cfg.components.inputs.size()) + " inputs, "
        + std::to_string(cfg.components.outputs.size()) + " outputs, "
        + std::to_string(cfg.components.services.size()) + " services)");
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* level = std::getenv("PARLEY_LOG_LEVEL")) {
        logging.level = level;
    }
    if (const char* file = std::getenv("PARLEY_LOG_FILE")) {
        logging.file = file;
    }
}

} // namespace parley
