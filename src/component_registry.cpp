#include "component_registry.h"
#include "logger.h"
#include "inputs/replay_input.h"
#include "inputs/text_input.h"
#include "outputs/console_output.h"
#include "outputs/feed_output.h"
#include "services/echo_service.h"
#include "services/keyboard_action_service.h"
#include "services/phrase_reply_service.h"
#include "services/purple_air_service.h"
#include <exception>

using json = nlohmann::json;

namespace parley {

namespace {

template<typename T>
bool add_factory(std::map<std::string, ComponentRegistry::Factory<T>>& table,
                 const std::string& kind, ComponentRegistry::Factory<T> factory,
                 const char* section) {
    if (!factory) {
        Logger::error(std::string("Attempted to register null ") + section + " factory for '" + kind + "'");
        return false;
    }
    if (table.find(kind) != table.end()) {
        Logger::warn(std::string("Component kind '") + kind + "' is already registered as " + section + ". Skipping.");
        return false;
    }
    table[kind] = std::move(factory);
    return true;
}

template<typename T>
Result<std::shared_ptr<T>> build(const std::map<std::string, ComponentRegistry::Factory<T>>& table,
                                 const std::string& kind, StatusNotifier* notifier,
                                 const json& args, const char* section) {
    std::string prefix = "Failed to load component " + kind + " with args " + args.dump() + ": ";

    auto it = table.find(kind);
    if (it == table.end()) {
        return make_config_error(prefix + "no " + section + " of that kind is registered");
    }

    try {
        std::shared_ptr<T> component = it->second(notifier, args);
        if (!component) {
            return make_config_error(prefix + "factory returned nothing");
        }
        return component;
    } catch (const std::exception& e) {
        return make_config_error(prefix + e.what());
    }
}

template<typename T>
std::vector<std::string> kinds_of(const std::map<std::string, ComponentRegistry::Factory<T>>& table) {
    std::vector<std::string> kinds;
    kinds.reserve(table.size());
    for (const auto& [kind, factory] : table) {
        kinds.push_back(kind);
    }
    return kinds;
}

} // namespace

bool ComponentRegistry::register_input(const std::string& kind, InputFactory factory) {
    return add_factory<Input>(inputs_, kind, std::move(factory), "input");
}

bool ComponentRegistry::register_output(const std::string& kind, OutputFactory factory) {
    return add_factory<Output>(outputs_, kind, std::move(factory), "output");
}

bool ComponentRegistry::register_service(const std::string& kind, ServiceFactory factory) {
    return add_factory<Service>(services_, kind, std::move(factory), "service");
}

Result<std::shared_ptr<Input>> ComponentRegistry::create_input(const std::string& kind, StatusNotifier* notifier,
                                                               const json& args) const {
    return build<Input>(inputs_, kind, notifier, args, "input");
}

Result<std::shared_ptr<Output>> ComponentRegistry::create_output(const std::string& kind, StatusNotifier* notifier,
                                                                 const json& args) const {
    return build<Output>(outputs_, kind, notifier, args, "output");
}

Result<std::shared_ptr<Service>> ComponentRegistry::create_service(const std::string& kind, StatusNotifier* notifier,
                                                                   const json& args) const {
    return build<Service>(services_, kind, notifier, args, "service");
}

std::vector<std::string> ComponentRegistry::input_kinds() const {
    return kinds_of<Input>(inputs_);
}

std::vector<std::string> ComponentRegistry::output_kinds() const {
    return kinds_of<Output>(outputs_);
}

std::vector<std::string> ComponentRegistry::service_kinds() const {
    return kinds_of<Service>(services_);
}

void register_builtin_components(ComponentRegistry& registry) {
    registry.register_input("stdin", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Input> {
        return std::make_shared<TextInput>(notifier, args.value("fd", 0));
    });
    registry.register_input("replay", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Input> {
        if (!args.contains("path") || !args["path"].is_string()) {
            throw std::invalid_argument("replay input needs a \"path\"");
        }
        return std::make_shared<ReplayInput>(notifier, args["path"].get<std::string>(),
                                             args.value("interval_ms", 0));
    });

    registry.register_output("console", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Output> {
        return std::make_shared<ConsoleOutput>(notifier, args.value("prefix", std::string()));
    });
    registry.register_output("feed", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Output> {
        if (!args.contains("url") || !args["url"].is_string()) {
            throw std::invalid_argument("feed output needs a \"url\"");
        }
        return std::make_shared<FeedOutput>(notifier, args["url"].get<std::string>(),
                                            args.value("timeout_ms", 2000));
    });

    registry.register_service("echo", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Service> {
        return std::make_shared<EchoService>(notifier, args.value("belief", 0.5f));
    });
    registry.register_service("phrase_reply", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Service> {
        return std::make_shared<PhraseReplyService>(notifier, PhraseReplyService::settings_from_json(args));
    });
    registry.register_service("purple_air", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Service> {
        return std::make_shared<PurpleAirService>(notifier, PurpleAirService::settings_from_json(args));
    });
    registry.register_service("keyboard", [](StatusNotifier* notifier, const json& args) -> std::shared_ptr<Service> {
        return std::make_shared<KeyboardActionService>(notifier, args.value("belief", 0.8f),
                                                       args.value("command", std::string("xdotool")));
    });
}

} // namespace parley
