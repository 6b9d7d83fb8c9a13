#pragma once

#include "component.h"
#include "errors.h"
#include "service.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace parley {

/**
 * @brief Builds components by kind name
 *
 * Each section (inputs, outputs, services) has its own table of factories so a
 * kind can only be built where it makes sense. Factories receive the notifier
 * to hand to the component and the args object from the config; they report
 * bad args by throwing.
 */
class ComponentRegistry {
public:
    template<typename T>
    using Factory = std::function<std::shared_ptr<T>(StatusNotifier*, const nlohmann::json&)>;

    using InputFactory = Factory<Input>;
    using OutputFactory = Factory<Output>;
    using ServiceFactory = Factory<Service>;

    /**
     * @brief Register a factory
     * @return false if the kind is already registered in that section (nothing replaced)
     */
    bool register_input(const std::string& kind, InputFactory factory);
    bool register_output(const std::string& kind, OutputFactory factory);
    bool register_service(const std::string& kind, ServiceFactory factory);

    /**
     * @brief Construct a component
     * @return The component, or a ConfigError naming the kind, args and cause
     */
    Result<std::shared_ptr<Input>> create_input(const std::string& kind, StatusNotifier* notifier,
                                                const nlohmann::json& args) const;
    Result<std::shared_ptr<Output>> create_output(const std::string& kind, StatusNotifier* notifier,
                                                  const nlohmann::json& args) const;
    Result<std::shared_ptr<Service>> create_service(const std::string& kind, StatusNotifier* notifier,
                                                    const nlohmann::json& args) const;

    std::vector<std::string> input_kinds() const;
    std::vector<std::string> output_kinds() const;
    std::vector<std::string> service_kinds() const;

private:
    std::map<std::string, InputFactory> inputs_;
    std::map<std::string, OutputFactory> outputs_;
    std::map<std::string, ServiceFactory> services_;
};

/**
 * @brief Install the components that ship with parley
 *
 * inputs: stdin, replay; outputs: console, feed;
 * services: echo, phrase_reply, purple_air, keyboard
 */
void register_builtin_components(ComponentRegistry& registry);

} // namespace parley
