#include "dispatcher.h"
#include "component_registry.h"
#include "logger.h"
#include "status_board.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace parley {

class Dispatcher::Impl {
public:
    Impl(const std::vector<std::string>& key_phrases,
         const DispatcherConfig& settings,
         std::unique_ptr<StatusNotifier> notifier)
        : settings_(settings), notifier_(std::move(notifier)),
          running_(true), interrupted_(false), started_(false), stopped_(false) {
        for (const auto& phrase : key_phrases) {
            KeyPhrase parsed = parse_key_phrase(phrase);
            if (parsed.empty()) {
                Logger::warn("Key phrase \"" + phrase + "\" has no letters and can never match");
            }
            key_phrases_.push_back(std::move(parsed));
        }
    }

    StatusNotifier* notifier() const {
        return notifier_.get();
    }

    void add_input(std::shared_ptr<Input> input) {
        check_not_started("input");
        inputs_.push_back(std::move(input));
    }

    void add_output(std::shared_ptr<Output> output) {
        check_not_started("output");
        outputs_.push_back(std::move(output));
    }

    void add_service(std::shared_ptr<Service> service) {
        check_not_started("service");
        services_.push_back(std::move(service));
    }

    const std::vector<KeyPhrase>& key_phrases() const {
        return key_phrases_;
    }

    void run() {
        LOG_DISPATCH("Starting the system");
        start_components();

        LOG_DISPATCH("Entering main loop");
        while (running_) {
            poll_inputs();
            if (!running_) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.poll_interval_ms));
        }

        if (interrupted_) {
            Logger::warn("[Dispatcher] Interrupt received");
        } else {
            LOG_DISPATCH("Stop requested");
        }

        LOG_DISPATCH("Stopping the system");
        stop_components();
    }

    void stop() {
        running_ = false;
    }

    void interrupt() {
        interrupted_ = true;
        running_ = false;
    }

    bool is_running() const {
        return running_;
    }

    void start_components() {
        started_ = true;
        std::vector<Component*> started;
        for (Component* component : all_components()) {
            LOG_DISPATCH("Starting " + component->name());
            try {
                component->start();
            } catch (const std::exception& e) {
                Logger::error("[Dispatcher] Failed to start " + component->name() + ": " + e.what());
                // Nothing runs half-started
                stop_each(started);
                stopped_ = true;
                throw;
            }
            started.push_back(component);
        }
    }

    void poll_inputs() {
        for (const auto& input : inputs_) {
            if (!running_) {
                return;
            }

            std::optional<Tokens> tokens;
            try {
                tokens = input->read();
            } catch (const std::exception& e) {
                Logger::error("[Dispatcher] Failed to read from " + input->name() + ": " + e.what());
                continue;
            }
            if (!tokens || tokens->empty()) {
                continue;
            }

            LOG_DISPATCH("Read from " + input->name() + ": " + describe_tokens(*tokens));
            std::optional<std::string> response = handle(*tokens);
            if (response) {
                respond(*response);
            }
        }
    }

    std::optional<std::string> handle(const Tokens& tokens) {
        if (tokens.empty()) {
            return std::nullopt;
        }

        // Find where the command starts, if a key-phrase was said at all
        std::vector<std::string> words = utils::words_of(tokens);
        std::optional<size_t> offset = find_command_offset(words, key_phrases_);
        if (!offset) {
            LOG_DISPATCH("Key phrases " + describe_phrases() + " not found in " + utils::describe(words));
            return std::nullopt;
        }

        Tokens command(tokens.begin() + static_cast<std::ptrdiff_t>(*offset), tokens.end());

        // See which services want it
        std::vector<std::unique_ptr<Handler>> handlers;
        for (const auto& service : services_) {
            try {
                std::unique_ptr<Handler> handler = service->evaluate(command);
                if (handler) {
                    handlers.push_back(std::move(handler));
                }
            } catch (const std::exception& e) {
                Logger::error("[Dispatcher] Service " + service->name() + " failed to evaluate "
                    + describe_tokens(command) + ": " + e.what());
            }
        }

        if (handlers.empty()) {
            return settings_.apology_text;
        }

        // Most confident first; equal beliefs keep service order
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const std::unique_ptr<Handler>& a, const std::unique_ptr<Handler>& b) {
                return a->belief() > b->belief();
            });

        std::string response;
        for (const auto& handler : handlers) {
            try {
                std::optional<HandlerResult> result = handler->handle();
                if (!result) {
                    continue;
                }
                if (result->text) {
                    response += *result->text;
                }
                if (result->is_exclusive) {
                    break;
                }
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "[Dispatcher] Handler (belief " << handler->belief() << ") with tokens "
                    << describe_tokens(handler->tokens()) << " for service "
                    << handler->service().name() << " yielded: " << e.what();
                Logger::error(oss.str());
            }
        }

        if (response.empty()) {
            return std::nullopt;
        }
        return response;
    }

    void respond(const std::string& response) {
        if (response.empty()) {
            return;
        }
        for (const auto& output : outputs_) {
            try {
                output->write(response);
            } catch (const std::exception& e) {
                Logger::error("[Dispatcher] Failed to respond with " + output->name() + ": " + e.what());
            }
        }
    }

    void stop_components() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        stop_each(all_components());
    }

private:
    void check_not_started(const char* what) const {
        if (started_) {
            throw std::logic_error(std::string("Cannot add an ") + what + " after the components have started");
        }
    }

    std::vector<Component*> all_components() const {
        std::vector<Component*> components;
        components.reserve(inputs_.size() + outputs_.size() + services_.size());
        for (const auto& input : inputs_) components.push_back(input.get());
        for (const auto& output : outputs_) components.push_back(output.get());
        for (const auto& service : services_) components.push_back(service.get());
        return components;
    }

    static void stop_each(const std::vector<Component*>& components) {
        for (Component* component : components) {
            // Best effort, since we're shutting down
            try {
                LOG_DISPATCH("Stopping " + component->name());
                component->stop();
            } catch (const std::exception& e) {
                Logger::error("[Dispatcher] Failed to stop " + component->name() + ": " + e.what());
            }
        }
    }

    static std::string describe_tokens(const Tokens& tokens) {
        std::vector<std::string> elements;
        elements.reserve(tokens.size());
        for (const auto& token : tokens) {
            elements.push_back(token.element);
        }
        return utils::describe(elements);
    }

    std::string describe_phrases() const {
        std::vector<std::string> phrases;
        phrases.reserve(key_phrases_.size());
        for (const auto& phrase : key_phrases_) {
            phrases.push_back("(" + utils::join(phrase, " ") + ")");
        }
        return utils::describe(phrases);
    }

    DispatcherConfig settings_;
    std::vector<KeyPhrase> key_phrases_;

    // Declared before the components so it outlives them
    std::unique_ptr<StatusNotifier> notifier_;
    std::vector<std::shared_ptr<Input>> inputs_;
    std::vector<std::shared_ptr<Output>> outputs_;
    std::vector<std::shared_ptr<Service>> services_;

    std::atomic<bool> running_;
    std::atomic<bool> interrupted_;
    bool started_;
    bool stopped_;
};

Dispatcher::Dispatcher(const std::vector<std::string>& key_phrases,
                       const DispatcherConfig& settings,
                       std::unique_ptr<StatusNotifier> notifier)
    : pimpl_(std::make_unique<Impl>(key_phrases, settings, std::move(notifier))) {}

Dispatcher::~Dispatcher() = default;

std::unique_ptr<Dispatcher> Dispatcher::create(const Config& config, const ComponentRegistry& registry) {
    auto dispatcher = std::make_unique<Dispatcher>(config.key_phrases, config.dispatcher,
                                                   std::make_unique<StatusBoard>());
    StatusNotifier* notifier = dispatcher->notifier();

    for (const auto& spec : config.components.inputs) {
        auto input = registry.create_input(spec.kind, notifier, spec.args);
        if (input.is_error()) {
            throw std::runtime_error(input.error().message);
        }
        dispatcher->add_input(input.value());
    }
    for (const auto& spec : config.components.outputs) {
        auto output = registry.create_output(spec.kind, notifier, spec.args);
        if (output.is_error()) {
            throw std::runtime_error(output.error().message);
        }
        dispatcher->add_output(output.value());
    }
    for (const auto& spec : config.components.services) {
        auto service = registry.create_service(spec.kind, notifier, spec.args);
        if (service.is_error()) {
            throw std::runtime_error(service.error().message);
        }
        dispatcher->add_service(service.value());
    }

    return dispatcher;
}

StatusNotifier* Dispatcher::notifier() const {
    return pimpl_->notifier();
}

void Dispatcher::add_input(std::shared_ptr<Input> input) {
    pimpl_->add_input(std::move(input));
}

void Dispatcher::add_output(std::shared_ptr<Output> output) {
    pimpl_->add_output(std::move(output));
}

void Dispatcher::add_service(std::shared_ptr<Service> service) {
    pimpl_->add_service(std::move(service));
}

const std::vector<KeyPhrase>& Dispatcher::key_phrases() const {
    return pimpl_->key_phrases();
}

void Dispatcher::run() {
    pimpl_->run();
}

void Dispatcher::stop() {
    pimpl_->stop();
}

void Dispatcher::interrupt() {
    pimpl_->interrupt();
}

bool Dispatcher::is_running() const {
    return pimpl_->is_running();
}

void Dispatcher::start_components() {
    pimpl_->start_components();
}

void Dispatcher::poll_inputs() {
    pimpl_->poll_inputs();
}

std::optional<std::string> Dispatcher::handle(const Tokens& tokens) {
    return pimpl_->handle(tokens);
}

void Dispatcher::respond(const std::string& response) {
    pimpl_->respond(response);
}

void Dispatcher::stop_components() {
    pimpl_->stop_components();
}

} // namespace parley
