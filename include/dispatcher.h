#pragma once

#include "common.h"
#include "component.h"
#include "config.h"
#include "key_phrase.h"
#include "service.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {

class ComponentRegistry;

/**
 * @brief The command dispatch engine
 *
 * Polls every input for token batches, drops batches that do not contain a
 * key-phrase, asks every service to evaluate the rest of the utterance, runs
 * the resulting handlers in descending order of belief and sends the
 * accumulated text to every output.
 *
 * Single-threaded: run() drives everything on the calling thread. stop() and
 * interrupt() may be called from any thread or from a signal handler.
 */
class Dispatcher {
public:
    /**
     * @param key_phrases Phrase text as configured; sanitised here
     * @param settings Poll interval and apology text
     * @param notifier Receives component status changes; owned by the Dispatcher
     */
    Dispatcher(const std::vector<std::string>& key_phrases,
               const DispatcherConfig& settings,
               std::unique_ptr<StatusNotifier> notifier);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Build a Dispatcher and all configured components
     *
     * Uses a StatusBoard as the notifier.
     * @throws std::runtime_error if any component cannot be built
     */
    static std::unique_ptr<Dispatcher> create(const Config& config, const ComponentRegistry& registry);

    /// Notifier to hand to components built for this Dispatcher
    StatusNotifier* notifier() const;

    /// Add components, in order. Throws std::logic_error once components have been started.
    void add_input(std::shared_ptr<Input> input);
    void add_output(std::shared_ptr<Output> output);
    void add_service(std::shared_ptr<Service> service);

    const std::vector<KeyPhrase>& key_phrases() const;

    /**
     * @brief Start everything, loop until stopped, then stop everything
     * @throws whatever a component's start() throws (after stopping those already started)
     */
    void run();

    /// Ask the main loop to finish (graceful)
    void stop();

    /// Ask the main loop to finish because of an interrupt signal
    void interrupt();

    bool is_running() const;

    // Steps of run(), exposed for embedding and tests

    /// Start inputs, outputs, then services. Fatal on the first failure.
    void start_components();

    /// One sweep over all inputs: read, handle, respond
    void poll_inputs();

    /**
     * @brief Handle one token batch
     * @return Response text; the apology if no service claimed the command;
     *         nullopt if no key-phrase was heard or the handlers said nothing
     */
    std::optional<std::string> handle(const Tokens& tokens);

    /// Send a response to every output, isolating failures
    void respond(const std::string& response);

    /// Stop every component once, best effort
    void stop_components();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
