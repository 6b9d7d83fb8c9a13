#pragma once

#include "component.h"
#include <memory>
#include <optional>
#include <string>

namespace parley {

class Service;

/**
 * @brief Outcome of running a Handler
 */
struct HandlerResult {
    std::optional<std::string> text;  ///< What to say back, if anything
    bool is_query = false;            ///< The answer expects a follow-up from the user
    bool is_exclusive = false;        ///< No lower-ranked handler runs after this one

    static HandlerResult reply(const std::string& text, bool exclusive = false) {
        HandlerResult result;
        result.text = text;
        result.is_exclusive = exclusive;
        return result;
    }

    static HandlerResult silent(bool exclusive = false) {
        HandlerResult result;
        result.is_exclusive = exclusive;
        return result;
    }

    /// Nothing to say; the user is expected to follow up
    static HandlerResult awaiting_reply() {
        HandlerResult result;
        result.is_query = true;
        return result;
    }
};

/**
 * @brief A service's claim on an utterance
 *
 * Created by Service::evaluate for one dispatch cycle and discarded after it.
 * The belief is only compared with other handlers' beliefs; it is not clamped.
 */
class Handler {
public:
    Handler(Service& service, Tokens tokens, float belief)
        : service_(service), tokens_(std::move(tokens)), belief_(belief) {}
    virtual ~Handler() = default;

    /**
     * @brief Perform the action
     * @return The result, or nullopt if there is nothing to report
     * May throw; the Dispatcher logs the failure and moves to the next handler.
     */
    virtual std::optional<HandlerResult> handle() = 0;

    Service& service() const { return service_; }
    const Tokens& tokens() const { return tokens_; }
    float belief() const { return belief_; }

private:
    Service& service_;
    Tokens tokens_;
    float belief_;
};

/**
 * @brief Something that can answer utterances
 */
class Service : public Component {
public:
    using Component::Component;

    ComponentKind kind() const override { return ComponentKind::Service; }

    /**
     * @brief Decide whether this service applies to the tokens
     * @param tokens The utterance with the key-phrase removed
     * @return A handler if the service claims the tokens, nullptr otherwise
     */
    virtual std::unique_ptr<Handler> evaluate(const Tokens& tokens) = 0;
};

} // namespace parley
