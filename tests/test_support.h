/**
 * Shared assertion macro and scripted components for the parley tests.
 * Nothing here touches the network, the display or stdin.
 */

#pragma once

#include "component.h"
#include "service.h"
#include "utils.h"
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

inline int finish(const char* suite) {
    if (failed) {
        std::cerr << failed << " assertion(s) failed in " << suite << ".\n";
        return 1;
    }
    std::cout << "All " << suite << " tests passed.\n";
    return 0;
}

namespace parley {
namespace testing {

/// Hands out prepared utterances, one per read()
class ScriptedInput : public Input {
public:
    explicit ScriptedInput(StatusNotifier* notifier = nullptr, std::string name = "ScriptedInput")
        : Input(std::move(name), notifier) {}

    void say(const std::string& line) { batches_.push_back(utils::tokenize(line)); }

    void start() override {
        starts++;
        if (fail_start) throw std::runtime_error("input refused to start");
        notify_status(Status::Idle);
    }

    void stop() override {
        stops++;
        if (fail_stop) throw std::runtime_error("input refused to stop");
    }

    std::optional<Tokens> read() override {
        reads++;
        std::optional<Tokens> result;
        if (!batches_.empty()) {
            result = batches_.front();
            batches_.pop_front();
        }
        if (after_read) after_read();
        return result;
    }

    std::function<void()> after_read;
    bool fail_start = false;
    bool fail_stop = false;
    int starts = 0;
    int stops = 0;
    int reads = 0;

private:
    std::deque<Tokens> batches_;
};

/// Remembers everything written to it
class RecordingOutput : public Output {
public:
    explicit RecordingOutput(StatusNotifier* notifier = nullptr, std::string name = "RecordingOutput")
        : Output(std::move(name), notifier) {}

    void start() override { starts++; }

    void stop() override {
        stops++;
        if (fail_stop) throw std::runtime_error("output refused to stop");
    }

    void write(const std::string& text) override {
        attempts++;
        if (fail_write) throw std::runtime_error("output is broken");
        written.push_back(text);
    }

    std::vector<std::string> written;
    bool fail_write = false;
    bool fail_stop = false;
    int attempts = 0;
    int starts = 0;
    int stops = 0;
};

/// What a scripted handler does when run
struct Script {
    std::string label;
    float belief = 0.5f;
    std::optional<std::string> text;
    bool exclusive = false;
    bool raises = false;
    bool no_result = false;
};

/// Claims every utterance with a handler built from its Script
class ScriptedService : public Service {
public:
    ScriptedService(std::string name, Script script, std::vector<std::string>* run_log,
                    StatusNotifier* notifier = nullptr)
        : Service(std::move(name), notifier), script_(std::move(script)), run_log_(run_log) {}

    std::unique_ptr<Handler> evaluate(const Tokens& tokens) override {
        evaluations++;
        last_tokens = tokens;
        if (fail_evaluate) throw std::runtime_error("evaluate blew up");
        if (!claims) return nullptr;
        return std::make_unique<ScriptedHandler>(*this, tokens, script_, run_log_);
    }

    void stop() override {
        stops++;
        if (fail_stop) throw std::runtime_error("service refused to stop");
    }

    bool claims = true;
    bool fail_evaluate = false;
    bool fail_stop = false;
    int evaluations = 0;
    int stops = 0;
    Tokens last_tokens;

private:
    class ScriptedHandler : public Handler {
    public:
        ScriptedHandler(Service& service, const Tokens& tokens, Script script, std::vector<std::string>* run_log)
            : Handler(service, tokens, script.belief), script_(std::move(script)), run_log_(run_log) {}

        std::optional<HandlerResult> handle() override {
            if (run_log_) run_log_->push_back(script_.label);
            if (script_.raises) throw std::runtime_error(script_.label + " failed");
            if (script_.no_result) return std::nullopt;
            HandlerResult result;
            result.text = script_.text;
            result.is_exclusive = script_.exclusive;
            return result;
        }

    private:
        Script script_;
        std::vector<std::string>* run_log_;
    };

    Script script_;
    std::vector<std::string>* run_log_;
};

/// Script shorthand
inline Script answer(const std::string& label, float belief, std::optional<std::string> text, bool exclusive = false) {
    Script script;
    script.label = label;
    script.belief = belief;
    script.text = std::move(text);
    script.exclusive = exclusive;
    return script;
}

inline Script failing(const std::string& label, float belief) {
    Script script;
    script.label = label;
    script.belief = belief;
    script.raises = true;
    return script;
}

} // namespace testing
} // namespace parley
