#pragma once

#include "key_phrase.h"
#include "service.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace parley {

/**
 * @brief Canned answers for fixed phrases ("tell me a joke", "good morning")
 *
 * A reply applies when its phrase appears anywhere in the utterance as a
 * contiguous run of words. Replies are checked in order and the first one
 * that applies wins (object-form replies are ordered by phrase; use the
 * array form to choose the order).
 */
class PhraseReplyService : public Service {
public:
    struct Reply {
        std::string phrase;
        std::string text;
    };

    struct Settings {
        std::vector<Reply> replies;
        float belief = 0.5f;
        bool exclusive = false;
    };

    /**
     * @brief Read settings from component args
     *
     * Args: "replies" (object phrase -> text, or array of {"phrase","text"})
     * and/or "file" (JSON file holding the same "replies" value), "belief",
     * "exclusive".
     * @throws std::runtime_error on unreadable files or malformed replies
     */
    static Settings settings_from_json(const nlohmann::json& args);

    PhraseReplyService(StatusNotifier* notifier, Settings settings);

    void start() override;
    std::unique_ptr<Handler> evaluate(const Tokens& tokens) override;

    size_t size() const { return replies_.size(); }

private:
    struct Entry {
        KeyPhrase words;
        std::string text;
    };

    std::vector<Entry> replies_;
    float belief_;
    bool exclusive_;
};

} // namespace parley
