#include "services/phrase_reply_service.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace parley {

namespace {

class ReplyHandler : public Handler {
public:
    ReplyHandler(Service& service, const Tokens& tokens, float belief, std::string text, bool exclusive)
        : Handler(service, tokens, belief), text_(std::move(text)), exclusive_(exclusive) {}

    std::optional<HandlerResult> handle() override {
        return HandlerResult::reply(text_, exclusive_);
    }

private:
    std::string text_;
    bool exclusive_;
};

void append_replies(const json& replies, std::vector<PhraseReplyService::Reply>& out, const std::string& where) {
    if (replies.is_object()) {
        for (auto& [phrase, text] : replies.items()) {
            if (!text.is_string()) {
                throw std::runtime_error(where + ": reply for \"" + phrase + "\" must be a string");
            }
            out.push_back({phrase, text.get<std::string>()});
        }
    } else if (replies.is_array()) {
        for (const auto& entry : replies) {
            if (!entry.is_object() || !entry.contains("phrase") || !entry.contains("text") ||
                !entry["phrase"].is_string() || !entry["text"].is_string()) {
                throw std::runtime_error(where + ": expected {\"phrase\": ..., \"text\": ...}, got " + entry.dump());
            }
            out.push_back({entry["phrase"].get<std::string>(), entry["text"].get<std::string>()});
        }
    } else {
        throw std::runtime_error(where + ": \"replies\" must be an object or an array");
    }
}

} // namespace

PhraseReplyService::Settings PhraseReplyService::settings_from_json(const json& args) {
    Settings settings;
    settings.belief = args.value("belief", 0.5f);
    settings.exclusive = args.value("exclusive", false);

    if (args.contains("file")) {
        std::string path = args["file"].get<std::string>();
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open replies file: " + path);
        }
        json doc;
        try {
            file >> doc;
        } catch (const json::exception& e) {
            throw std::runtime_error("Failed to parse " + path + ": " + std::string(e.what()));
        }
        append_replies(doc.contains("replies") ? doc["replies"] : doc, settings.replies, path);
    }
    if (args.contains("replies")) {
        append_replies(args["replies"], settings.replies, "phrase_reply");
    }
    return settings;
}

PhraseReplyService::PhraseReplyService(StatusNotifier* notifier, Settings settings)
    : Service("PhraseReply", notifier), belief_(settings.belief), exclusive_(settings.exclusive) {
    for (const auto& reply : settings.replies) {
        KeyPhrase words = parse_key_phrase(reply.phrase);
        if (words.empty()) {
            Logger::warn("[PhraseReply] Ignoring phrase without letters: \"" + reply.phrase + "\"");
            continue;
        }
        replies_.push_back({std::move(words), reply.text});
    }
}

void PhraseReplyService::start() {
    LOG_SERVICE("PhraseReply loaded " + std::to_string(replies_.size()) + " replies");
    notify_status(Status::Idle);
}

std::unique_ptr<Handler> PhraseReplyService::evaluate(const Tokens& tokens) {
    std::vector<std::string> words = utils::words_of(tokens);
    for (const auto& entry : replies_) {
        if (list_index(words, entry.words)) {
            return std::make_unique<ReplyHandler>(*this, tokens, belief_, entry.text, exclusive_);
        }
    }
    return nullptr;
}

} // namespace parley
