/**
 * Built-in components and the status board. No network, display or stdin:
 * inputs read from pipes and temp files, the Purple Air service reads a
 * pre-seeded cache file, and key presses go to /bin/true and /bin/false.
 *
 * Run from build dir: ./test_components
 */

#include "dispatcher.h"
#include "inputs/replay_input.h"
#include "inputs/text_input.h"
#include "outputs/console_output.h"
#include "outputs/feed_output.h"
#include "services/echo_service.h"
#include "services/keyboard_action_service.h"
#include "services/phrase_reply_service.h"
#include "services/purple_air_service.h"
#include "status_board.h"
#include "test_support.h"
#include <cstdio>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace parley;
using namespace parley::testing;
using json = nlohmann::json;

namespace {

using Words = std::vector<std::string>;

std::string temp_path(const std::string& stem) {
    return "/tmp/parley_test_" + stem + "_" + std::to_string(::getpid());
}

Words words(const std::string& line) {
    return utils::words_of(utils::tokenize(line));
}

/// Run the first handler a service offers for a line
std::optional<HandlerResult> ask(Service& service, const std::string& line) {
    auto handler = service.evaluate(utils::tokenize(line));
    if (!handler) {
        return std::nullopt;
    }
    return handler->handle();
}

} // namespace

int main() {
    // --- StatusBoard: per-kind busy tracking ---
    {
        StatusBoard board;
        ScriptedInput mic(&board, "mic");
        ScriptedInput keys(&board, "keys");
        RecordingOutput speaker(&board);

        ASSERT(!board.status_of(mic));
        ASSERT(board.busy_count(ComponentKind::Input) == 0);
        ASSERT(board.ms_busy(ComponentKind::Input) == -1);

        board.update_status(mic, Status::Active);
        board.update_status(keys, Status::Working);
        ASSERT(board.status_of(mic) == std::optional<Status>(Status::Active));
        ASSERT(board.busy_count(ComponentKind::Input) == 2);
        ASSERT(board.ms_busy(ComponentKind::Input) >= 0);
        ASSERT(board.busy_count(ComponentKind::Output) == 0);
        ASSERT(board.ms_busy(ComponentKind::Output) == -1);

        board.update_status(mic, Status::Idle);
        ASSERT(board.busy_count(ComponentKind::Input) == 1);
        board.update_status(keys, Status::Idle);
        ASSERT(board.busy_count(ComponentKind::Input) == 0);
        ASSERT(board.ms_busy(ComponentKind::Input) == -1);

        // Initializing is remembered but is not busy
        board.update_status(speaker, Status::Initializing);
        ASSERT(board.status_of(speaker) == std::optional<Status>(Status::Initializing));
        ASSERT(board.busy_count(ComponentKind::Output) == 0);

        ASSERT(std::string(status_string(Status::Working)) == "<WORKING>");
        ASSERT(std::string(status_string(Status::Initializing)) == "<INITIALISING>");
    }

    // --- A throwing notifier never reaches the component's caller ---
    {
        struct Grumpy : StatusNotifier {
            void update_status(const Component&, Status) override { throw std::runtime_error("no LED"); }
        } grumpy;
        ScriptedInput input(&grumpy);
        input.start();
        ASSERT(input.status() == Status::Idle);
    }

    // --- TextInput: lines from a pipe ---
    {
        int fds[2];
        ASSERT(::pipe(fds) == 0);
        StatusBoard board;
        TextInput input(&board, fds[0]);
        input.start();
        ASSERT(input.status() == Status::Idle);

        // Nothing written yet
        ASSERT(!input.read());

        std::string text = "hey computer lights on\n   \nhalf a li";
        ASSERT(::write(fds[1], text.data(), text.size()) == static_cast<ssize_t>(text.size()));

        auto first = input.read();
        ASSERT(first && first->size() == 4);
        ASSERT(first && (*first)[3].element == "on");
        ASSERT(first && (*first)[0].confidence == 1.0f);
        ASSERT(input.status() == Status::Idle);

        // Blank line skipped, partial line held back
        ASSERT(!input.read());

        std::string rest = "ne\nlast words";
        ASSERT(::write(fds[1], rest.data(), rest.size()) == static_cast<ssize_t>(rest.size()));
        auto second = input.read();
        ASSERT(second && utils::words_of(*second) == Words({"half", "a", "line"}));
        ASSERT(!input.at_end());

        // The final line counts once the writer closes
        ::close(fds[1]);
        auto last = input.read();
        ASSERT(last && utils::words_of(*last) == Words({"last", "words"}));
        ASSERT(!input.read());
        ASSERT(input.at_end());

        input.stop();
        ::close(fds[0]);

        bool threw = false;
        try {
            TextInput bad(nullptr, -1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- ReplayInput: one line per read, blanks skipped ---
    {
        std::string path = temp_path("replay") + ".txt";
        {
            std::ofstream out(path);
            out << "hey computer say one\n\n   \nhey computer say two\n";
        }
        ReplayInput input(nullptr, path);
        input.start();
        auto one = input.read();
        ASSERT(one && one->back().element == "one");
        auto two = input.read();
        ASSERT(two && two->back().element == "two");
        ASSERT(input.exhausted());
        ASSERT(!input.read());

        // The interval holds back the next line
        ReplayInput slow(nullptr, path, 60000);
        slow.start();
        ASSERT(slow.read());
        ASSERT(!slow.read());
        ASSERT(!slow.exhausted());
        std::remove(path.c_str());

        ReplayInput missing(nullptr, "/nonexistent/replay.txt");
        bool threw = false;
        try {
            missing.start();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- ConsoleOutput ---
    {
        std::ostringstream stream;
        ConsoleOutput console(nullptr, "parley> ", stream);
        console.start();
        console.write("Hello");
        console.write("World");
        ASSERT(stream.str() == "parley> Hello\nparley> World\n");
        ASSERT(console.status() == Status::Idle);

        std::ostringstream broken;
        broken.setstate(std::ios::badbit);
        ConsoleOutput dead(nullptr, "", broken);
        bool threw = false;
        try {
            dead.write("lost");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- FeedOutput payload ---
    {
        json payload = json::parse(FeedOutput::payload_for("It is \"sunny\"", 1700000000123));
        ASSERT(payload["event"].get<std::string>() == "response");
        ASSERT(payload["text"].get<std::string>() == "It is \"sunny\"");
        ASSERT(payload["timestamp_ms"].get<int64_t>() == 1700000000123);

        bool threw = false;
        try {
            FeedOutput nowhere(nullptr, "");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- EchoService ---
    {
        EchoService echo(nullptr);
        auto said = ask(echo, "Say hello world");
        ASSERT(said && said->text == std::optional<std::string>("hello world"));
        ASSERT(said && !said->is_exclusive);
        ASSERT(ask(echo, "repeat after me") && ask(echo, "repeat after me")->text == std::optional<std::string>("after me"));
        ASSERT(!echo.evaluate(utils::tokenize("say")));
        ASSERT(!echo.evaluate(utils::tokenize("tell me a joke")));
        ASSERT(!echo.evaluate(Tokens{}));

        auto handler = echo.evaluate(utils::tokenize("say it"));
        ASSERT(handler && handler->belief() == 0.5f);
        ASSERT(handler && &handler->service() == &echo);
    }

    // --- PhraseReplyService ---
    {
        json args = json::parse(R"({
            "replies": [
                {"phrase": "good morning", "text": "Morning!"},
                {"phrase": "tell me a joke", "text": "Knock knock."},
                {"phrase": "morning", "text": "Shadowed"},
                {"phrase": "!!!", "text": "Never"}
            ],
            "belief": 0.25,
            "exclusive": true
        })");
        PhraseReplyService replies(nullptr, PhraseReplyService::settings_from_json(args));
        ASSERT(replies.size() == 3);

        auto morning = ask(replies, "well, Good Morning to you");
        ASSERT(morning && morning->text == std::optional<std::string>("Morning!"));
        ASSERT(morning && morning->is_exclusive);
        auto joke = ask(replies, "please tell me a joke");
        ASSERT(joke && joke->text == std::optional<std::string>("Knock knock."));
        ASSERT(!replies.evaluate(utils::tokenize("tell me a story")));

        auto handler = replies.evaluate(utils::tokenize("good morning"));
        ASSERT(handler && handler->belief() == 0.25f);

        // Object form, and a replies file
        std::string path = temp_path("replies") + ".json";
        {
            std::ofstream out(path);
            out << R"({"replies": {"thank you": "You're welcome."}})";
        }
        json mixed = {{"file", path}, {"replies", {{"hello", "Hi there."}}}};
        PhraseReplyService both(nullptr, PhraseReplyService::settings_from_json(mixed));
        ASSERT(both.size() == 2);
        auto thanks = ask(both, "thank you");
        ASSERT(thanks && thanks->text == std::optional<std::string>("You're welcome."));
        auto hello = ask(both, "hello");
        ASSERT(hello && hello->text == std::optional<std::string>("Hi there."));
        std::remove(path.c_str());

        bool threw = false;
        try {
            PhraseReplyService::settings_from_json(json{{"file", "/nonexistent/replies.json"}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);

        threw = false;
        try {
            PhraseReplyService::settings_from_json(json{{"replies", 5}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- PurpleAirService: question matching ---
    {
        using Reading = PurpleAirService::Reading;
        ASSERT(PurpleAirService::match(words("what is the air quality index"))
               == std::optional<Reading>(Reading::AirQualityIndex));
        ASSERT(PurpleAirService::match(words("What's the air quality?"))
               == std::optional<Reading>(Reading::AirQuality));
        ASSERT(PurpleAirService::match(words("what is the humidity outside"))
               == std::optional<Reading>(Reading::Humidity));
        ASSERT(PurpleAirService::match(words("whats the temperature"))
               == std::optional<Reading>(Reading::Temperature));
        ASSERT(!PurpleAirService::match(words("what is the time")));
        ASSERT(!PurpleAirService::match(words("tell me what is the humidity")));
        ASSERT(!PurpleAirService::match(words("what is the")));
    }

    // --- PurpleAirService: answers ---
    {
        using Reading = PurpleAirService::Reading;
        ASSERT(PurpleAirService::aqi_from_pm25(0.0) == 0);
        ASSERT(PurpleAirService::aqi_from_pm25(38.0) == 5);
        ASSERT(PurpleAirService::aqi_from_pm25(200.0) == 140);
        ASSERT(std::string(PurpleAirService::aqi_quality(0)) == "okay");
        ASSERT(std::string(PurpleAirService::aqi_quality(50)) == "acceptable");
        ASSERT(std::string(PurpleAirService::aqi_quality(149)) == "poor");
        ASSERT(std::string(PurpleAirService::aqi_quality(150)) == "bad");
        ASSERT(std::string(PurpleAirService::aqi_quality(200)) == "hazardous");
        ASSERT(std::string(PurpleAirService::aqi_quality(250)) == "extremely hazardous");

        json data = {{"PM2_5Value", "38.0"}, {"humidity", "45"}, {"temp_f", "71"}, {"DEVICE_LOCATIONTYPE", "outside"}};
        ASSERT(PurpleAirService::describe(Reading::AirQualityIndex, data) == "The air quality index outside is 5.");
        ASSERT(PurpleAirService::describe(Reading::AirQuality, data) == "The air quality outside is okay.");
        ASSERT(PurpleAirService::describe(Reading::Humidity, data) == "The humidity outside is 45 percent.");
        ASSERT(PurpleAirService::describe(Reading::Temperature, data)
               == "The temperature outside is 71 degrees fahrenheit.");

        // Unusable PM2.5 values read as unknown
        for (const char* bad : {"nan", "NaN", "inf", "-inf", "-3", "many"}) {
            json odd = {{"PM2_5Value", bad}};
            ASSERT(PurpleAirService::describe(Reading::AirQualityIndex, odd) == "The air quality index is unknown.");
            ASSERT(PurpleAirService::describe(Reading::AirQuality, odd) == "The air quality is unknown.");
        }

        // Huge values saturate instead of overflowing
        ASSERT(PurpleAirService::aqi_from_pm25(1e300) == std::numeric_limits<int>::max());
        ASSERT(PurpleAirService::aqi_from_pm25(std::numeric_limits<double>::quiet_NaN()) == 0);
        ASSERT(PurpleAirService::aqi_from_pm25(-5.0) == 0);
        ASSERT(std::string(PurpleAirService::aqi_quality(std::numeric_limits<int>::max())) == "extremely hazardous");

        json bare = json::object();
        ASSERT(PurpleAirService::describe(Reading::Humidity, bare) == "The humidity is unknown.");
        ASSERT(PurpleAirService::describe(Reading::AirQuality, bare) == "The air quality is unknown.");
    }

    // --- PurpleAirService: fresh cache answers without the network ---
    {
        std::string id = "test" + std::to_string(::getpid());
        std::string cache = "/tmp/parley_purpleair_" + id;
        {
            std::ofstream out(cache);
            out << R"({"results": [{"PM2_5Value": "200", "humidity": "30", "temp_f": "65"}]})";
        }
        PurpleAirService::Settings settings;
        settings.sensor_id = id;
        settings.url_template = "http://127.0.0.1:9/json?show={id}";
        settings.cache_seconds = 3600;
        StatusBoard board;
        PurpleAirService air(&board, settings);
        air.start();

        auto data = air.sensor_data();
        ASSERT(data.is_ok());
        ASSERT(data.is_ok() && data.value()["temp_f"].get<std::string>() == "65");
        ASSERT(air.status() == Status::Idle);

        auto answer = ask(air, "what is the air quality");
        ASSERT(answer && answer->text == std::optional<std::string>("The air quality is poor."));
        ASSERT(answer && answer->is_exclusive);
        auto handler = air.evaluate(utils::tokenize("whats the temperature"));
        ASSERT(handler && handler->belief() == 1.0f);
        ASSERT(!air.evaluate(utils::tokenize("turn on the lights")));

        // No results at all reads as an empty record
        {
            std::ofstream out(cache, std::ios::trunc);
            out << R"({"results": []})";
        }
        auto empty = air.sensor_data();
        ASSERT(empty.is_ok() && empty.value().empty());

        // Garbage in the cache is a parse error
        {
            std::ofstream out(cache, std::ios::trunc);
            out << "<html>";
        }
        auto garbage = air.sensor_data();
        ASSERT(garbage.is_error() && garbage.error().type == ErrorType::ParseError);
        std::remove(cache.c_str());

        bool threw = false;
        try {
            PurpleAirService::settings_from_json(json::object());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT(threw);
        PurpleAirService::Settings numeric = PurpleAirService::settings_from_json(json{{"sensor_id", 1234}});
        ASSERT(numeric.sensor_id == "1234");
        ASSERT(numeric.cache_seconds == 60);
    }

    // --- KeyboardActionService ---
    {
        KeyboardActionService keys(nullptr, 0.8f, "true");
        ASSERT(keys.actions().size() == 24);
        ASSERT(keys.chord_for(words("copy that")) == std::optional<std::string>("ctrl+c"));
        ASSERT(keys.chord_for(words("Refresh, please")) == std::optional<std::string>("F5"));
        ASSERT(keys.chord_for(words("open system monitor")) == std::optional<std::string>("super+2"));
        ASSERT(keys.chord_for(words("page down")) == std::optional<std::string>("Next"));
        ASSERT(!keys.chord_for(words("please copy that")));
        ASSERT(!keys.chord_for(words("copy")));

        auto handler = keys.evaluate(utils::tokenize("next window"));
        ASSERT(handler && handler->belief() == 0.8f);
        auto result = handler ? handler->handle() : std::nullopt;
        ASSERT(result && !result->text);
        ASSERT(result && result->is_query);
        ASSERT(result && !result->is_exclusive);

        keys.press("ctrl+c");

        // A key press leaves room for lower-ranked answers
        {
            Dispatcher dispatcher({"hey computer"}, DispatcherConfig{}, std::make_unique<StatusBoard>());
            auto pressing = std::make_shared<KeyboardActionService>(dispatcher.notifier(), 0.8f, "true");
            PhraseReplyService::Settings settings;
            settings.replies.push_back({"copy that", "Copied."});
            settings.belief = 0.2f;
            dispatcher.add_service(pressing);
            dispatcher.add_service(std::make_shared<PhraseReplyService>(dispatcher.notifier(), settings));
            ASSERT(dispatcher.handle(utils::tokenize("hey computer copy that"))
                   == std::optional<std::string>("Copied."));
        }

        KeyboardActionService failing_keys(nullptr, 0.8f, "false");
        bool threw = false;
        try {
            failing_keys.press("ctrl+c");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);

        KeyboardActionService missing_tool(nullptr, 0.8f, "/nonexistent/xdotool");
        threw = false;
        try {
            missing_tool.press("F5");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);
    }

    return finish("components");
}
