#include "services/purple_air_service.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;

namespace parley {

namespace {

struct Question {
    KeyPhrase what;
    PurpleAirService::Reading reading;
};

// Longer phrases first so "air quality index" is not taken for "air quality"
const std::vector<Question>& questions() {
    static const std::vector<Question> table = {
        {{"air", "quality", "index"}, PurpleAirService::Reading::AirQualityIndex},
        {{"air", "quality"},          PurpleAirService::Reading::AirQuality},
        {{"humidity"},                PurpleAirService::Reading::Humidity},
        {{"temperature"},             PurpleAirService::Reading::Temperature},
    };
    return table;
}

const std::vector<KeyPhrase>& prefixes() {
    static const std::vector<KeyPhrase> table = {
        {"what", "is", "the"},
        {"whats", "the"},
    };
    return table;
}

bool starts_with(const std::vector<std::string>& words, const KeyPhrase& prefix, const KeyPhrase& what) {
    if (words.size() < prefix.size() + what.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), words.begin()) &&
           std::equal(what.begin(), what.end(), words.begin() + static_cast<std::ptrdiff_t>(prefix.size()));
}

/// Field as text; the API sends most numbers as strings
std::optional<std::string> field_text(const json& data, const char* key) {
    if (!data.is_object() || !data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    const json& value = data[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<double> field_number(const json& data, const char* key) {
    auto text = field_text(data, key);
    if (!text) {
        return std::nullopt;
    }
    double value = 0.0;
    try {
        value = std::stod(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    // Sensor data comes off the network; nan, inf and negatives mean no reading
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

/// "The humidity outside is" / "The humidity is"
std::string lead(const std::string& what, const json& data) {
    std::string where = field_text(data, "DEVICE_LOCATIONTYPE").value_or("");
    return "The " + what + (where.empty() ? "" : " " + where) + " is ";
}

class ReadingHandler : public Handler {
public:
    ReadingHandler(PurpleAirService& service, const Tokens& tokens, PurpleAirService::Reading reading)
        : Handler(service, tokens, 1.0f), service_(service), reading_(reading) {}

    std::optional<HandlerResult> handle() override {
        Result<json> data = service_.sensor_data();
        if (data.is_error()) {
            throw std::runtime_error("Purple Air lookup failed: " + data.error().message);
        }
        return HandlerResult::reply(PurpleAirService::describe(reading_, data.value()), true);
    }

private:
    PurpleAirService& service_;
    PurpleAirService::Reading reading_;
};

} // namespace

PurpleAirService::Settings PurpleAirService::settings_from_json(const json& args) {
    Settings settings;
    if (!args.contains("sensor_id") || args["sensor_id"].is_null()) {
        throw std::invalid_argument("purple_air needs a \"sensor_id\"");
    }
    const json& id = args["sensor_id"];
    settings.sensor_id = id.is_string() ? id.get<std::string>() : id.dump();
    settings.url_template = args.value("url", settings.url_template);
    settings.cache_dir = args.value("cache_dir", settings.cache_dir);
    settings.cache_seconds = args.value("cache_seconds", settings.cache_seconds);
    settings.timeout_ms = args.value("timeout_ms", settings.timeout_ms);
    return settings;
}

PurpleAirService::PurpleAirService(StatusNotifier* notifier, Settings settings)
    : Service("PurpleAir", notifier), settings_(std::move(settings)), http_(settings_.timeout_ms) {
    if (settings_.sensor_id.empty()) {
        throw std::invalid_argument("Purple Air sensor ID was not given");
    }
}

void PurpleAirService::start() {
    LOG_SERVICE("PurpleAir reading sensor " + settings_.sensor_id);
    notify_status(Status::Idle);
}

std::optional<PurpleAirService::Reading> PurpleAirService::match(const std::vector<std::string>& words) {
    for (const auto& question : questions()) {
        for (const auto& prefix : prefixes()) {
            if (starts_with(words, prefix, question.what)) {
                return question.reading;
            }
        }
    }
    return std::nullopt;
}

std::unique_ptr<Handler> PurpleAirService::evaluate(const Tokens& tokens) {
    auto reading = match(utils::words_of(tokens));
    if (!reading) {
        return nullptr;
    }
    return std::make_unique<ReadingHandler>(*this, tokens, *reading);
}

Result<json> PurpleAirService::sensor_data() {
    notify_status(Status::Working);
    std::string path = cache_path();
    std::string content;

    // Use a recent enough cached copy
    struct stat st;
    if (::stat(path.c_str(), &st) == 0 &&
        std::difftime(std::time(nullptr), st.st_mtime) < settings_.cache_seconds) {
        std::ifstream cached(path, std::ios::binary);
        if (cached.is_open()) {
            std::ostringstream oss;
            oss << cached.rdbuf();
            content = oss.str();
        }
    }

    if (content.empty()) {
        Result<HttpResponse> response = http_.get(url());
        if (response.is_error()) {
            notify_status(Status::Idle);
            return response.error();
        }
        if (!response.value().ok()) {
            notify_status(Status::Idle);
            return make_network_error("HTTP " + std::to_string(response.value().status_code) + " from " + url());
        }
        content = response.value().body;

        std::ofstream cache(path, std::ios::binary | std::ios::trunc);
        if (cache.is_open()) {
            cache << content;
        } else {
            Logger::warn("[PurpleAir] Could not write cache file " + path);
        }
    }
    notify_status(Status::Idle);

    json raw;
    try {
        raw = json::parse(content);
    } catch (const json::exception& e) {
        return make_parse_error("Bad Purple Air response: " + std::string(e.what()));
    }

    if (!raw.is_object() || !raw.contains("results") || !raw["results"].is_array() || raw["results"].empty()) {
        return json::object();
    }
    Logger::debug("[PurpleAir] Got: " + raw["results"][0].dump());
    return raw["results"][0];
}

std::string PurpleAirService::describe(Reading reading, const json& data) {
    switch (reading) {
        case Reading::AirQualityIndex:
        case Reading::AirQuality: {
            auto pm25 = field_number(data, "PM2_5Value");
            bool index = reading == Reading::AirQualityIndex;
            std::string what = index ? "air quality index" : "air quality";
            if (!pm25) {
                return lead(what, data) + "unknown.";
            }
            int aqi = aqi_from_pm25(*pm25);
            return lead(what, data) + (index ? std::to_string(aqi) : std::string(aqi_quality(aqi))) + ".";
        }
        case Reading::Humidity: {
            auto humidity = field_text(data, "humidity");
            return lead("humidity", data) + (humidity ? *humidity + " percent" : std::string("unknown")) + ".";
        }
        case Reading::Temperature: {
            auto temperature = field_text(data, "temp_f");
            return lead("temperature", data)
                + (temperature ? *temperature + " degrees fahrenheit" : std::string("unknown")) + ".";
        }
    }
    return "";
}

int PurpleAirService::aqi_from_pm25(double pm25) {
    // Very rough approximation of the EPA curve
    if (!std::isfinite(pm25) || pm25 <= 0.0) {
        return 0;
    }
    double aqi = pm25 * pm25 / 285.0;
    if (!(aqi < static_cast<double>(std::numeric_limits<int>::max()))) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(aqi);
}

const char* PurpleAirService::aqi_quality(int aqi) {
    if (aqi < 50) return "okay";
    if (aqi < 100) return "acceptable";
    if (aqi < 150) return "poor";
    if (aqi < 200) return "bad";
    if (aqi < 250) return "hazardous";
    return "extremely hazardous";
}

std::string PurpleAirService::url() const {
    std::string result = settings_.url_template;
    size_t pos = result.find("{id}");
    if (pos != std::string::npos) {
        result.replace(pos, 4, settings_.sensor_id);
    }
    return result;
}

std::string PurpleAirService::cache_path() const {
    std::string dir = settings_.cache_dir;
    if (!dir.empty() && dir.back() != '/') {
        dir += '/';
    }
    return dir + "parley_purpleair_" + settings_.sensor_id;
}

} // namespace parley
