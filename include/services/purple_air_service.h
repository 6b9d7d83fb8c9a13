#pragma once

#include "errors.h"
#include "http_client.h"
#include "key_phrase.h"
#include "service.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace parley {

/**
 * @brief Answers air quality, humidity and temperature questions from a
 *        Purple Air sensor
 *
 * Understands "what is the ..." / "what's the ..." followed by
 * "air quality index", "air quality", "humidity" or "temperature".
 * Sensor data is cached on disk so repeated questions do not hammer the API.
 */
class PurpleAirService : public Service {
public:
    enum class Reading {
        AirQualityIndex,  ///< Numeric AQI
        AirQuality,       ///< AQI as a word ("okay", "poor", ...)
        Humidity,
        Temperature
    };

    struct Settings {
        std::string sensor_id;
        std::string url_template = "https://www.purpleair.com/json?show={id}";
        std::string cache_dir = "/tmp";
        int cache_seconds = 60;
        int timeout_ms = 5000;
    };

    /// @throws std::invalid_argument if "sensor_id" is missing
    static Settings settings_from_json(const nlohmann::json& args);

    PurpleAirService(StatusNotifier* notifier, Settings settings);

    void start() override;
    std::unique_ptr<Handler> evaluate(const Tokens& tokens) override;

    /// Which reading the words ask for, if any
    static std::optional<Reading> match(const std::vector<std::string>& words);

    /**
     * @brief Current sensor record (first entry of "results"), cached or fetched
     * @return The record (empty object when the sensor reports nothing), or an error
     */
    Result<nlohmann::json> sensor_data();

    /// Spoken sentence for a reading of a sensor record
    static std::string describe(Reading reading, const nlohmann::json& data);

    /// Rough AQI from a PM2.5 value; 0 for non-finite or non-positive input, saturates at INT_MAX
    static int aqi_from_pm25(double pm25);

    /// Word for an AQI value
    static const char* aqi_quality(int aqi);

private:
    std::string url() const;
    std::string cache_path() const;

    Settings settings_;
    HttpClient http_;
};

} // namespace parley
