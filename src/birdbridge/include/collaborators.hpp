#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct WeatherInfo {
    std::optional<double> temperature;
    std::optional<std::string> conditions;
    std::optional<double> wind_speed;
};

// Current conditions for enriching a sighting. Implementations return
// nullopt rather than throwing when nothing is known.
class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;
    virtual std::optional<WeatherInfo> current() = 0;
};

class SightingNotifier {
public:
    virtual ~SightingNotifier() = default;
    virtual bool is_rare_species(const std::string& species) = 0;
    virtual void notify_bird_detected(const std::string& species, double confidence,
                                      bool is_new, bool is_rare) = 0;
};

struct AlertSettings {
    bool on_bird_detected{true};
    bool on_new_species{true};
    bool on_rare_bird{true};
    std::vector<std::string> rare_species;
    std::vector<std::string> ignored_species;
};

// Appends one JSON object per alert to a local file. A single alert is
// written per sighting: new_species wins over rare_bird, which wins over
// bird_detected.
class AlertLog : public SightingNotifier {
public:
    AlertLog(std::string path, AlertSettings settings);

    bool is_rare_species(const std::string& species) override;
    void notify_bird_detected(const std::string& species, double confidence,
                              bool is_new, bool is_rare) override;

    const std::string& path() const { return path_; }

private:
    void append(const std::string& line);

    std::string path_;
    AlertSettings settings_;
    std::mutex mu_;
};

// Reads {"temperature":..,"conditions":..,"windSpeed":..} written by an
// external fetcher.
class FileWeatherProvider : public WeatherProvider {
public:
    explicit FileWeatherProvider(std::string path);
    std::optional<WeatherInfo> current() override;

private:
    std::string path_;
};
