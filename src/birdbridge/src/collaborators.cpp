#include "collaborators.hpp"
#include "utils.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static bool contains_ci(const std::vector<std::string>& list, const std::string& species) {
    std::string s = to_lower(species);
    for (const auto& item : list) {
        if (to_lower(item) == s) return true;
    }
    return false;
}

AlertLog::AlertLog(std::string path, AlertSettings settings)
    : path_(std::move(path)), settings_(std::move(settings)) {}

bool AlertLog::is_rare_species(const std::string& species) {
    return contains_ci(settings_.rare_species, species);
}

void AlertLog::notify_bird_detected(const std::string& species, double confidence,
                                    bool is_new, bool is_rare) {
    if (contains_ci(settings_.ignored_species, species)) return;

    int pct = static_cast<int>(std::lround(confidence * 100.0));
    json alert;
    if (is_new && settings_.on_new_species) {
        alert["type"] = "new_species";
        alert["message"] = "First sighting of " + species + "! (" + std::to_string(pct) + "% confidence)";
        alert["priority"] = "high";
    } else if (is_rare && settings_.on_rare_bird) {
        alert["type"] = "rare_bird";
        alert["message"] = species + " spotted! (" + std::to_string(pct) + "% confidence)";
        alert["priority"] = "high";
    } else if (settings_.on_bird_detected) {
        alert["type"] = "bird_detected";
        alert["message"] = species + " (" + std::to_string(pct) + "% confidence)";
        alert["priority"] = "normal";
    } else {
        return;
    }
    alert["timestamp"] = to_iso8601(std::chrono::system_clock::now());
    alert["species"] = species;
    alert["confidence"] = confidence;
    alert["isNew"] = is_new;
    alert["isRare"] = is_rare;

    try {
        append(alert.dump() + "\n");
    } catch (const json::exception& e) {
        fprintf(stderr, "[Alerts] Cannot encode alert: %s\n", e.what());
    }
}

void AlertLog::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::ofstream f(path_, std::ios::app);
    if (!f) {
        fprintf(stderr, "[Alerts] Unable to open alerts file: %s\n", path_.c_str());
        return;
    }
    f << line;
}

FileWeatherProvider::FileWeatherProvider(std::string path) : path_(std::move(path)) {}

std::optional<WeatherInfo> FileWeatherProvider::current() {
    std::ifstream in(path_);
    if (!in) return std::nullopt;

    try {
        json j = json::parse(in);
        if (!j.is_object()) return std::nullopt;

        WeatherInfo w;
        if (j.contains("temperature") && j["temperature"].is_number())
            w.temperature = j["temperature"].get<double>();
        if (j.contains("conditions") && j["conditions"].is_string())
            w.conditions = j["conditions"].get<std::string>();
        if (j.contains("windSpeed") && j["windSpeed"].is_number())
            w.wind_speed = j["windSpeed"].get<double>();

        if (!w.temperature && !w.conditions && !w.wind_speed) return std::nullopt;
        return w;
    } catch (const json::exception& e) {
        fprintf(stderr, "[Weather] Cannot read %s: %s\n", path_.c_str(), e.what());
        return std::nullopt;
    }
}
