#pragma once
#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "collaborators.hpp"
#include "config.hpp"
#include "utils.hpp"

struct BirdSighting {
    std::string id;
    std::string species;
    std::string scientific_name;
    double confidence{0.0};
    std::string timestamp;              // ISO-8601 UTC
    std::optional<std::string> clip_id;
    std::optional<std::string> snapshot_id;
    std::optional<std::string> preset_id;
    std::optional<WeatherInfo> weather;
    std::optional<std::string> notes;
};

// Everything but the id. An empty timestamp means "now".
struct SightingInput {
    std::string species;
    std::string scientific_name;
    double confidence{0.0};
    std::string timestamp;
    std::optional<std::string> clip_id;
    std::optional<std::string> snapshot_id;
    std::optional<std::string> preset_id;
    std::optional<std::string> notes;
};

struct SpeciesCount {
    std::string species;
    int count{0};
};

struct SpeciesStats {
    std::string species;
    std::string scientific_name;
    int total_sightings{0};
    std::string first_seen;
    std::string last_seen;
    double average_confidence{0.0};
    int peak_hour{0};                   // local hour with most sightings, earliest on ties
    std::array<int, 12> monthly_count{};
};

struct DailyStats {
    std::string date;                   // YYYY-MM-DD
    int total_sightings{0};
    int unique_species{0};
    std::vector<SpeciesCount> species;  // by count, descending
};

struct SearchOptions {
    std::optional<SystemTime> start;
    std::optional<SystemTime> end;
    std::optional<double> min_confidence;
};

struct TrackerLimits {
    std::size_t max_sightings{cfg::MAX_SIGHTINGS};
    std::size_t sightings_per_file{cfg::SIGHTINGS_PER_FILE};
};

struct TrackerSummary {
    int today_sightings{0};
    int today_species{0};
    int total_species{0};
    std::vector<BirdSighting> recent_sightings;
    std::optional<std::string> top_today;
};

struct TrackerExport {
    std::vector<BirdSighting> sightings;
    std::vector<std::string> life_list;
    int total_sightings{0};
    int species_count{0};
    std::vector<SpeciesCount> top_species;
};

void to_json(nlohmann::json& j, const WeatherInfo& w);
void from_json(const nlohmann::json& j, WeatherInfo& w);
void to_json(nlohmann::json& j, const BirdSighting& s);
void from_json(const nlohmann::json& j, BirdSighting& s);
void to_json(nlohmann::json& j, const SpeciesCount& c);
void to_json(nlohmann::json& j, const SpeciesStats& s);
void to_json(nlohmann::json& j, const DailyStats& d);
void to_json(nlohmann::json& j, const TrackerSummary& s);
void to_json(nlohmann::json& j, const TrackerExport& e);

// Durable record of accepted detections.
//
// State lives in <data_dir>/tracker-state.json and is rewritten after every
// sighting. When the active list grows past max_sightings the oldest
// sightings_per_file records move to <data_dir>/archive-YYYY-MM.json, keyed
// by the local month of the first record moved. The life list only grows.
//
// Calendar queries (dates, hours, weekdays, months) use local time.
class SightingTracker {
public:
    explicit SightingTracker(std::string data_dir,
                             WeatherProvider* weather = nullptr,
                             SightingNotifier* notifier = nullptr,
                             TrackerLimits limits = {});

    SightingTracker(const SightingTracker&) = delete;
    SightingTracker& operator=(const SightingTracker&) = delete;

    BirdSighting record_sighting(const SightingInput& input);

    std::vector<std::string> life_list() const;     // sorted
    std::size_t species_count() const;
    std::size_t sighting_count() const;
    std::vector<BirdSighting> recent_sightings(std::size_t limit = 50) const;  // newest first
    std::vector<BirdSighting> sightings_for_date(const std::string& date) const;
    std::vector<BirdSighting> sightings_for_species(const std::string& species) const;
    std::optional<SpeciesStats> species_stats(const std::string& species) const;
    DailyStats daily_stats(const std::string& date) const;
    DailyStats daily_stats() const;                  // today
    std::vector<SpeciesCount> top_species(std::size_t limit = 10) const;
    std::array<std::array<int, 24>, 7> activity_heatmap() const;  // [weekday][hour], Sunday = 0
    std::vector<BirdSighting> search(const std::string& query, const SearchOptions& options = {}) const;

    TrackerSummary summary() const;
    TrackerExport export_data() const;

    std::string state_path() const;
    std::string archive_path(const std::string& year_month) const;
    std::string last_updated() const;

private:
    void load_state();
    bool save_state();
    void archive_old_sightings();
    bool write_archive(const std::string& path, const std::vector<BirdSighting>& moved);

    std::vector<BirdSighting> for_date_locked(const std::string& date) const;
    std::vector<BirdSighting> for_species_locked(const std::string& species) const;
    DailyStats daily_stats_locked(const std::string& date) const;
    std::vector<SpeciesCount> top_species_locked(std::size_t limit) const;

    std::string data_dir_;
    WeatherProvider* weather_;
    SightingNotifier* notifier_;
    TrackerLimits limits_;

    mutable std::mutex m_;
    std::vector<BirdSighting> sightings_;
    std::vector<std::string> life_list_;    // first-seen order
    std::string last_updated_;
};
