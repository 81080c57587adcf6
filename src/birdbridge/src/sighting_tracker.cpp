#include "sighting_tracker.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace fs = std::filesystem;
using json = nlohmann::json;

// --- JSON mapping ---

static void put_optional(json& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

static std::optional<std::string> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

void to_json(json& j, const WeatherInfo& w) {
    j = json::object();
    if (w.temperature) j["temperature"] = *w.temperature;
    if (w.conditions) j["conditions"] = *w.conditions;
    if (w.wind_speed) j["windSpeed"] = *w.wind_speed;
}

void from_json(const json& j, WeatherInfo& w) {
    if (j.contains("temperature") && j["temperature"].is_number()) w.temperature = j["temperature"].get<double>();
    w.conditions = get_optional(j, "conditions");
    if (j.contains("windSpeed") && j["windSpeed"].is_number()) w.wind_speed = j["windSpeed"].get<double>();
}

void to_json(json& j, const BirdSighting& s) {
    j = json{{"id", s.id},
             {"species", s.species},
             {"scientificName", s.scientific_name},
             {"confidence", s.confidence},
             {"timestamp", s.timestamp}};
    put_optional(j, "clipId", s.clip_id);
    put_optional(j, "snapshotId", s.snapshot_id);
    put_optional(j, "presetId", s.preset_id);
    if (s.weather) j["weather"] = *s.weather;
    put_optional(j, "notes", s.notes);
}

void from_json(const json& j, BirdSighting& s) {
    s.id = j.value("id", std::string());
    s.species = j.at("species").get<std::string>();
    s.scientific_name = j.value("scientificName", std::string());
    s.confidence = j.value("confidence", 0.0);
    s.timestamp = j.at("timestamp").get<std::string>();
    s.clip_id = get_optional(j, "clipId");
    s.snapshot_id = get_optional(j, "snapshotId");
    s.preset_id = get_optional(j, "presetId");
    if (j.contains("weather") && j["weather"].is_object()) s.weather = j["weather"].get<WeatherInfo>();
    s.notes = get_optional(j, "notes");
}

void to_json(json& j, const SpeciesCount& c) {
    j = json{{"species", c.species}, {"count", c.count}};
}

void to_json(json& j, const SpeciesStats& s) {
    j = json{{"species", s.species},
             {"scientificName", s.scientific_name},
             {"totalSightings", s.total_sightings},
             {"firstSeen", s.first_seen},
             {"lastSeen", s.last_seen},
             {"averageConfidence", s.average_confidence},
             {"peakHour", s.peak_hour},
             {"monthlyCount", s.monthly_count}};
}

void to_json(json& j, const DailyStats& d) {
    j = json{{"date", d.date},
             {"totalSightings", d.total_sightings},
             {"uniqueSpecies", d.unique_species},
             {"species", d.species}};
}

void to_json(json& j, const TrackerSummary& s) {
    j = json{{"todaySightings", s.today_sightings},
             {"todaySpecies", s.today_species},
             {"totalSpecies", s.total_species},
             {"recentSightings", s.recent_sightings}};
    if (s.top_today) j["topToday"] = *s.top_today;
    else j["topToday"] = nullptr;
}

void to_json(json& j, const TrackerExport& e) {
    j = json{{"sightings", e.sightings},
             {"lifeList", e.life_list},
             {"stats", {{"totalSightings", e.total_sightings},
                        {"speciesCount", e.species_count},
                        {"topSpecies", e.top_species}}}};
}

// --- helpers ---

static std::optional<std::tm> sighting_tm(const BirdSighting& s) {
    auto t = parse_iso8601(s.timestamp);
    if (!t) return std::nullopt;
    return local_tm(*t);
}

static std::string sighting_date(const BirdSighting& s) {
    auto t = parse_iso8601(s.timestamp);
    if (!t) return s.timestamp.substr(0, 10);
    return local_date(*t);
}

static std::string sighting_month(const BirdSighting& s) {
    auto tm = sighting_tm(s);
    if (!tm) tm = local_tm(std::chrono::system_clock::now());
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d", tm->tm_year + 1900, tm->tm_mon + 1);
    return buf;
}

// Counts by species, highest first; equal counts keep first-appearance order.
template <typename It>
static std::vector<SpeciesCount> rank_species(It begin, It end) {
    std::vector<SpeciesCount> ranked;
    std::unordered_map<std::string, std::size_t> index;
    for (It it = begin; it != end; ++it) {
        auto found = index.find(it->species);
        if (found == index.end()) {
            index.emplace(it->species, ranked.size());
            ranked.push_back({it->species, 1});
        } else {
            ranked[found->second].count++;
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const SpeciesCount& a, const SpeciesCount& b) { return a.count > b.count; });
    return ranked;
}

// Writes to a sibling temp file and renames it over `path`, so a failed
// write leaves the previous file intact.
static bool write_json_atomic(const std::string& path, const json& doc) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            fprintf(stderr, "[Tracker] Cannot open %s for writing\n", tmp.c_str());
            return false;
        }
        out << doc.dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out) {
            fprintf(stderr, "[Tracker] Write to %s failed\n", tmp.c_str());
            std::error_code ec;
            fs::remove(tmp, ec);
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fprintf(stderr, "[Tracker] Cannot replace %s: %s\n", path.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

// --- SightingTracker ---

SightingTracker::SightingTracker(std::string data_dir, WeatherProvider* weather,
                                 SightingNotifier* notifier, TrackerLimits limits)
    : data_dir_(std::move(data_dir)), weather_(weather), notifier_(notifier), limits_(limits) {
    if (!ensure_dir(data_dir_)) {
        fprintf(stderr, "[Tracker] Cannot create data dir %s\n", data_dir_.c_str());
    }
    load_state();
}

std::string SightingTracker::state_path() const {
    return (fs::path(data_dir_) / cfg::STATE_FILE).string();
}

std::string SightingTracker::archive_path(const std::string& year_month) const {
    return (fs::path(data_dir_) / ("archive-" + year_month + ".json")).string();
}

std::string SightingTracker::last_updated() const {
    std::lock_guard<std::mutex> lk(m_);
    return last_updated_;
}

void SightingTracker::load_state() {
    sightings_.clear();
    life_list_.clear();
    last_updated_ = to_iso8601(std::chrono::system_clock::now());

    std::ifstream in(state_path());
    if (!in) return;

    try {
        json j = json::parse(in);
        int skipped = 0;
        for (const auto& item : j.at("sightings")) {
            try {
                sightings_.push_back(item.get<BirdSighting>());
            } catch (const json::exception&) {
                skipped++;
            }
        }
        if (j.contains("lifeList")) {
            for (const auto& name : j["lifeList"]) {
                if (name.is_string()) life_list_.push_back(name.get<std::string>());
            }
        }
        last_updated_ = j.value("lastUpdated", last_updated_);
        if (skipped > 0) {
            fprintf(stderr, "[Tracker] Skipped %d malformed sightings\n", skipped);
        }
    } catch (const json::exception& e) {
        fprintf(stderr, "[Tracker] Failed to load state: %s\n", e.what());
        sightings_.clear();
        life_list_.clear();
        return;
    }

    // Every active species belongs on the life list.
    for (const auto& s : sightings_) {
        if (std::find(life_list_.begin(), life_list_.end(), s.species) == life_list_.end()) {
            life_list_.push_back(s.species);
        }
    }
    printf("[Tracker] Loaded %zu sightings, %zu species\n", sightings_.size(), life_list_.size());
}

bool SightingTracker::save_state() {
    last_updated_ = to_iso8601(std::chrono::system_clock::now());
    json doc;
    doc["sightings"] = sightings_;
    doc["lifeList"] = life_list_;
    doc["lastUpdated"] = last_updated_;
    if (!write_json_atomic(state_path(), doc)) {
        fprintf(stderr, "[Tracker] Failed to save state\n");
        return false;
    }
    return true;
}

bool SightingTracker::write_archive(const std::string& path, const std::vector<BirdSighting>& moved) {
    std::vector<BirdSighting> merged;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        try {
            json existing = json::parse(in);
            const json& arr = existing.is_array() ? existing : existing.at("sightings");
            for (const auto& item : arr) merged.push_back(item.get<BirdSighting>());
        } catch (const json::exception& e) {
            // Keep the unreadable archive aside instead of overwriting it.
            std::string aside = path + ".corrupt-" + now_timestamp_filename();
            fprintf(stderr, "[Tracker] Archive %s unreadable (%s), moving to %s\n",
                    path.c_str(), e.what(), aside.c_str());
            fs::rename(path, aside, ec);
            if (ec) return false;
            merged.clear();
        }
    }

    merged.insert(merged.end(), moved.begin(), moved.end());
    json doc;
    doc["sightings"] = merged;
    return write_json_atomic(path, doc);
}

void SightingTracker::archive_old_sightings() {
    while (sightings_.size() > limits_.max_sightings) {
        std::size_t n = std::min(limits_.sightings_per_file, sightings_.size());
        if (n == 0) break;

        std::vector<BirdSighting> moved(sightings_.begin(), sightings_.begin() + n);
        std::string path = archive_path(sighting_month(moved.front()));
        if (!write_archive(path, moved)) {
            fprintf(stderr, "[Tracker] Archiving to %s failed, keeping sightings active\n", path.c_str());
            break;
        }
        sightings_.erase(sightings_.begin(), sightings_.begin() + n);
        printf("[Tracker] Archived %zu sightings to %s\n", n, path.c_str());
    }
}

BirdSighting SightingTracker::record_sighting(const SightingInput& input) {
    std::optional<WeatherInfo> weather;
    if (weather_) {
        try {
            weather = weather_->current();
        } catch (const std::exception& e) {
            fprintf(stderr, "[Tracker] Weather unavailable: %s\n", e.what());
        }
    }

    bool is_rare = false;
    if (notifier_) {
        try {
            is_rare = notifier_->is_rare_species(input.species);
        } catch (const std::exception& e) {
            fprintf(stderr, "[Tracker] Rare check failed: %s\n", e.what());
        }
    }

    BirdSighting record;
    bool is_new = false;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

        record.id = "sight_" + std::to_string(ms) + "_" + random_token(6);
        record.species = input.species;
        record.scientific_name = input.scientific_name;
        record.confidence = input.confidence;
        record.timestamp = input.timestamp.empty() ? to_iso8601(now) : input.timestamp;
        record.clip_id = input.clip_id;
        record.snapshot_id = input.snapshot_id;
        record.preset_id = input.preset_id;
        record.weather = weather;
        record.notes = input.notes;

        sightings_.push_back(record);

        is_new = std::find(life_list_.begin(), life_list_.end(), record.species) == life_list_.end();
        if (is_new) {
            life_list_.push_back(record.species);
            printf("[Tracker] New species added to life list: %s\n", record.species.c_str());
        }

        archive_old_sightings();
        save_state();
    }

    if (notifier_) {
        try {
            notifier_->notify_bird_detected(record.species, record.confidence, is_new, is_rare);
        } catch (const std::exception& e) {
            fprintf(stderr, "[Tracker] Notification failed: %s\n", e.what());
        }
    }
    return record;
}

std::vector<std::string> SightingTracker::life_list() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::string> out = life_list_;
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t SightingTracker::species_count() const {
    std::lock_guard<std::mutex> lk(m_);
    return life_list_.size();
}

std::size_t SightingTracker::sighting_count() const {
    std::lock_guard<std::mutex> lk(m_);
    return sightings_.size();
}

std::vector<BirdSighting> SightingTracker::recent_sightings(std::size_t limit) const {
    std::lock_guard<std::mutex> lk(m_);
    std::size_t n = std::min(limit, sightings_.size());
    return std::vector<BirdSighting>(sightings_.rbegin(), sightings_.rbegin() + n);
}

std::vector<BirdSighting> SightingTracker::for_date_locked(const std::string& date) const {
    std::vector<BirdSighting> out;
    for (const auto& s : sightings_) {
        if (sighting_date(s) == date) out.push_back(s);
    }
    return out;
}

std::vector<BirdSighting> SightingTracker::sightings_for_date(const std::string& date) const {
    std::lock_guard<std::mutex> lk(m_);
    return for_date_locked(date);
}

std::vector<BirdSighting> SightingTracker::for_species_locked(const std::string& species) const {
    std::string wanted = to_lower(species);
    std::vector<BirdSighting> out;
    for (const auto& s : sightings_) {
        if (to_lower(s.species) == wanted) out.push_back(s);
    }
    return out;
}

std::vector<BirdSighting> SightingTracker::sightings_for_species(const std::string& species) const {
    std::lock_guard<std::mutex> lk(m_);
    return for_species_locked(species);
}

std::optional<SpeciesStats> SightingTracker::species_stats(const std::string& species) const {
    std::lock_guard<std::mutex> lk(m_);
    auto list = for_species_locked(species);
    if (list.empty()) return std::nullopt;

    std::array<int, 24> hours{};
    SpeciesStats stats;
    double total_confidence = 0.0;
    for (const auto& s : list) {
        if (auto tm = sighting_tm(s)) {
            hours[tm->tm_hour]++;
            stats.monthly_count[tm->tm_mon]++;
        }
        total_confidence += s.confidence;
    }

    stats.species = list.front().species;
    stats.scientific_name = list.front().scientific_name;
    stats.total_sightings = static_cast<int>(list.size());
    stats.first_seen = list.front().timestamp;
    stats.last_seen = list.back().timestamp;
    stats.average_confidence = total_confidence / list.size();
    stats.peak_hour = static_cast<int>(std::max_element(hours.begin(), hours.end()) - hours.begin());
    return stats;
}

DailyStats SightingTracker::daily_stats_locked(const std::string& date) const {
    auto list = for_date_locked(date);
    DailyStats stats;
    stats.date = date;
    stats.total_sightings = static_cast<int>(list.size());
    stats.species = rank_species(list.begin(), list.end());
    stats.unique_species = static_cast<int>(stats.species.size());
    return stats;
}

DailyStats SightingTracker::daily_stats(const std::string& date) const {
    std::lock_guard<std::mutex> lk(m_);
    return daily_stats_locked(date);
}

DailyStats SightingTracker::daily_stats() const {
    return daily_stats(local_date(std::chrono::system_clock::now()));
}

std::vector<SpeciesCount> SightingTracker::top_species_locked(std::size_t limit) const {
    auto ranked = rank_species(sightings_.begin(), sightings_.end());
    if (ranked.size() > limit) ranked.resize(limit);
    return ranked;
}

std::vector<SpeciesCount> SightingTracker::top_species(std::size_t limit) const {
    std::lock_guard<std::mutex> lk(m_);
    return top_species_locked(limit);
}

std::array<std::array<int, 24>, 7> SightingTracker::activity_heatmap() const {
    std::lock_guard<std::mutex> lk(m_);
    std::array<std::array<int, 24>, 7> map{};
    for (const auto& s : sightings_) {
        if (auto tm = sighting_tm(s)) map[tm->tm_wday][tm->tm_hour]++;
    }
    return map;
}

std::vector<BirdSighting> SightingTracker::search(const std::string& query, const SearchOptions& options) const {
    std::lock_guard<std::mutex> lk(m_);
    std::string q = to_lower(query);
    std::vector<BirdSighting> out;
    for (const auto& s : sightings_) {
        if (to_lower(s.species).find(q) == std::string::npos &&
            to_lower(s.scientific_name).find(q) == std::string::npos) {
            continue;
        }
        if (options.start || options.end) {
            auto t = parse_iso8601(s.timestamp);
            if (!t) continue;
            if (options.start && *t < *options.start) continue;
            if (options.end && *t > *options.end) continue;
        }
        if (options.min_confidence && s.confidence < *options.min_confidence) continue;
        out.push_back(s);
    }
    return out;
}

TrackerSummary SightingTracker::summary() const {
    std::lock_guard<std::mutex> lk(m_);
    DailyStats today = daily_stats_locked(local_date(std::chrono::system_clock::now()));

    TrackerSummary s;
    s.today_sightings = today.total_sightings;
    s.today_species = today.unique_species;
    s.total_species = static_cast<int>(life_list_.size());
    std::size_t n = std::min<std::size_t>(5, sightings_.size());
    s.recent_sightings.assign(sightings_.rbegin(), sightings_.rbegin() + n);
    if (!today.species.empty()) s.top_today = today.species.front().species;
    return s;
}

TrackerExport SightingTracker::export_data() const {
    std::lock_guard<std::mutex> lk(m_);
    TrackerExport e;
    e.sightings = sightings_;
    e.life_list = life_list_;
    e.total_sightings = static_cast<int>(sightings_.size());
    e.species_count = static_cast<int>(life_list_.size());
    e.top_species = top_species_locked(10);
    return e;
}
