/**
 * @file test_sighting_tracker.cpp
 * @brief Tests for sighting persistence, archival and the derived statistics.
 *
 * The test binary runs with TZ=UTC, so local calendar fields match the
 * UTC timestamps used below.
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>
#include "sighting_tracker.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

SightingInput sighting(const std::string& species, double confidence, const std::string& timestamp,
                       const std::string& scientific = "") {
    SightingInput in;
    in.species = species;
    in.scientific_name = scientific.empty() ? species + " sp." : scientific;
    in.confidence = confidence;
    in.timestamp = timestamp;
    return in;
}

json read_json(const std::string& path) {
    return json::parse(read_file(path));
}

class FixedWeather : public WeatherProvider {
public:
    std::optional<WeatherInfo> current() override {
        WeatherInfo w;
        w.temperature = 18.5;
        w.conditions = "Overcast";
        return w;
    }
};

struct Notification {
    std::string species;
    double confidence;
    bool is_new;
    bool is_rare;
};

class RecordingNotifier : public SightingNotifier {
public:
    bool is_rare_species(const std::string& species) override {
        return species == "Snowy Owl";
    }
    void notify_bird_detected(const std::string& species, double confidence,
                              bool is_new, bool is_rare) override {
        calls.push_back({species, confidence, is_new, is_rare});
    }
    std::vector<Notification> calls;
};

class ThrowingNotifier : public SightingNotifier {
public:
    bool is_rare_species(const std::string&) override { throw std::runtime_error("lookup"); }
    void notify_bird_detected(const std::string&, double, bool, bool) override {
        throw std::runtime_error("delivery");
    }
};

}  // namespace

class SightingTrackerTest : public ::testing::Test {
protected:
    std::string dir() const { return tmp_.file("birds"); }

    TempDir tmp_;
};

TEST_F(SightingTrackerTest, StartsEmptyAndCreatesDataDir) {
    SightingTracker tracker(dir());
    EXPECT_TRUE(fs::is_directory(dir()));
    EXPECT_EQ(tracker.sighting_count(), 0u);
    EXPECT_EQ(tracker.species_count(), 0u);
    EXPECT_TRUE(tracker.life_list().empty());
    EXPECT_TRUE(tracker.recent_sightings().empty());
}

TEST_F(SightingTrackerTest, RecordAssignsIdAndTimestamp) {
    SightingTracker tracker(dir());
    auto a = tracker.record_sighting(sighting("Blue Jay", 0.8, ""));
    auto b = tracker.record_sighting(sighting("Blue Jay", 0.8, ""));

    EXPECT_EQ(a.id.rfind("sight_", 0), 0u);
    EXPECT_NE(a.id, b.id);
    EXPECT_TRUE(parse_iso8601(a.timestamp).has_value());
    EXPECT_EQ(a.timestamp.back(), 'Z');
}

// The life list grows by exactly one on a first sighting and never otherwise
TEST_F(SightingTrackerTest, LifeListGrowsOnNewSpeciesOnly) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Northern Cardinal", 0.9, "2024-05-12T08:00:00.000Z"));
    EXPECT_EQ(tracker.species_count(), 1u);
    tracker.record_sighting(sighting("Northern Cardinal", 0.7, "2024-05-12T08:05:00.000Z"));
    EXPECT_EQ(tracker.species_count(), 1u);
    tracker.record_sighting(sighting("American Robin", 0.8, "2024-05-12T08:10:00.000Z"));
    EXPECT_EQ(tracker.species_count(), 2u);

    EXPECT_EQ(tracker.life_list(), (std::vector<std::string>{"American Robin", "Northern Cardinal"}));
    EXPECT_EQ(tracker.sighting_count(), 3u);
}

TEST_F(SightingTrackerTest, SpeciesStats) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:15:00.000Z", "Cyanocitta cristata"));
    tracker.record_sighting(sighting("Blue Jay", 0.6, "2024-05-12T08:40:00.000Z", "Cyanocitta cristata"));
    tracker.record_sighting(sighting("Blue Jay", 0.9, "2024-06-01T17:05:00.000Z", "Cyanocitta cristata"));

    auto stats = tracker.species_stats("blue jay");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->species, "Blue Jay");
    EXPECT_EQ(stats->scientific_name, "Cyanocitta cristata");
    EXPECT_EQ(stats->total_sightings, 3);
    EXPECT_NEAR(stats->average_confidence, 0.7667, 1e-3);
    EXPECT_EQ(stats->first_seen, "2024-05-12T08:15:00.000Z");
    EXPECT_EQ(stats->last_seen, "2024-06-01T17:05:00.000Z");
    EXPECT_EQ(stats->peak_hour, 8);
    EXPECT_EQ(stats->monthly_count[4], 2);
    EXPECT_EQ(stats->monthly_count[5], 1);

    EXPECT_FALSE(tracker.species_stats("Dodo").has_value());
}

TEST_F(SightingTrackerTest, DailyStatsForEmptyDay) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:15:00.000Z"));

    auto stats = tracker.daily_stats("2024-01-01");
    EXPECT_EQ(stats.date, "2024-01-01");
    EXPECT_EQ(stats.total_sightings, 0);
    EXPECT_EQ(stats.unique_species, 0);
    EXPECT_TRUE(stats.species.empty());
}

// Species are ranked by count; equal counts keep first-appearance order
TEST_F(SightingTrackerTest, DailyStatsRanksSpecies) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Mourning Dove", 0.8, "2024-05-12T06:00:00.000Z"));
    tracker.record_sighting(sighting("House Finch", 0.8, "2024-05-12T07:00:00.000Z"));
    tracker.record_sighting(sighting("Tufted Titmouse", 0.8, "2024-05-12T07:30:00.000Z"));
    tracker.record_sighting(sighting("House Finch", 0.8, "2024-05-12T09:00:00.000Z"));
    tracker.record_sighting(sighting("Tufted Titmouse", 0.8, "2024-05-12T10:00:00.000Z"));
    tracker.record_sighting(sighting("House Finch", 0.8, "2024-05-12T11:00:00.000Z"));
    tracker.record_sighting(sighting("Mourning Dove", 0.8, "2024-05-13T06:00:00.000Z"));

    auto stats = tracker.daily_stats("2024-05-12");
    EXPECT_EQ(stats.total_sightings, 6);
    EXPECT_EQ(stats.unique_species, 3);
    ASSERT_EQ(stats.species.size(), 3u);
    EXPECT_EQ(stats.species[0].species, "House Finch");
    EXPECT_EQ(stats.species[0].count, 3);
    EXPECT_EQ(stats.species[1].species, "Tufted Titmouse");
    EXPECT_EQ(stats.species[2].species, "Mourning Dove");

    EXPECT_EQ(tracker.sightings_for_date("2024-05-13").size(), 1u);
}

TEST_F(SightingTrackerTest, TopSpeciesAcrossAllDays) {
    SightingTracker tracker(dir());
    for (int i = 0; i < 3; ++i) tracker.record_sighting(sighting("House Sparrow", 0.8, ""));
    tracker.record_sighting(sighting("Blue Jay", 0.8, ""));
    for (int i = 0; i < 2; ++i) tracker.record_sighting(sighting("European Starling", 0.8, ""));

    auto top = tracker.top_species(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].species, "House Sparrow");
    EXPECT_EQ(top[0].count, 3);
    EXPECT_EQ(top[1].species, "European Starling");
}

TEST_F(SightingTrackerTest, RecentSightingsNewestFirst) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("A", 0.8, "2024-05-12T06:00:00.000Z"));
    tracker.record_sighting(sighting("B", 0.8, "2024-05-12T07:00:00.000Z"));
    tracker.record_sighting(sighting("C", 0.8, "2024-05-12T08:00:00.000Z"));

    auto recent = tracker.recent_sightings(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].species, "C");
    EXPECT_EQ(recent[1].species, "B");
    EXPECT_EQ(tracker.recent_sightings(10).size(), 3u);
}

// 2024-05-12 was a Sunday
TEST_F(SightingTrackerTest, ActivityHeatmap) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:15:00.000Z"));
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:45:00.000Z"));
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-15T19:00:00.000Z"));

    auto map = tracker.activity_heatmap();
    EXPECT_EQ(map[0][8], 2);
    EXPECT_EQ(map[3][19], 1);
    int total = 0;
    for (const auto& row : map) for (int c : row) total += c;
    EXPECT_EQ(total, 3);
}

TEST_F(SightingTrackerTest, SearchMatchesNamesAndFilters) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.9, "2024-05-10T08:00:00.000Z", "Cyanocitta cristata"));
    tracker.record_sighting(sighting("Steller's Jay", 0.6, "2024-05-12T08:00:00.000Z", "Cyanocitta stelleri"));
    tracker.record_sighting(sighting("American Robin", 0.95, "2024-05-12T09:00:00.000Z", "Turdus migratorius"));

    EXPECT_EQ(tracker.search("jay").size(), 2u);
    EXPECT_EQ(tracker.search("CYANOCITTA").size(), 2u);
    EXPECT_EQ(tracker.search("turdus").size(), 1u);
    EXPECT_TRUE(tracker.search("owl").empty());

    SearchOptions confident;
    confident.min_confidence = 0.8;
    auto hits = tracker.search("jay", confident);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].species, "Blue Jay");

    SearchOptions window;
    window.start = parse_iso8601("2024-05-11T00:00:00Z");
    window.end = parse_iso8601("2024-05-12T23:59:59Z");
    hits = tracker.search("jay", window);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].species, "Steller's Jay");
}

TEST_F(SightingTrackerTest, SummaryCoversToday) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2020-01-01T08:00:00.000Z"));
    tracker.record_sighting(sighting("Carolina Wren", 0.8, ""));
    tracker.record_sighting(sighting("Carolina Wren", 0.8, ""));
    tracker.record_sighting(sighting("Downy Woodpecker", 0.8, ""));

    auto s = tracker.summary();
    EXPECT_EQ(s.today_sightings, 3);
    EXPECT_EQ(s.today_species, 2);
    EXPECT_EQ(s.total_species, 3);
    ASSERT_TRUE(s.top_today.has_value());
    EXPECT_EQ(*s.top_today, "Carolina Wren");
    ASSERT_EQ(s.recent_sightings.size(), 4u);
    EXPECT_EQ(s.recent_sightings[0].species, "Downy Woodpecker");

    json j = s;
    EXPECT_EQ(j["todaySightings"], 3);
    EXPECT_EQ(j["topToday"], "Carolina Wren");
}

TEST_F(SightingTrackerTest, SummaryWithoutSightingsToday) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2020-01-01T08:00:00.000Z"));
    auto s = tracker.summary();
    EXPECT_EQ(s.today_sightings, 0);
    EXPECT_FALSE(s.top_today.has_value());
    EXPECT_TRUE(json(s)["topToday"].is_null());
}

TEST_F(SightingTrackerTest, ExportIncludesStats) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:00:00.000Z"));
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T09:00:00.000Z"));
    tracker.record_sighting(sighting("Cedar Waxwing", 0.8, "2024-05-12T10:00:00.000Z"));

    json j = tracker.export_data();
    EXPECT_EQ(j["sightings"].size(), 3u);
    EXPECT_EQ(j["lifeList"].size(), 2u);
    EXPECT_EQ(j["stats"]["totalSightings"], 3);
    EXPECT_EQ(j["stats"]["speciesCount"], 2);
    EXPECT_EQ(j["stats"]["topSpecies"][0]["species"], "Blue Jay");
    EXPECT_EQ(j["stats"]["topSpecies"][0]["count"], 2);
}

// --- persistence ---

// Field names are camelCase and absent optionals are left out
TEST_F(SightingTrackerTest, StateFileLayout) {
    SightingTracker tracker(dir());
    SightingInput in = sighting("Blue Jay", 0.8, "2024-05-12T08:00:00.000Z", "Cyanocitta cristata");
    in.snapshot_id = "snap_1";
    tracker.record_sighting(in);

    json state = read_json(tracker.state_path());
    ASSERT_EQ(state["sightings"].size(), 1u);
    const json& s = state["sightings"][0];
    EXPECT_EQ(s["scientificName"], "Cyanocitta cristata");
    EXPECT_EQ(s["snapshotId"], "snap_1");
    EXPECT_FALSE(s.contains("clipId"));
    EXPECT_FALSE(s.contains("weather"));
    EXPECT_EQ(state["lifeList"], json::array({"Blue Jay"}));
    EXPECT_TRUE(state.contains("lastUpdated"));
    EXPECT_FALSE(fs::exists(tracker.state_path() + ".tmp"));
}

TEST_F(SightingTrackerTest, ReloadRestoresState) {
    {
        SightingTracker tracker(dir());
        tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:00:00.000Z"));
        tracker.record_sighting(sighting("Song Sparrow", 0.75, "2024-05-12T08:30:00.000Z"));
    }
    SightingTracker reloaded(dir());
    EXPECT_EQ(reloaded.sighting_count(), 2u);
    EXPECT_EQ(reloaded.life_list(), (std::vector<std::string>{"Blue Jay", "Song Sparrow"}));
    EXPECT_EQ(reloaded.recent_sightings(1)[0].species, "Song Sparrow");
    EXPECT_FALSE(reloaded.last_updated().empty());
}

// Writers on several threads lose nothing, in memory or on disk
TEST_F(SightingTrackerTest, ConcurrentRecordsAreAllKept) {
    const int kThreads = 8;
    const int kEach = 25;
    {
        SightingTracker tracker(dir());
        std::vector<std::thread> writers;
        for (int t = 0; t < kThreads; ++t) {
            writers.emplace_back([&tracker, t] {
                std::string species = "Species " + std::to_string(t);
                for (int i = 0; i < kEach; ++i) {
                    tracker.record_sighting(sighting(species, 0.8, "2024-05-12T08:00:00.000Z"));
                }
            });
        }
        for (auto& w : writers) w.join();

        EXPECT_EQ(tracker.sighting_count(), static_cast<size_t>(kThreads * kEach));
        EXPECT_EQ(tracker.species_count(), static_cast<size_t>(kThreads));
    }

    SightingTracker reloaded(dir());
    auto all = reloaded.recent_sightings(kThreads * kEach);
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kEach));
    std::set<std::string> ids;
    for (const auto& s : all) ids.insert(s.id);
    EXPECT_EQ(ids.size(), all.size());
    EXPECT_EQ(reloaded.species_count(), static_cast<size_t>(kThreads));
    EXPECT_EQ(reloaded.daily_stats("2024-05-12").total_sightings, kThreads * kEach);
}

TEST_F(SightingTrackerTest, CorruptStateStartsEmpty) {
    ASSERT_TRUE(ensure_dir(dir()));
    write_file(dir() + "/tracker-state.json", "{\"sightings\": [ {\"species\": ");

    SightingTracker tracker(dir());
    EXPECT_EQ(tracker.sighting_count(), 0u);
    EXPECT_EQ(tracker.species_count(), 0u);

    tracker.record_sighting(sighting("Blue Jay", 0.8, ""));
    EXPECT_EQ(read_json(tracker.state_path())["sightings"].size(), 1u);
}

// Records missing required fields are dropped; species seen only in the
// active list are put back on the life list
TEST_F(SightingTrackerTest, LoadSkipsMalformedRecords) {
    ASSERT_TRUE(ensure_dir(dir()));
    json state = {
        {"sightings", json::array({
            {{"id", "s1"}, {"species", "Blue Jay"}, {"confidence", 0.8}, {"timestamp", "2024-05-12T08:00:00.000Z"}},
            {{"id", "s2"}, {"confidence", 0.8}},
            {{"id", "s3"}, {"species", "Gray Catbird"}, {"confidence", 0.7}, {"timestamp", "2024-05-12T09:00:00.000Z"}},
        })},
        {"lifeList", json::array({"Blue Jay", "Barred Owl"})},
    };
    write_file(dir() + "/tracker-state.json", state.dump());

    SightingTracker tracker(dir());
    EXPECT_EQ(tracker.sighting_count(), 2u);
    EXPECT_EQ(tracker.life_list(), (std::vector<std::string>{"Barred Owl", "Blue Jay", "Gray Catbird"}));
}

// A failed save is logged, not thrown; memory keeps the sighting and the
// previous file is untouched
TEST_F(SightingTrackerTest, SaveFailureKeepsMemoryState) {
    SightingTracker tracker(dir());
    tracker.record_sighting(sighting("Blue Jay", 0.8, "2024-05-12T08:00:00.000Z"));
    std::string before = read_file(tracker.state_path());

    fs::create_directory(tracker.state_path() + ".tmp");
    ASSERT_NO_THROW(tracker.record_sighting(sighting("Wood Thrush", 0.8, "2024-05-12T09:00:00.000Z")));

    EXPECT_EQ(tracker.sighting_count(), 2u);
    EXPECT_EQ(tracker.species_count(), 2u);
    EXPECT_EQ(read_file(tracker.state_path()), before);
}

// --- archival ---

TEST_F(SightingTrackerTest, ArchivesOldestWhenOverLimit) {
    SightingTracker tracker(dir(), nullptr, nullptr, TrackerLimits{5, 2});
    const char* stamps[] = {
        "2024-03-30T10:00:00.000Z", "2024-03-31T10:00:00.000Z", "2024-04-01T10:00:00.000Z",
        "2024-04-02T10:00:00.000Z", "2024-04-03T10:00:00.000Z", "2024-04-04T10:00:00.000Z",
    };
    const char* names[] = {"Killdeer", "Killdeer", "Osprey", "Osprey", "Mallard", "Mallard"};
    for (int i = 0; i < 5; ++i) tracker.record_sighting(sighting(names[i], 0.8, stamps[i]));
    EXPECT_EQ(tracker.sighting_count(), 5u);
    EXPECT_FALSE(fs::exists(tracker.archive_path("2024-03")));

    tracker.record_sighting(sighting(names[5], 0.8, stamps[5]));
    EXPECT_EQ(tracker.sighting_count(), 4u);

    json archive = read_json(tracker.archive_path("2024-03"));
    ASSERT_EQ(archive["sightings"].size(), 2u);
    EXPECT_EQ(archive["sightings"][0]["timestamp"], stamps[0]);
    EXPECT_EQ(archive["sightings"][1]["timestamp"], stamps[1]);

    // Archived species stay on the life list
    EXPECT_EQ(tracker.life_list(), (std::vector<std::string>{"Killdeer", "Mallard", "Osprey"}));
    EXPECT_TRUE(tracker.sightings_for_species("Killdeer").empty());

    // The next batch starts in April and gets its own file
    tracker.record_sighting(sighting("Mallard", 0.8, "2024-04-05T10:00:00.000Z"));
    tracker.record_sighting(sighting("Mallard", 0.8, "2024-04-06T10:00:00.000Z"));
    EXPECT_EQ(tracker.sighting_count(), 4u);
    json april = read_json(tracker.archive_path("2024-04"));
    EXPECT_EQ(april["sightings"].size(), 2u);

    std::set<std::string> ids;
    for (const auto& s : archive["sightings"]) ids.insert(s["id"].get<std::string>());
    for (const auto& s : april["sightings"]) ids.insert(s["id"].get<std::string>());
    for (const auto& s : tracker.recent_sightings()) ids.insert(s.id);
    EXPECT_EQ(ids.size(), 8u);
}

TEST_F(SightingTrackerTest, ArchiveMergesWithExistingFile) {
    ASSERT_TRUE(ensure_dir(dir()));
    json existing = json::array({
        {{"id", "old"}, {"species", "Killdeer"}, {"confidence", 0.8}, {"timestamp", "2024-03-01T10:00:00.000Z"}},
    });
    write_file(dir() + "/archive-2024-03.json", existing.dump());

    SightingTracker tracker(dir(), nullptr, nullptr, TrackerLimits{2, 1});
    for (int d = 10; d < 13; ++d) {
        tracker.record_sighting(sighting("Killdeer", 0.8, "2024-03-" + std::to_string(d) + "T10:00:00.000Z"));
    }

    json archive = read_json(tracker.archive_path("2024-03"));
    ASSERT_TRUE(archive.is_object());
    ASSERT_EQ(archive["sightings"].size(), 2u);
    EXPECT_EQ(archive["sightings"][0]["id"], "old");
    EXPECT_EQ(archive["sightings"][1]["timestamp"], "2024-03-10T10:00:00.000Z");
}

// An unreadable archive is moved aside rather than overwritten
TEST_F(SightingTrackerTest, CorruptArchiveIsSetAside) {
    ASSERT_TRUE(ensure_dir(dir()));
    write_file(dir() + "/archive-2024-03.json", "not json at all");

    SightingTracker tracker(dir(), nullptr, nullptr, TrackerLimits{2, 1});
    for (int d = 10; d < 13; ++d) {
        tracker.record_sighting(sighting("Killdeer", 0.8, "2024-03-" + std::to_string(d) + "T10:00:00.000Z"));
    }

    json archive = read_json(tracker.archive_path("2024-03"));
    EXPECT_EQ(archive["sightings"].size(), 1u);

    bool found_aside = false;
    for (const auto& e : fs::directory_iterator(dir())) {
        if (e.path().filename().string().rfind("archive-2024-03.json.corrupt-", 0) == 0) {
            found_aside = true;
            EXPECT_EQ(read_file(e.path().string()), "not json at all");
        }
    }
    EXPECT_TRUE(found_aside);
}

// If the archive cannot be written the records stay in the active list
TEST_F(SightingTrackerTest, ArchiveFailureKeepsSightingsActive) {
    SightingTracker tracker(dir(), nullptr, nullptr, TrackerLimits{2, 1});
    fs::create_directories(tracker.archive_path("2024-03") + ".tmp");

    for (int d = 10; d < 13; ++d) {
        tracker.record_sighting(sighting("Killdeer", 0.8, "2024-03-" + std::to_string(d) + "T10:00:00.000Z"));
    }
    EXPECT_EQ(tracker.sighting_count(), 3u);
    EXPECT_FALSE(fs::exists(tracker.archive_path("2024-03")));
}

// --- collaborators ---

TEST_F(SightingTrackerTest, AttachesWeather) {
    FixedWeather weather;
    SightingTracker tracker(dir(), &weather);
    auto s = tracker.record_sighting(sighting("Blue Jay", 0.8, ""));
    ASSERT_TRUE(s.weather.has_value());
    EXPECT_DOUBLE_EQ(*s.weather->temperature, 18.5);
    EXPECT_FALSE(s.weather->wind_speed.has_value());

    json stored = read_json(tracker.state_path())["sightings"][0]["weather"];
    EXPECT_EQ(stored["conditions"], "Overcast");
    EXPECT_FALSE(stored.contains("windSpeed"));
}

TEST_F(SightingTrackerTest, NotifiesWithNewAndRareFlags) {
    RecordingNotifier notifier;
    SightingTracker tracker(dir(), nullptr, &notifier);
    tracker.record_sighting(sighting("Snowy Owl", 0.85, ""));
    tracker.record_sighting(sighting("Snowy Owl", 0.9, ""));
    tracker.record_sighting(sighting("Blue Jay", 0.8, ""));

    ASSERT_EQ(notifier.calls.size(), 3u);
    EXPECT_TRUE(notifier.calls[0].is_new);
    EXPECT_TRUE(notifier.calls[0].is_rare);
    EXPECT_DOUBLE_EQ(notifier.calls[0].confidence, 0.85);
    EXPECT_FALSE(notifier.calls[1].is_new);
    EXPECT_TRUE(notifier.calls[1].is_rare);
    EXPECT_TRUE(notifier.calls[2].is_new);
    EXPECT_FALSE(notifier.calls[2].is_rare);
}

// Notification trouble never loses the sighting
TEST_F(SightingTrackerTest, NotifierFailureIsContained) {
    ThrowingNotifier notifier;
    SightingTracker tracker(dir(), nullptr, &notifier);
    ASSERT_NO_THROW(tracker.record_sighting(sighting("Blue Jay", 0.8, "")));
    EXPECT_EQ(tracker.sighting_count(), 1u);
    EXPECT_EQ(read_json(tracker.state_path())["sightings"].size(), 1u);
}
