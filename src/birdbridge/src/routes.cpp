#include "routes.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <signal.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Ignore SIGPIPE globally to avoid crashes when client disconnects
struct SigPipeIgnore {
    SigPipeIgnore() { signal(SIGPIPE, SIG_IGN); }
} _sigpipe_ignore;

// --- helpers ---
static void reply(HttpResponse& res, const json& body, int status = 200) {
    res.status = status;
    res.headers["Content-Type"] = "application/json";
    res.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
}

static void reply_error(HttpResponse& res, int status, const std::string& msg) {
    reply(res, json{{"error", msg}}, status);
}

// Positive integer query parameter, `def` when absent or unparsable.
static int int_param(const HttpRequest& req, const std::string& name, int def) {
    std::string v = req.param(name);
    if (v.empty()) return def;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (end == v.c_str() || n <= 0) return def;
    return static_cast<int>(n);
}

static bool is_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

// Accepts a full timestamp or a bare date (start or end of that UTC day).
static std::optional<SystemTime> time_param(const std::string& v, bool end_of_day) {
    if (is_date(v)) return parse_iso8601(v + (end_of_day ? "T23:59:59.999Z" : "T00:00:00Z"));
    return parse_iso8601(v);
}

static json region_json(const Region& r) {
    return json{{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

static json motion_config_json(const MotionConfig& c) {
    json regions = json::array();
    for (const auto& r : c.regions) regions.push_back(region_json(r));
    return json{{"enabled", c.enabled},
                {"sensitivity", c.sensitivity},
                {"threshold", c.threshold},
                {"cooldownMs", c.cooldown_ms},
                {"minDurationMs", c.min_duration_ms},
                {"debug", c.debug},
                {"regions", regions}};
}

// Fields present in the `patch` object replace those in `c`. Throws
// json::exception on wrongly typed fields.
static MotionConfig merge_motion_config(MotionConfig c, const json& patch) {
    if (patch.contains("enabled")) c.enabled = patch["enabled"].get<bool>();
    if (patch.contains("sensitivity")) c.sensitivity = patch["sensitivity"].get<double>();
    if (patch.contains("threshold")) c.threshold = patch["threshold"].get<double>();
    if (patch.contains("cooldownMs")) c.cooldown_ms = patch["cooldownMs"].get<int>();
    if (patch.contains("minDurationMs")) c.min_duration_ms = patch["minDurationMs"].get<int>();
    if (patch.contains("debug")) c.debug = patch["debug"].get<bool>();
    if (patch.contains("regions")) {
        c.regions.clear();
        for (const auto& r : patch["regions"]) {
            Region reg;
            reg.x = r.value("x", reg.x);
            reg.y = r.value("y", reg.y);
            reg.width = r.value("width", reg.width);
            reg.height = r.value("height", reg.height);
            c.regions.push_back(reg);
        }
    }
    return c;
}

static json detection_json(const BirdDetection& d) {
    return json{{"species", d.species},
                {"scientificName", d.scientific_name},
                {"confidence", d.confidence},
                {"startTime", d.start_time},
                {"endTime", d.end_time},
                {"timestamp", to_iso8601(d.timestamp)}};
}

static json detector_options_json(const DetectorOptions& o) {
    json j{{"minConfidence", o.min_confidence},
           {"analysisInterval", o.analysis_interval_s},
           {"sampleDuration", o.sample_duration_s},
           {"locale", o.locale}};
    if (o.latitude && o.longitude) {
        j["latitude"] = *o.latitude;
        j["longitude"] = *o.longitude;
    }
    return j;
}

// Wraps a handler with the API key check.
static RouteHandler protect(Auth& auth, RouteHandler h) {
    return [&auth, h](const HttpRequest& req, HttpResponse& res) {
        if (!auth.check_request(req)) {
            reply_error(res, 401, "Unauthorized");
            return;
        }
        h(req, res);
    };
}

// --- register routes ---
void register_routes(HttpServer& srv, Auth& auth, BridgeContext& ctx) {
    srv.add_route("GET","/health",[&](const HttpRequest&, HttpResponse& res){
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - ctx.started).count();
        reply(res, json{{"status", "ok"},
                        {"timestamp", to_iso8601(std::chrono::system_clock::now())},
                        {"uptime", uptime},
                        {"motionDetection", ctx.motion.running()},
                        {"birdDetection", ctx.detector.running()}});
    });

    // --- motion ---
    srv.add_route("GET","/api/motion/config",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, motion_config_json(ctx.motion.config()));
    }));

    srv.add_route("POST","/api/motion/config",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        MotionConfig updated;
        try {
            json patch = json::parse(req.body);
            if (!patch.is_object()) {
                reply_error(res, 400, "Invalid motion config: expected an object");
                return;
            }
            updated = merge_motion_config(ctx.motion.config(), patch);
        } catch (const json::exception& e) {
            reply_error(res, 400, std::string("Invalid motion config: ") + e.what());
            return;
        }
        ctx.motion.configure(updated);
        reply(res, json{{"success", true}, {"config", motion_config_json(ctx.motion.config())}});
    }));

    srv.add_route("GET","/api/motion/status",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, json{{"running", ctx.motion.running()},
                        {"phase", motion_phase_name(ctx.motion.phase())},
                        {"eventsEmitted", ctx.motion.events_emitted()},
                        {"config", motion_config_json(ctx.motion.config())}});
    }));

    // --- detector ---
    srv.add_route("GET","/api/detector/status",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, json{{"running", ctx.detector.running()},
                        {"lastInvocation", invocation_name(ctx.detector.last_invocation())},
                        {"cyclesCompleted", ctx.detector.cycles_completed()},
                        {"cyclesFailed", ctx.detector.cycles_failed()},
                        {"options", detector_options_json(ctx.detector.options())}});
    }));

    srv.add_route("POST","/api/detector/analyze",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        std::vector<BirdDetection> detections;
        try {
            detections = ctx.detector.analyze_now();
        } catch (const ConfigError& e) {
            reply_error(res, 400, e.what());
            return;
        } catch (const ToolError& e) {
            reply_error(res, 502, e.what());
            return;
        }
        json list = json::array();
        for (const auto& d : detections) list.push_back(detection_json(d));
        reply(res, json{{"detections", list},
                        {"invocation", invocation_name(ctx.detector.last_invocation())}});
    }));

    // --- birds ---
    srv.add_route("GET","/api/birds/summary",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, ctx.tracker.summary());
    }));

    srv.add_route("GET","/api/birds/lifelist",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, json{{"species", ctx.tracker.life_list()},
                        {"count", ctx.tracker.species_count()}});
    }));

    srv.add_route("GET","/api/birds/sightings",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        int limit = int_param(req, "limit", 50);
        reply(res, json{{"sightings", ctx.tracker.recent_sightings(limit)}});
    }));

    srv.add_route("GET","/api/birds/today",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, ctx.tracker.daily_stats());
    }));

    srv.add_route("GET","/api/birds/daily",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        std::string date = req.param("date");
        if (date.empty()) {
            reply(res, ctx.tracker.daily_stats());
            return;
        }
        if (!is_date(date)) {
            reply_error(res, 400, "date must be YYYY-MM-DD");
            return;
        }
        reply(res, ctx.tracker.daily_stats(date));
    }));

    srv.add_prefix_route("GET","/api/birds/species/",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        auto stats = ctx.tracker.species_stats(req.path_rest);
        if (!stats) {
            reply_error(res, 404, "Species not found");
            return;
        }
        reply(res, *stats);
    }));

    srv.add_route("GET","/api/birds/top",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        int limit = int_param(req, "limit", 10);
        reply(res, json{{"species", ctx.tracker.top_species(limit)}});
    }));

    srv.add_route("GET","/api/birds/heatmap",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        json hours = json::array();
        for (int h = 0; h < 24; ++h) hours.push_back(std::to_string(h) + ":00");
        reply(res, json{{"heatmap", ctx.tracker.activity_heatmap()},
                        {"labels", {{"days", {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"}},
                                    {"hours", hours}}}});
    }));

    srv.add_route("GET","/api/birds/search",protect(auth,[&](const HttpRequest& req, HttpResponse& res){
        std::string q = req.param("q");
        SearchOptions opts;

        std::string min_conf = req.param("minConfidence");
        if (!min_conf.empty()) {
            char* end = nullptr;
            double v = std::strtod(min_conf.c_str(), &end);
            if (end != min_conf.c_str() && v > 0) opts.min_confidence = v;
        }
        std::string start = req.param("start"), end = req.param("end");
        if (!start.empty()) {
            opts.start = time_param(start, false);
            if (!opts.start) { reply_error(res, 400, "Invalid start"); return; }
        }
        if (!end.empty()) {
            opts.end = time_param(end, true);
            if (!opts.end) { reply_error(res, 400, "Invalid end"); return; }
        }

        auto results = ctx.tracker.search(q, opts);
        size_t total = results.size();
        if (results.size() > 100) results.resize(100);
        reply(res, json{{"query", q}, {"count", total}, {"sightings", results}});
    }));

    srv.add_route("GET","/api/birds/export",protect(auth,[&](const HttpRequest&, HttpResponse& res){
        reply(res, ctx.tracker.export_data());
    }));
}
