#include "external_tools.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace std::chrono;

const char* invocation_name(Invocation i) {
    switch (i) {
        case Invocation::None: return "none";
        case Invocation::Primary: return "primary";
        case Invocation::Fallback: return "fallback";
    }
    return "none";
}

static std::optional<double> to_number(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(t, &used);
        if (used != t.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<BirdDetection> parse_results_csv_text(const std::string& text) {
    std::vector<BirdDetection> detections;
    std::istringstream in(text);
    std::string line;
    bool header = true;
    auto now = system_clock::now();

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (header) { header = false; continue; }
        if (trim(line).empty()) continue;

        // Start (s),End (s),Scientific name,Common name,Confidence
        auto cols = split(line, ',');
        if (cols.size() < 5) continue;

        auto start = to_number(cols[0]);
        auto end = to_number(cols[1]);
        auto conf = to_number(cols[4]);
        if (!start || !end || !conf) continue;

        BirdDetection d;
        d.species = trim(cols[3]);
        d.scientific_name = trim(cols[2]);
        d.confidence = *conf;
        d.start_time = *start;
        d.end_time = *end;
        d.timestamp = now;
        detections.push_back(std::move(d));
    }
    return detections;
}

std::vector<BirdDetection> parse_results_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_results_csv_text(ss.str());
}

static std::string unique_stamp() {
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return std::to_string(ms) + "_" + random_token(4);
}

static std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

static std::string read_tail(const std::string& path, size_t max_bytes = 512) {
    std::ifstream in(path);
    if (!in) return std::string();
    std::stringstream ss;
    ss << in.rdbuf();
    std::string s = trim(ss.str());
    return s.size() > max_bytes ? s.substr(s.size() - max_bytes) : s;
}

// --- ToolProcess ---

std::optional<int> ToolProcess::run(const std::vector<std::string>& argv,
                                    milliseconds timeout,
                                    const std::string& stderr_path) {
    Subprocess proc;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (cancelled_) throw ToolError(argv.front() + " cancelled");
        if (!proc.start(argv, false, stderr_path)) {
            throw ToolError("failed to launch " + argv.front());
        }
        current_ = &proc;
    }

    auto code = proc.wait_for(timeout);
    if (!code) {
        proc.terminate();
        proc.wait_for(seconds(2)); // the destructor escalates to SIGKILL
    }

    std::lock_guard<std::mutex> lk(m_);
    current_ = nullptr;
    return code;
}

void ToolProcess::cancel() {
    std::lock_guard<std::mutex> lk(m_);
    cancelled_ = true;
    if (current_) current_->terminate();
}

void ToolProcess::reset() {
    std::lock_guard<std::mutex> lk(m_);
    cancelled_ = false;
}

bool ToolProcess::cancelled() {
    std::lock_guard<std::mutex> lk(m_);
    return cancelled_;
}

// --- FfmpegAudioCapture ---

FfmpegAudioCapture::FfmpegAudioCapture(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

std::vector<std::string> FfmpegAudioCapture::args(const std::string& source, const std::string& out,
                                                  const DetectorOptions& opts) const {
    std::vector<std::string> a = {ffmpeg_path_, "-hide_banner", "-loglevel", "error", "-y"};
    if (source.rfind("rtsp://", 0) == 0 || source.rfind("rtsps://", 0) == 0) {
        a.insert(a.end(), {"-rtsp_transport", "tcp"});
    }
    a.insert(a.end(), {"-t", std::to_string(opts.sample_duration_s),
                       "-i", source,
                       "-vn",
                       "-acodec", "pcm_s16le",
                       "-ar", std::to_string(opts.sample_rate),
                       "-ac", "1",
                       out});
    return a;
}

std::string FfmpegAudioCapture::capture(const std::string& source, const DetectorOptions& opts) {
    fs::path dir = fs::path(opts.work_dir) / "audio";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw ToolError("cannot create " + dir.string() + ": " + ec.message());

    std::string out = (dir / ("sample_" + unique_stamp() + ".wav")).string();

    // Generous margin for connecting to the stream.
    auto timeout = seconds(opts.sample_duration_s + 20);
    auto code = proc_.run(args(source, out, opts), timeout);

    if (!code || *code != 0 || !fs::exists(out)) {
        fs::remove(out, ec);
        if (!code) throw ToolError("audio capture timed out");
        throw ToolError("audio capture failed with code " + std::to_string(code.value_or(-1)));
    }
    return out;
}

// --- BirdnetClassifier ---

BirdnetClassifier::BirdnetClassifier(std::string python_path)
    : python_path_(std::move(python_path)) {}

bool BirdnetClassifier::available() {
    try {
        auto code = proc_.run({python_path_, "-c", "import birdnetlib; print(\"ok\")"},
                              seconds(cfg::CLASSIFIER_CHECK_SEC));
        return code && *code == 0;
    } catch (const ToolError& e) {
        fprintf(stderr, "[Detector] %s\n", e.what());
        return false;
    }
}

std::vector<std::string> BirdnetClassifier::primary_args(const std::string& audio_file,
                                                         const std::string& csv_out,
                                                         const DetectorOptions& opts) const {
    std::vector<std::string> a = {python_path_, "-m", "birdnetlib.analyze",
                                  "--i", audio_file,
                                  "--o", csv_out,
                                  "--min_conf", format_number(opts.min_confidence)};
    if (opts.latitude && opts.longitude) {
        a.insert(a.end(), {"--lat", format_number(*opts.latitude), "--lon", format_number(*opts.longitude)});
    }
    if (!opts.locale.empty()) {
        a.insert(a.end(), {"--locale", opts.locale});
    }
    return a;
}

std::vector<std::string> BirdnetClassifier::fallback_args(const std::string& audio_file,
                                                          const std::string& out_dir,
                                                          const DetectorOptions& opts) const {
    std::vector<std::string> a = {python_path_, "-m", "birdnet_analyzer.analyze",
                                  "--i", audio_file,
                                  "--o", out_dir,
                                  "--min_conf", format_number(opts.min_confidence),
                                  "--rtype", "csv"};
    if (opts.latitude && opts.longitude) {
        a.insert(a.end(), {"--lat", format_number(*opts.latitude), "--lon", format_number(*opts.longitude)});
    }
    return a;
}

ClassifyResult BirdnetClassifier::classify(const std::string& audio_file, const DetectorOptions& opts) {
    fs::path results = fs::path(opts.work_dir) / "results";
    std::error_code ec;
    fs::create_directories(results, ec);
    if (ec) throw ToolError("cannot create " + results.string() + ": " + ec.message());

    int timeout_s = opts.classifier_timeout_s > 0 ? opts.classifier_timeout_s : 2 * opts.analysis_interval_s;
    auto timeout = seconds(std::max(timeout_s, 1));

    std::string stamp = unique_stamp();
    std::string log_path = (results / ("classifier_" + stamp + ".log")).string();
    std::string csv_out = (results / ("result_" + stamp + ".csv")).string();

    ClassifyResult result;
    auto code = proc_.run(primary_args(audio_file, csv_out, opts), timeout, log_path);
    if (code && *code == 0) {
        result.detections = parse_results_csv(csv_out);
        result.invocation = Invocation::Primary;
        fs::remove(csv_out, ec);
        fs::remove(log_path, ec);
        return result;
    }
    fs::remove(csv_out, ec);
    if (!code) {
        fs::remove(log_path, ec);
        throw ToolError("classifier timed out after " + std::to_string(timeout.count()) + "s");
    }
    if (proc_.cancelled()) {
        fs::remove(log_path, ec);
        throw ToolError("classifier cancelled");
    }

    printf("[Detector] birdnetlib exited with code %d, trying birdnet_analyzer\n", *code);

    // Fresh directory per run so a stale table is never picked up.
    fs::path out_dir = results / ("run_" + stamp);
    fs::create_directories(out_dir, ec);
    auto fb_code = proc_.run(fallback_args(audio_file, out_dir.string(), opts), timeout, log_path);

    if (!fb_code || *fb_code != 0) {
        std::string err = read_tail(log_path);
        fs::remove_all(out_dir, ec);
        fs::remove(log_path, ec);
        throw ToolError("BirdNET failed: " + (err.empty() ? std::string("no output") : err));
    }

    std::vector<std::string> tables;
    for (auto it = fs::recursive_directory_iterator(out_dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".csv") {
            tables.push_back(it->path().string());
        }
    }
    std::sort(tables.begin(), tables.end());
    if (!tables.empty()) result.detections = parse_results_csv(tables.front());
    result.invocation = Invocation::Fallback;

    fs::remove_all(out_dir, ec);
    fs::remove(log_path, ec);
    return result;
}
