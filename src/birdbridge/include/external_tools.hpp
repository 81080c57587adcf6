#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "subprocess.hpp"

struct BirdDetection {
    std::string species;            // common name
    std::string scientific_name;
    double confidence = 0;          // 0-1
    double start_time = 0;          // offsets within the sample, seconds
    double end_time = 0;
    std::chrono::system_clock::time_point timestamp;
};

struct DetectorOptions {
    double min_confidence = 0.7;
    int analysis_interval_s = 3;
    int sample_duration_s = 3;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string locale = "en";
    int classifier_timeout_s = 0;   // 0 = twice the analysis interval
    std::string work_dir = "temp";
    int sample_rate = 48000;
};

// Which calling convention of the classifier produced the result.
enum class Invocation { None, Primary, Fallback };

const char* invocation_name(Invocation i);

struct ClassifyResult {
    std::vector<BirdDetection> detections; // file order, unfiltered
    Invocation invocation = Invocation::None;
};

// Parses a classifier result table: a header row, then
// start,end,scientific name,common name,confidence. Rows with fewer than
// five columns or non-numeric fields are skipped.
std::vector<BirdDetection> parse_results_csv_text(const std::string& text);
std::vector<BirdDetection> parse_results_csv(const std::string& path);

// capture(source, duration) -> file
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    // Returns the path of a freshly written sample. Throws ToolError.
    virtual std::string capture(const std::string& source, const DetectorOptions& opts) = 0;
    // Terminates an in-flight capture, if any, and refuses new ones
    // until reset().
    virtual void cancel() {}
    virtual void reset() {}
};

// classify(file) -> rows
class SpeciesClassifier {
public:
    virtual ~SpeciesClassifier() = default;
    virtual bool available() = 0;
    // Throws ToolError when no invocation succeeds.
    virtual ClassifyResult classify(const std::string& audio_file, const DetectorOptions& opts) = 0;
    virtual void cancel() {}
    virtual void reset() {}
};

// Tracks the one subprocess a tool may have in flight so cancel() can reach it.
class ToolProcess {
public:
    // Runs argv to completion. Returns the exit status; nullopt on timeout
    // (the child is terminated). Throws ToolError if it cannot be launched
    // or cancel() was called since the last reset().
    std::optional<int> run(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout,
                           const std::string& stderr_path = std::string());
    // Terminates the running child. Stays in effect until reset().
    void cancel();
    void reset();
    bool cancelled();

private:
    std::mutex m_;
    Subprocess* current_ = nullptr;
    bool cancelled_ = false;
};

// Mono 16-bit PCM WAV sample via ffmpeg.
class FfmpegAudioCapture : public AudioCapture {
public:
    explicit FfmpegAudioCapture(std::string ffmpeg_path = "ffmpeg");

    std::string capture(const std::string& source, const DetectorOptions& opts) override;
    void cancel() override { proc_.cancel(); }
    void reset() override { proc_.reset(); }

    std::vector<std::string> args(const std::string& source, const std::string& out,
                                  const DetectorOptions& opts) const;

private:
    std::string ffmpeg_path_;
    ToolProcess proc_;
};

// BirdNET through Python: birdnetlib first, birdnet_analyzer as fallback.
class BirdnetClassifier : public SpeciesClassifier {
public:
    explicit BirdnetClassifier(std::string python_path = "python");

    bool available() override;
    ClassifyResult classify(const std::string& audio_file, const DetectorOptions& opts) override;
    void cancel() override { proc_.cancel(); }
    void reset() override { proc_.reset(); }

    std::vector<std::string> primary_args(const std::string& audio_file, const std::string& csv_out,
                                          const DetectorOptions& opts) const;
    std::vector<std::string> fallback_args(const std::string& audio_file, const std::string& out_dir,
                                           const DetectorOptions& opts) const;

private:
    std::string python_path_;
    ToolProcess proc_;
};
