#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

// Area of the frame to score, in percent (0-100) of width/height.
struct Region {
    double x = 0, y = 0, width = 100, height = 100;
};

struct MotionConfig {
    bool enabled = true;
    double sensitivity = 50;    // 0-100, higher = more sensitive
    double threshold = 5;       // 0-100, % of scored pixels that must change
    int cooldown_ms = 5000;     // minimum time between events
    int min_duration_ms = 500;  // motion must persist this long
    bool debug = false;
    std::vector<Region> regions; // empty = full frame
};

// Clamps sensitivity/threshold/regions to 0-100 and timings to >= 0.
MotionConfig normalized(MotionConfig c);

struct SceneScore {
    double score = 0;             // 0-1, fraction of scored pixels changed
    std::optional<Region> region; // most active configured region
};

// Frame differencing on decoded JPEG frames, restricted to the configured
// regions. The first frame (and any frame after reset()) scores nothing.
class SceneScorer {
public:
    SceneScorer(int width = 320, int height = 240);

    std::optional<SceneScore> score(const std::vector<unsigned char>& jpegFrame,
                                    const MotionConfig& config);
    std::optional<SceneScore> score(const cv::Mat& bgr, const MotionConfig& config);
    void reset();

    // Per-pixel grey-level difference that counts as "changed".
    static double pixel_threshold(double sensitivity);

private:
    cv::Rect to_rect(const Region& r) const;

    cv::Mat prevGray_;
    int width_, height_;
};
