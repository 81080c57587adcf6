#include "motion.hpp"
#include <algorithm>

static double clamp_pct(double v) { return std::min(100.0, std::max(0.0, v)); }

MotionConfig normalized(MotionConfig c) {
    c.sensitivity = clamp_pct(c.sensitivity);
    c.threshold = clamp_pct(c.threshold);
    c.cooldown_ms = std::max(0, c.cooldown_ms);
    c.min_duration_ms = std::max(0, c.min_duration_ms);
    for (auto& r : c.regions) {
        r.x = clamp_pct(r.x);
        r.y = clamp_pct(r.y);
        r.width = std::min(clamp_pct(r.width), 100.0 - r.x);
        r.height = std::min(clamp_pct(r.height), 100.0 - r.y);
    }
    return c;
}

SceneScorer::SceneScorer(int width, int height)
    : width_(width), height_(height) {}

double SceneScorer::pixel_threshold(double sensitivity) {
    // 0 -> 55 grey levels, 100 -> 5
    return 55.0 - clamp_pct(sensitivity) * 0.5;
}

void SceneScorer::reset() {
    prevGray_.release();
}

cv::Rect SceneScorer::to_rect(const Region& r) const {
    int x = static_cast<int>(r.x / 100.0 * width_);
    int y = static_cast<int>(r.y / 100.0 * height_);
    int w = static_cast<int>(r.width / 100.0 * width_);
    int h = static_cast<int>(r.height / 100.0 * height_);
    return cv::Rect(x, y, w, h) & cv::Rect(0, 0, width_, height_);
}

std::optional<SceneScore> SceneScorer::score(const std::vector<unsigned char>& jpegFrame,
                                             const MotionConfig& config) {
    // Decode JPEG to color
    cv::Mat img = cv::imdecode(jpegFrame, cv::IMREAD_COLOR);
    if (img.empty()) return std::nullopt;
    return score(img, config);
}

std::optional<SceneScore> SceneScorer::score(const cv::Mat& bgr, const MotionConfig& config) {
    if (bgr.empty()) return std::nullopt;

    cv::Mat img;
    cv::resize(bgr, img, cv::Size(width_, height_));

    cv::Mat gray;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(5, 5), 0);

    if (prevGray_.empty()) {
        prevGray_ = gray.clone();
        return std::nullopt;
    }

    cv::Mat diff;
    cv::absdiff(gray, prevGray_, diff);
    cv::threshold(diff, diff, pixel_threshold(config.sensitivity), 255, cv::THRESH_BINARY);
    prevGray_ = gray.clone();

    SceneScore result;
    if (config.regions.empty()) {
        result.score = static_cast<double>(cv::countNonZero(diff)) / (diff.rows * diff.cols);
        return result;
    }

    // Union of regions for the score, best single region for the event.
    cv::Mat mask = cv::Mat::zeros(diff.size(), CV_8UC1);
    double best = -1.0;
    for (const auto& r : config.regions) {
        cv::Rect rect = to_rect(r);
        if (rect.area() <= 0) continue;
        mask(rect).setTo(255);
        double ratio = static_cast<double>(cv::countNonZero(diff(rect))) / rect.area();
        if (ratio > best) {
            best = ratio;
            result.region = r;
        }
    }

    int area = cv::countNonZero(mask);
    if (area == 0) return result;

    cv::Mat masked;
    cv::bitwise_and(diff, mask, masked);
    result.score = static_cast<double>(cv::countNonZero(masked)) / area;
    return result;
}
