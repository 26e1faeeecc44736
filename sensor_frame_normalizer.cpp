#include "sensor_frame_normalizer.hpp"
#include <stdexcept>

SensorFrameNormalizer::SensorFrameNormalizer(NormalizationMode mode, float sensor_min,
                                             float sensor_max, float noise_floor)
    : mode_(mode), sensor_min_(sensor_min), sensor_max_(sensor_max), noise_floor_(noise_floor) {
    if (!(sensor_max_ > sensor_min_)) {
        throw std::invalid_argument("Sensor max temperature must be above sensor min temperature");
    }
    if (!(noise_floor_ >= 0.0f)) {
        throw std::invalid_argument("Noise floor must not be negative");
    }
}

bool SensorFrameNormalizer::normalize(const cv::Mat& frame, cv::Mat& normalized) const {
    // Bus errors can hand us garbage; NaN would survive the clamp below.
    frame.convertTo(normalized, CV_32F);
    cv::patchNaNs(normalized, 0.0);

    float low = sensor_min_;
    float high = sensor_max_;

    if (mode_ == NormalizationMode::ADAPTIVE) {
        double min_d, max_d;
        cv::minMaxLoc(normalized, &min_d, &max_d);
        // Flat scene: scaling would only amplify noise
        if (!(max_d - min_d > noise_floor_)) {
            normalized.setTo(0.0f);
            return false;
        }
        low = static_cast<float>(min_d);
        high = static_cast<float>(max_d);
    }

    // Normalize to 0-1 range
    const double range = static_cast<double>(high) - low;
    normalized.convertTo(normalized, CV_32F, 1.0 / range, -low / range);
    cv::patchNaNs(normalized, 0.0);

    // Clamp values to [0, 1]
    cv::threshold(normalized, normalized, 1.0, 1.0, cv::THRESH_TRUNC);
    cv::threshold(normalized, normalized, 0.0, 0.0, cv::THRESH_TOZERO);

    return true;
}

std::string SensorFrameNormalizer::modeToString(NormalizationMode mode) {
    return mode == NormalizationMode::FIXED_RANGE ? "fixed" : "adaptive";
}

NormalizationMode SensorFrameNormalizer::modeFromString(const std::string& name) {
    if (name == "fixed") return NormalizationMode::FIXED_RANGE;
    if (name == "adaptive") return NormalizationMode::ADAPTIVE;
    throw std::invalid_argument("Unknown normalization mode: " + name);
}
