#ifndef SENSOR_FRAME_NORMALIZER_HPP
#define SENSOR_FRAME_NORMALIZER_HPP

#include <string>
#include <opencv2/opencv.hpp>

enum class NormalizationMode {
    FIXED_RANGE,    // Scale against the sensor's rated range
    ADAPTIVE        // Scale against the frame's own min/max
};

// Rescales raw temperature grids (CV_32F) into [0, 1].
class SensorFrameNormalizer {
public:
    // AMG8833 reports temperature values within range of 0-80C
    static constexpr float DEFAULT_SENSOR_MIN_C = 0.0f;
    static constexpr float DEFAULT_SENSOR_MAX_C = 80.0f;
    // Frames spanning no more than this are treated as a flat scene
    static constexpr float DEFAULT_NOISE_FLOOR_C = 1.0f;

    // Throws std::invalid_argument if sensor_max <= sensor_min or
    // noise_floor is negative.
    explicit SensorFrameNormalizer(NormalizationMode mode = NormalizationMode::ADAPTIVE,
                                   float sensor_min = DEFAULT_SENSOR_MIN_C,
                                   float sensor_max = DEFAULT_SENSOR_MAX_C,
                                   float noise_floor = DEFAULT_NOISE_FLOOR_C);

    /**
     * @brief Normalizes one frame into a pre-allocated grid of the same shape.
     * @return false when the frame is flat (adaptive mode only); the output
     * is then all zero.
     */
    bool normalize(const cv::Mat& frame, cv::Mat& normalized) const;

    NormalizationMode mode() const { return mode_; }

    static std::string modeToString(NormalizationMode mode);
    static NormalizationMode modeFromString(const std::string& name);

private:
    NormalizationMode mode_;
    float sensor_min_;
    float sensor_max_;
    float noise_floor_;
};

#endif // SENSOR_FRAME_NORMALIZER_HPP
