#ifndef THERMAL_OVERLAY_PIPELINE_HPP
#define THERMAL_OVERLAY_PIPELINE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <opencv2/opencv.hpp>
#include "overlay_config.hpp"
#include "overlay_io.hpp"
#include "thermal_palette.hpp"
#include "sensor_frame_normalizer.hpp"
#include "spatial_interpolator.hpp"
#include "color_mapper.hpp"
#include "frame_compositor.hpp"

// Stage durations of one frame, in microseconds
struct FrameTimings {
    int64_t read_us = 0;
    int64_t normalize_us = 0;
    int64_t interpolate_us = 0;
    int64_t map_us = 0;
    int64_t capture_us = 0;
    int64_t composite_us = 0;
    int64_t present_us = 0;
    int64_t total_us = 0;
};

/**
 * Sensor grid -> normalize -> interpolate -> color map -> composite.
 *
 * Owns the palette and every intermediate grid. All buffers are allocated
 * in the constructor and reused, so a steady-state frame allocates nothing.
 */
class ThermalOverlayPipeline {
public:
    using TimingCallback = std::function<void(const FrameTimings &timings)>;

    // Throws std::invalid_argument on a bad configuration
    explicit ThermalOverlayPipeline(const OverlayConfig &config);

    ThermalOverlayPipeline(const ThermalOverlayPipeline &) = delete;
    ThermalOverlayPipeline &operator=(const ThermalOverlayPipeline &) = delete;

    void registerTimingCallback(TimingCallback callback);

    // Runs the pure stages on one frame. sensor_frame must be
    // sensor_rows x sensor_cols, visible must be CV_16U; both are
    // checked and std::invalid_argument thrown otherwise.
    const cv::Mat &process(const cv::Mat &sensor_frame, const cv::Mat &visible);

    // Read, process and present one frame. False once a collaborator fails
    // or the display asks to stop.
    bool runFrame(SensorSource &sensor, CameraSource &camera, DisplaySink &display);

    // Frame loop until runFrame() fails or stop() is called
    void run(SensorSource &sensor, CameraSource &camera, DisplaySink &display);
    void stop() { running_ = false; }
    bool isRunning() const { return running_; }

    const OverlayConfig &config() const { return config_; }
    const ThermalPalette &palette() const { return palette_; }
    const cv::Mat &normalized() const { return normalized_; }
    const cv::Mat &interpolated() const { return interpolated_; }
    const cv::Mat &colorIndices() const { return color_indices_; }
    const cv::Mat &output() const { return output_; }
    // False when the last frame was flat and mapped to the transparent index
    bool lastFrameHadSignal() const { return had_signal_; }
    uint64_t frameCount() const { return frame_count_; }

private:
    static OverlayConfig validated(const OverlayConfig &config);
    static bool reservesTransparentIndex(const OverlayConfig &config);
    void processStages(const cv::Mat &sensor_frame, const cv::Mat &visible, FrameTimings *timings);

    OverlayConfig config_;
    ThermalPalette palette_;
    SensorFrameNormalizer normalizer_;
    SpatialInterpolator interpolator_;
    ColorMapper mapper_;
    FrameCompositor compositor_;

    // Pre-allocated per-frame buffers
    cv::Mat sensor_frame_;
    cv::Mat visible_frame_;
    cv::Mat normalized_;
    cv::Mat interpolated_;
    cv::Mat color_indices_;
    cv::Mat output_;

    TimingCallback timing_callback_;
    std::atomic<bool> running_;
    bool had_signal_;
    uint64_t frame_count_;
};

#endif // THERMAL_OVERLAY_PIPELINE_HPP
