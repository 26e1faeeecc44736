#include "thermal_overlay_pipeline.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

using Clock = std::chrono::steady_clock;

int64_t micros_between(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

}  // namespace

OverlayConfig ThermalOverlayPipeline::validated(const OverlayConfig &config) {
    config.validate();
    return config;
}

// Alpha blend reads index 0 as "no overlay", so real data must stay off it
bool ThermalOverlayPipeline::reservesTransparentIndex(const OverlayConfig &config) {
    return config.reserve_transparent_index || config.composite_mode == CompositeMode::ALPHA_BLEND;
}

ThermalOverlayPipeline::ThermalOverlayPipeline(const OverlayConfig &config)
    : config_(validated(config)),
      palette_(ThermalPalette::build(config_.color_count, config_.fade_fraction, config_.pixel_format)),
      normalizer_(config_.normalization, config_.sensor_min_c, config_.sensor_max_c, config_.noise_floor_c),
      interpolator_(config_.interpolation),
      mapper_(palette_, reservesTransparentIndex(config_)),
      compositor_(config_.composite_mode, config_.geometry,
                  interpolator_.outputSize(config_.sensor_rows, config_.sensor_cols)),
      running_(false),
      had_signal_(false),
      frame_count_(0) {
    const cv::Size grid = interpolator_.outputSize(config_.sensor_rows, config_.sensor_cols);

    sensor_frame_ = cv::Mat::zeros(config_.sensor_rows, config_.sensor_cols, CV_32F);
    visible_frame_ = cv::Mat::zeros(config_.geometry.output_size, CV_16U);
    normalized_ = cv::Mat::zeros(config_.sensor_rows, config_.sensor_cols, CV_32F);
    interpolated_ = cv::Mat::zeros(grid, CV_32F);
    color_indices_ = cv::Mat::zeros(grid, CV_16U);
    output_ = cv::Mat::zeros(config_.geometry.output_size, CV_16U);
}

void ThermalOverlayPipeline::registerTimingCallback(TimingCallback callback) {
    timing_callback_ = std::move(callback);
}

const cv::Mat &ThermalOverlayPipeline::process(const cv::Mat &sensor_frame, const cv::Mat &visible) {
    processStages(sensor_frame, visible, nullptr);
    return output_;
}

void ThermalOverlayPipeline::processStages(const cv::Mat &sensor_frame, const cv::Mat &visible,
                                           FrameTimings *timings) {
    if (sensor_frame.rows != config_.sensor_rows || sensor_frame.cols != config_.sensor_cols ||
        sensor_frame.channels() != 1) {
        throw std::invalid_argument("Sensor frame is " + std::to_string(sensor_frame.rows) + "x" +
                                    std::to_string(sensor_frame.cols) + ", expected " +
                                    std::to_string(config_.sensor_rows) + "x" +
                                    std::to_string(config_.sensor_cols));
    }
    if (visible.type() != CV_16U) {
        throw std::invalid_argument("Camera frame must hold packed 16-bit pixels");
    }

    Clock::time_point t0 = Clock::now();
    had_signal_ = normalizer_.normalize(sensor_frame, normalized_);

    Clock::time_point t1 = Clock::now();
    interpolator_.interpolate(normalized_, interpolated_);

    Clock::time_point t2 = Clock::now();
    if (had_signal_) {
        mapper_.mapToIndices(interpolated_, color_indices_);
    } else {
        mapper_.fillTransparent(color_indices_);
    }

    Clock::time_point t3 = Clock::now();
    compositor_.composite(visible, color_indices_, palette_, output_);

    Clock::time_point t4 = Clock::now();
    frame_count_++;

    if (timings) {
        timings->normalize_us = micros_between(t0, t1);
        timings->interpolate_us = micros_between(t1, t2);
        timings->map_us = micros_between(t2, t3);
        timings->composite_us = micros_between(t3, t4);
    }
}

bool ThermalOverlayPipeline::runFrame(SensorSource &sensor, CameraSource &camera, DisplaySink &display) {
    FrameTimings timings;
    Clock::time_point start = Clock::now();

    if (!sensor.read_frame(sensor_frame_)) {
        std::cerr << "ERROR: Sensor read failed, stopping frame loop\n";
        return false;
    }
    Clock::time_point read = Clock::now();

    if (!camera.capture_frame(visible_frame_)) {
        std::cerr << "ERROR: Camera capture failed, stopping frame loop\n";
        return false;
    }
    Clock::time_point captured = Clock::now();

    processStages(sensor_frame_, visible_frame_, &timings);
    Clock::time_point composited = Clock::now();

    const bool keep_going = display.present(output_);
    Clock::time_point presented = Clock::now();

    timings.read_us = micros_between(start, read);
    timings.capture_us = micros_between(read, captured);
    timings.present_us = micros_between(composited, presented);
    timings.total_us = micros_between(start, presented);

    if (timing_callback_) {
        timing_callback_(timings);
    }
    return keep_going;
}

void ThermalOverlayPipeline::run(SensorSource &sensor, CameraSource &camera, DisplaySink &display) {
    running_ = true;
    while (running_) {
        if (!runFrame(sensor, camera, display)) {
            break;
        }
    }
    running_ = false;
}
