#ifndef OVERLAY_CONFIG_HPP
#define OVERLAY_CONFIG_HPP

#include <string>
#include <cstddef>
#include "pixel_format.hpp"
#include "sensor_frame_normalizer.hpp"
#include "spatial_interpolator.hpp"
#include "frame_compositor.hpp"

// Everything a deployment can choose. Defaults describe the reference camera
// build: AMG8833 on a 240x240 RGB565 display.
struct OverlayConfig {
    static constexpr int MAX_SENSOR_SIZE = 256;

    // Sensor
    std::string sensor_port = "/dev/ttyACM0";
    int sensor_baud = 115200;
    bool test_pattern = false;
    int sensor_rows = 8;
    int sensor_cols = 8;

    // Camera: a background image replaces the live camera when set
    int video_device = 0;
    std::string background_image;

    // Palette
    size_t color_count = 64;
    float fade_fraction = 0.1f;
    PixelFormat pixel_format = PixelFormat::RGB565;

    // Pipeline stages
    NormalizationMode normalization = NormalizationMode::ADAPTIVE;
    float sensor_min_c = SensorFrameNormalizer::DEFAULT_SENSOR_MIN_C;
    float sensor_max_c = SensorFrameNormalizer::DEFAULT_SENSOR_MAX_C;
    float noise_floor_c = SensorFrameNormalizer::DEFAULT_NOISE_FLOOR_C;
    InterpolationMode interpolation = InterpolationMode::BILINEAR_ONE_PASS;
    bool reserve_transparent_index = false;  // Implied by ALPHA_BLEND
    CompositeMode composite_mode = CompositeMode::STRIDE_OVERWRITE;
    OverlayGeometry geometry = defaultGeometry();

    // Viewer
    int window_scale = 2;
    int timing_every = 30;  // Print stage timings every N frames, 0 = never

    // Throws std::invalid_argument describing the first bad value
    void validate() const;

    static OverlayGeometry defaultGeometry();
};

/**
 * @brief Fills config from "--flag value" pairs.
 * @return false if --help was given. Throws std::invalid_argument on an
 * unknown flag, a missing value or a value that does not parse.
 */
bool parse_command_line(int argc, char *argv[], OverlayConfig &config);

void print_usage(const char *program_name);

// One-line summary for the startup banner
std::string describe(const OverlayConfig &config);

#endif // OVERLAY_CONFIG_HPP
