#include "../thermal_palette.hpp"
#include "../color_mapper.hpp"
#include "../thermal_overlay_pipeline.hpp"
#include "../test_pattern_source.hpp"
#include "../opencv_io.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <opencv2/opencv.hpp>
#include <string>

// Writes preview images of the palette and of a test-pattern frame.
// Needs no sensor or camera.
int main(int argc, char *argv[])
{
    size_t colors = 64;
    float fade = 0.1f;
    std::string prefix = "palette_preview";
    bool list = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--colors" && i + 1 < argc) {
            colors = static_cast<size_t>(std::atoi(argv[++i]));
        }
        else if (arg == "--fade" && i + 1 < argc) {
            fade = static_cast<float>(std::atof(argv[++i]));
        }
        else if (arg == "--out" && i + 1 < argc) {
            prefix = argv[++i];
        }
        else if (arg == "--list") {
            list = true;
        }
        else {
            std::cerr << "Usage: " << argv[0] << " [--colors <n>] [--fade <f>] [--out <prefix>] [--list]\n";
            return 1;
        }
    }

    OverlayConfig config;
    config.color_count = colors;
    config.fade_fraction = fade;

    try {
        ThermalPalette palette = ThermalPalette::build(colors, fade, config.pixel_format);

        if (list) {
            for (size_t i = 0; i < palette.size(); ++i) {
                std::cout << std::setw(4) << i << "  #" << std::hex << std::setfill('0')
                          << std::setw(6) << palette.rgb(i) << "  0x" << std::setw(4)
                          << palette.packed(i) << std::dec << std::setfill(' ') << "\n";
            }
        }

        // Strip, 8 pixels per entry, 32 tall
        cv::Mat strip;
        cv::resize(palette.toBgrStrip(), strip, cv::Size(static_cast<int>(colors) * 8, 32),
                   0, 0, cv::INTER_NEAREST);
        const std::string strip_path = prefix + "_strip.png";
        cv::imwrite(strip_path, strip);
        std::cout << "Wrote " << strip_path << "\n";

        // One frame of each composite mode over a gray background
        const CompositeMode modes[] = {CompositeMode::STRIDE_OVERWRITE, CompositeMode::ALPHA_BLEND};
        for (CompositeMode mode : modes) {
            config.composite_mode = mode;
            ThermalOverlayPipeline pipeline(config);
            TestPatternSensorSource sensor(config.sensor_rows, config.sensor_cols);

            cv::Mat readings;
            sensor.read_frame(readings);
            cv::Mat background(config.geometry.output_size, CV_16U,
                               cv::Scalar(pack_pixel(96, 96, 96, config.pixel_format)));

            cv::Mat bgr;
            packed_to_bgr(pipeline.process(readings, background), config.pixel_format, bgr);

            const std::string path = prefix + "_" + FrameCompositor::modeToString(mode) + ".png";
            cv::imwrite(path, bgr);
            std::cout << "Wrote " << path << "\n";

            // The interpolated grid on its own, one block per cell
            if (mode == CompositeMode::STRIDE_OVERWRITE) {
                ColorMapper mapper(pipeline.palette());
                cv::Mat colors, grid_bgr, grid;
                mapper.mapToColors(pipeline.colorIndices(), colors);
                packed_to_bgr(colors, config.pixel_format, grid_bgr);
                cv::resize(grid_bgr, grid, cv::Size(), 16, 16, cv::INTER_NEAREST);

                const std::string grid_path = prefix + "_grid.png";
                cv::imwrite(grid_path, grid);
                std::cout << "Wrote " << grid_path << "\n";
            }
        }
    }
    catch (const std::invalid_argument &e) {
        std::cerr << "\n--- ERROR ---\n";
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
