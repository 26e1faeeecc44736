#include "thermal_overlay_pipeline.hpp"
#include "serial_sensor_source.hpp"
#include "test_pattern_source.hpp"
#include "opencv_io.hpp"
#include "version.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// Pipeline the SIGINT handler asks to stop
static ThermalOverlayPipeline *g_pipeline = nullptr;

static void handle_sigint(int)
{
    if (g_pipeline)
    {
        g_pipeline->stop();
    }
}

int main(int argc, char *argv[])
{
    OverlayConfig config;
    try
    {
        if (!parse_command_line(argc, argv, config))
        {
            print_usage(argv[0]);
            return 0;
        }
        config.validate();
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "\n--- ERROR ---\n";
        std::cerr << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "Thermal Overlay " << ThermalOverlay::get_version() << "\n";
    std::cout << describe(config) << "\n";

    // Palette and buffers first: a bad setup should fail before any device is touched
    std::unique_ptr<ThermalOverlayPipeline> pipeline;
    try
    {
        std::cout << "Building color lookup table...\n";
        pipeline = std::make_unique<ThermalOverlayPipeline>(config);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "\n--- ERROR ---\n";
        std::cerr << "Invalid overlay configuration: " << e.what() << "\n";
        return 1;
    }

    // Sensor
    std::unique_ptr<SensorSource> sensor;
    if (config.test_pattern)
    {
        sensor = std::make_unique<TestPatternSensorSource>(config.sensor_rows, config.sensor_cols);
    }
    else
    {
        // validate() bounds the grid well inside uint16_t
        auto serial = std::make_unique<SerialSensorSource>(static_cast<uint16_t>(config.sensor_rows),
                                                           static_cast<uint16_t>(config.sensor_cols));
        if (!serial->open_port(config.sensor_port, config.sensor_baud))
        {
            std::cerr << "Failed to open sensor port: " << config.sensor_port << "\n";
            return 1;
        }
        sensor = std::move(serial);
    }

    // Camera
    std::unique_ptr<CameraSource> camera;
    if (!config.background_image.empty())
    {
        auto still = std::make_unique<StillImageCameraSource>(config.geometry.output_size,
                                                              config.pixel_format);
        if (!still->load(config.background_image))
        {
            return 1;
        }
        camera = std::move(still);
    }
    else
    {
        auto video = std::make_unique<VideoCaptureCameraSource>(config.geometry.output_size,
                                                                config.pixel_format);
        if (!video->open(config.video_device))
        {
            return 1;
        }
        camera = std::move(video);
    }

    OpenCvWindowSink display("Thermal Overlay", config.pixel_format, config.window_scale);

    if (config.timing_every > 0)
    {
        const uint64_t every = static_cast<uint64_t>(config.timing_every);
        ThermalOverlayPipeline *p = pipeline.get();
        pipeline->registerTimingCallback([p, every](const FrameTimings &t) {
            if (p->frameCount() % every != 0)
            {
                return;
            }
            std::cout << "read " << t.read_us << " normalize " << t.normalize_us
                      << " interpolate " << t.interpolate_us << " map " << t.map_us
                      << " capture " << t.capture_us << " composite " << t.composite_us
                      << " present " << t.present_us << " total " << t.total_us << "\n";
        });
    }

    g_pipeline = pipeline.get();
    std::signal(SIGINT, handle_sigint);

    std::cout << "Starting! Press 'q' in the window or Ctrl+C to quit.\n";
    try
    {
        pipeline->run(*sensor, *camera, display);
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n--- ERROR ---\n";
        std::cerr << "Frame loop stopped: " << e.what() << "\n";
        g_pipeline = nullptr;
        return 1;
    }

    g_pipeline = nullptr;
    std::cout << "Thermal overlay closed after " << pipeline->frameCount() << " frames.\n";
    return 0;
}
