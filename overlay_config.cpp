#include "overlay_config.hpp"
#include <iostream>
#include <sstream>
#include <vector>
#include <stdexcept>
#include "thermal_palette.hpp"

namespace {

int parse_int(const std::string &flag, const std::string &text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception &) {
        throw std::invalid_argument("Invalid integer for " + flag + ": '" + text + "'");
    }
}

float parse_float(const std::string &flag, const std::string &text) {
    try {
        size_t used = 0;
        float value = std::stof(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception &) {
        throw std::invalid_argument("Invalid number for " + flag + ": '" + text + "'");
    }
}

// "a<sep>b<sep>..." into exactly count integers
std::vector<int> parse_int_list(const std::string &flag, const std::string &text,
                                char separator, size_t count) {
    std::vector<int> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, separator)) {
        values.push_back(parse_int(flag, item));
    }
    if (values.size() != count) {
        throw std::invalid_argument("Expected " + std::to_string(count) + " values for " +
                                    flag + ", got '" + text + "'");
    }
    return values;
}

PixelFormat pixel_format_from_string(const std::string &name) {
    if (name == "rgb565") return PixelFormat::RGB565;
    if (name == "rgb565-swapped") return PixelFormat::RGB565_SWAPPED;
    throw std::invalid_argument("Unknown pixel format: " + name);
}

}  // namespace

OverlayGeometry OverlayConfig::defaultGeometry() {
    OverlayGeometry geometry;
    geometry.output_size = cv::Size(240, 240);
    geometry.stride = 4;
    geometry.alpha = 0.5f;
    // Sensor mounted rotated against the display on the camera build
    geometry.transform.swap_axes = true;
    geometry.transform.flip_rows = true;
    return geometry;
}

void OverlayConfig::validate() const {
    if (sensor_rows < 1 || sensor_cols < 1) {
        throw std::invalid_argument("Sensor grid must have at least one row and column");
    }
    if (sensor_rows > MAX_SENSOR_SIZE || sensor_cols > MAX_SENSOR_SIZE) {
        throw std::invalid_argument("Sensor grid is limited to " + std::to_string(MAX_SENSOR_SIZE) +
                                    " rows and columns");
    }
    if (sensor_baud <= 0) {
        throw std::invalid_argument("Baud rate must be positive");
    }
    if (color_count < ThermalPalette::MIN_COLORS || color_count > ThermalPalette::MAX_COLORS) {
        throw std::invalid_argument("Color count must be in [2, 65536]");
    }
    if (!(fade_fraction > 0.0f && fade_fraction < 0.5f)) {
        throw std::invalid_argument("Fade fraction must be in (0, 0.5)");
    }
    if (!(sensor_max_c > sensor_min_c)) {
        throw std::invalid_argument("Sensor max temperature must be above sensor min temperature");
    }
    if (!(noise_floor_c >= 0.0f)) {
        throw std::invalid_argument("Noise floor must not be negative");
    }
    if (geometry.output_size.width <= 0 || geometry.output_size.height <= 0) {
        throw std::invalid_argument("Output size must be positive");
    }
    if (geometry.stride < 1) {
        throw std::invalid_argument("Stride must be at least 1");
    }
    if (!(geometry.alpha >= 0.0f && geometry.alpha <= 1.0f)) {
        throw std::invalid_argument("Alpha must be in [0, 1]");
    }
    if (window_scale < 1) {
        throw std::invalid_argument("Window scale must be at least 1");
    }
    if (timing_every < 0) {
        throw std::invalid_argument("Timing interval must not be negative");
    }
}

bool parse_command_line(int argc, char *argv[], OverlayConfig &config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--test-pattern") {
            config.test_pattern = true;
            continue;
        }
        if (arg == "--reserve-transparent") {
            config.reserve_transparent_index = true;
            continue;
        }

        // Every other flag takes a value
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--port") {
            config.sensor_port = value;
        } else if (arg == "--baud") {
            config.sensor_baud = parse_int(arg, value);
        } else if (arg == "--sensor-size") {
            std::vector<int> size = parse_int_list(arg, value, 'x', 2);
            config.sensor_rows = size[0];
            config.sensor_cols = size[1];
        } else if (arg == "--video") {
            config.video_device = parse_int(arg, value);
        } else if (arg == "--background") {
            config.background_image = value;
        } else if (arg == "--colors") {
            int colors = parse_int(arg, value);
            if (colors < 0) {
                throw std::invalid_argument("Color count must not be negative");
            }
            config.color_count = static_cast<size_t>(colors);
        } else if (arg == "--fade") {
            config.fade_fraction = parse_float(arg, value);
        } else if (arg == "--pixel-format") {
            config.pixel_format = pixel_format_from_string(value);
        } else if (arg == "--normalize") {
            config.normalization = SensorFrameNormalizer::modeFromString(value);
        } else if (arg == "--sensor-min") {
            config.sensor_min_c = parse_float(arg, value);
        } else if (arg == "--sensor-max") {
            config.sensor_max_c = parse_float(arg, value);
        } else if (arg == "--noise-floor") {
            config.noise_floor_c = parse_float(arg, value);
        } else if (arg == "--interpolation") {
            config.interpolation = SpatialInterpolator::modeFromString(value);
        } else if (arg == "--composite") {
            config.composite_mode = FrameCompositor::modeFromString(value);
        } else if (arg == "--output") {
            std::vector<int> size = parse_int_list(arg, value, 'x', 2);
            config.geometry.output_size = cv::Size(size[0], size[1]);
        } else if (arg == "--region") {
            std::vector<int> rect = parse_int_list(arg, value, ',', 4);
            config.geometry.region = cv::Rect(rect[0], rect[1], rect[2], rect[3]);
        } else if (arg == "--camera-offset") {
            std::vector<int> offset = parse_int_list(arg, value, ',', 2);
            config.geometry.visible_offset = cv::Point(offset[0], offset[1]);
        } else if (arg == "--stride") {
            config.geometry.stride = parse_int(arg, value);
        } else if (arg == "--alpha") {
            config.geometry.alpha = parse_float(arg, value);
        } else if (arg == "--transform") {
            config.geometry.transform = AxisTransform::fromString(value);
        } else if (arg == "--window-scale") {
            config.window_scale = parse_int(arg, value);
        } else if (arg == "--timing-every") {
            config.timing_every = parse_int(arg, value);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return true;
}

void print_usage(const char *program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "  --port <path>              Sensor bridge serial port (default: /dev/ttyACM0)\n";
    std::cout << "  --baud <rate>              Sensor bridge baud rate (default: 115200)\n";
    std::cout << "  --test-pattern             Use a moving test pattern instead of the sensor\n";
    std::cout << "  --sensor-size <RxC>        Sensor grid (default: 8x8)\n";
    std::cout << "  --video <index>            Video device index (default: 0)\n";
    std::cout << "  --background <image>       Still image instead of the live camera\n";
    std::cout << "  --colors <n>               Palette size (default: 64)\n";
    std::cout << "  --fade <f>                 Palette fade fraction, 0 < f < 0.5 (default: 0.1)\n";
    std::cout << "  --pixel-format <fmt>       rgb565 | rgb565-swapped (default: rgb565)\n";
    std::cout << "  --normalize <mode>         adaptive | fixed (default: adaptive)\n";
    std::cout << "  --sensor-min <C>           Fixed range low end (default: 0)\n";
    std::cout << "  --sensor-max <C>           Fixed range high end (default: 80)\n";
    std::cout << "  --noise-floor <C>          Adaptive flat-scene threshold (default: 1.0)\n";
    std::cout << "  --interpolation <mode>     bilinear | none (default: bilinear)\n";
    std::cout << "  --reserve-transparent      Keep palette index 0 for flat frames only (always on with blend)\n";
    std::cout << "  --composite <mode>         stride | blend (default: stride)\n";
    std::cout << "  --output <WxH>             Framebuffer size (default: 240x240)\n";
    std::cout << "  --region <x,y,w,h>         Overlay area (default: whole framebuffer)\n";
    std::cout << "  --camera-offset <x,y>      Camera image position (default: 0,0)\n";
    std::cout << "  --stride <n>               Overlay pixel stride (default: 4)\n";
    std::cout << "  --alpha <a>                Blend weight of the overlay (default: 0.5)\n";
    std::cout << "  --transform <flags>        identity or swap,flip-rows,flip-cols (default: swap,flip-rows)\n";
    std::cout << "  --window-scale <n>         Preview window zoom (default: 2)\n";
    std::cout << "  --timing-every <n>         Print stage timings every n frames, 0 = off (default: 30)\n";
    std::cout << "\nExample: " << program_name << " --port /dev/ttyACM0 --video 0 --composite blend\n";
}

std::string describe(const OverlayConfig &config) {
    std::ostringstream out;
    out << "sensor: " << (config.test_pattern ? std::string("test pattern") : config.sensor_port)
        << " (" << config.sensor_rows << "x" << config.sensor_cols << ")"
        << ", camera: "
        << (config.background_image.empty() ? "video " + std::to_string(config.video_device)
                                             : config.background_image)
        << ", colors: " << config.color_count << ", fade: " << config.fade_fraction
        << ", format: " << pixel_format_name(config.pixel_format)
        << ", normalize: " << SensorFrameNormalizer::modeToString(config.normalization)
        << ", interpolation: " << SpatialInterpolator::modeToString(config.interpolation)
        << ", composite: " << FrameCompositor::modeToString(config.composite_mode)
        << ", output: " << config.geometry.output_size.width << "x"
        << config.geometry.output_size.height
        << ", transform: " << config.geometry.transform.toString();
    return out.str();
}
