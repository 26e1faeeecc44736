#include "thermal_palette.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

ThermalPalette::ThermalPalette(std::vector<uint32_t> rgb, std::vector<uint16_t> packed,
                               float fade_fraction, PixelFormat format)
    : rgb_(std::move(rgb)), packed_(std::move(packed)),
      fade_fraction_(fade_fraction), format_(format) {}

ThermalPalette ThermalPalette::build(size_t color_count, float fade_fraction, PixelFormat format) {
    if (color_count < MIN_COLORS || color_count > MAX_COLORS) {
        throw std::invalid_argument("Palette color count must be in [2, 65536], got " +
                                    std::to_string(color_count));
    }
    if (!(fade_fraction > 0.0f && fade_fraction < 0.5f)) {
        throw std::invalid_argument("Palette fade fraction must be in (0, 0.5), got " +
                                    std::to_string(fade_fraction));
    }

    // One row of HSV triplets, converted in a single cvtColor call.
    // OpenCV float HSV: H in degrees [0, 360), S and V in [0, 1].
    cv::Mat hsv(1, static_cast<int>(color_count), CV_32FC3);
    const float hue_range = 1.0f - (fade_fraction * 2.0f);

    for (size_t color = 0; color < color_count; ++color) {
        const float color_fraction = static_cast<float>(color) / static_cast<float>(color_count);
        float hue, saturation, value;

        if (color_fraction < fade_fraction) {
            // Fade from black to blue
            hue = -1.0f / 3.0f;
            saturation = 1.0f;
            value = color_fraction / fade_fraction;
        } else if (color_fraction > (1.0f - fade_fraction)) {
            // Glow from yellow to white
            hue = 1.0f / 6.0f;
            const float glow_fraction = color_fraction - (1.0f - fade_fraction);
            saturation = (fade_fraction - glow_fraction) / fade_fraction;
            value = 1.0f;
        } else {
            // Full saturation and value, hue from -1/3 (blue) up to +1/6 (yellow)
            // through purple, red and orange.
            hue = ((color_fraction - fade_fraction) / (hue_range * 2.0f)) - (1.0f / 3.0f);
            saturation = 1.0f;
            value = 1.0f;
        }

        // Wrap negative hues onto the color wheel
        float turns = hue - std::floor(hue);
        if (turns >= 1.0f) {
            turns -= 1.0f;
        }
        hsv.at<cv::Vec3f>(0, static_cast<int>(color)) =
            cv::Vec3f(turns * 360.0f, std::max(0.0f, std::min(1.0f, saturation)),
                      std::max(0.0f, std::min(1.0f, value)));
    }

    cv::Mat rgb_float;
    cv::cvtColor(hsv, rgb_float, cv::COLOR_HSV2RGB);
    cv::Mat rgb_8u;
    rgb_float.convertTo(rgb_8u, CV_8UC3, 255.0);

    std::vector<uint32_t> rgb(color_count);
    std::vector<uint16_t> packed(color_count);
    for (size_t color = 0; color < color_count; ++color) {
        const cv::Vec3b &c = rgb_8u.at<cv::Vec3b>(0, static_cast<int>(color));
        rgb[color] = (static_cast<uint32_t>(c[0]) << 16) |
                     (static_cast<uint32_t>(c[1]) << 8) |
                     static_cast<uint32_t>(c[2]);
        packed[color] = pack_pixel(c[0], c[1], c[2], format);
    }

    return ThermalPalette(std::move(rgb), std::move(packed), fade_fraction, format);
}

cv::Mat ThermalPalette::toBgrStrip() const {
    cv::Mat strip(1, static_cast<int>(rgb_.size()), CV_8UC3);
    for (size_t i = 0; i < rgb_.size(); ++i) {
        const uint32_t c = rgb_[i];
        strip.at<cv::Vec3b>(0, static_cast<int>(i)) =
            cv::Vec3b(c & 0xFF, (c >> 8) & 0xFF, (c >> 16) & 0xFF);
    }
    return strip;
}
