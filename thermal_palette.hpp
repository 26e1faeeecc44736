#ifndef THERMAL_PALETTE_HPP
#define THERMAL_PALETTE_HPP

#include <vector>
#include <cstdint>
#include <cstddef>
#include <opencv2/opencv.hpp>
#include "pixel_format.hpp"

// Lookup table from a color index to a display color.
//
// Coolest = black -> blue -> purple -> red -> orange -> yellow -> white = hottest
// Index 0 is black and doubles as the transparent index of the overlay.
class ThermalPalette {
public:
    static constexpr size_t MIN_COLORS = 2;
    static constexpr size_t MAX_COLORS = 65536;
    static constexpr uint16_t TRANSPARENT_INDEX = 0;

    // Throws std::invalid_argument when color_count is outside
    // [MIN_COLORS, MAX_COLORS] or fade_fraction is outside (0, 0.5).
    static ThermalPalette build(size_t color_count, float fade_fraction,
                                PixelFormat format = PixelFormat::RGB565);

    size_t size() const { return packed_.size(); }
    float fade_fraction() const { return fade_fraction_; }
    PixelFormat format() const { return format_; }

    // Display-encoded color of an entry
    uint16_t packed(size_t index) const { return packed_[index]; }
    const uint16_t* packedData() const { return packed_.data(); }

    // 0xRRGGBB color of an entry
    uint32_t rgb(size_t index) const { return rgb_[index]; }

    // Color strip, one pixel per entry, for previews (BGR)
    cv::Mat toBgrStrip() const;

private:
    ThermalPalette(std::vector<uint32_t> rgb, std::vector<uint16_t> packed,
                   float fade_fraction, PixelFormat format);

    std::vector<uint32_t> rgb_;
    std::vector<uint16_t> packed_;
    float fade_fraction_;
    PixelFormat format_;
};

#endif // THERMAL_PALETTE_HPP
