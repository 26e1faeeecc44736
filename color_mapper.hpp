#ifndef COLOR_MAPPER_HPP
#define COLOR_MAPPER_HPP

#include <opencv2/opencv.hpp>
#include "thermal_palette.hpp"

// Quantizes normalized values to palette indices (CV_16U) and looks up
// their display colors.
class ColorMapper {
public:
    // reserve_transparent_index keeps real data out of index 0 so only a
    // flat frame shows through as transparent.
    explicit ColorMapper(const ThermalPalette& palette, bool reserve_transparent_index = false);
    // The mapper keeps a reference to the palette
    ColorMapper(ThermalPalette&&, bool = false) = delete;

    // index = clamp(floor(value * N), 0, N - 1)
    void mapToIndices(const cv::Mat& grid, cv::Mat& indices) const;

    // Packed colors (CV_16U) for an index grid. Throws
    // std::invalid_argument on an index outside the palette.
    void mapToColors(const cv::Mat& indices, cv::Mat& colors) const;

    // Flat frame: every cell gets the transparent index
    void fillTransparent(cv::Mat& indices) const;

    uint16_t indexFor(float value) const;

private:
    const ThermalPalette& palette_;
    int first_index_;
    int last_index_;
};

#endif // COLOR_MAPPER_HPP
