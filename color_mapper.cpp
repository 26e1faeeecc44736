#include "color_mapper.hpp"
#include <cmath>
#include <stdexcept>

ColorMapper::ColorMapper(const ThermalPalette& palette, bool reserve_transparent_index)
    : palette_(palette),
      first_index_(reserve_transparent_index ? ThermalPalette::TRANSPARENT_INDEX + 1 : 0),
      last_index_(static_cast<int>(palette.size()) - 1) {}

uint16_t ColorMapper::indexFor(float value) const {
    // NaN fails both comparisons and lands on the first index
    const float scaled = std::floor(value * static_cast<float>(palette_.size()));
    int index = first_index_;
    if (scaled >= static_cast<float>(last_index_)) {
        index = last_index_;
    } else if (scaled > static_cast<float>(first_index_)) {
        index = static_cast<int>(scaled);
    }
    return static_cast<uint16_t>(index);
}

void ColorMapper::mapToIndices(const cv::Mat& grid, cv::Mat& indices) const {
    indices.create(grid.rows, grid.cols, CV_16U);
    for (int r = 0; r < grid.rows; ++r) {
        const float* src = grid.ptr<float>(r);
        uint16_t* dst = indices.ptr<uint16_t>(r);
        for (int c = 0; c < grid.cols; ++c) {
            dst[c] = indexFor(src[c]);
        }
    }
}

void ColorMapper::mapToColors(const cv::Mat& indices, cv::Mat& colors) const {
    double max_index = 0;
    cv::minMaxLoc(indices, nullptr, &max_index);
    if (max_index > static_cast<double>(last_index_)) {
        throw std::invalid_argument("Index grid holds indices beyond the palette");
    }
    colors.create(indices.rows, indices.cols, CV_16U);
    const uint16_t* lookup = palette_.packedData();
    for (int r = 0; r < indices.rows; ++r) {
        const uint16_t* src = indices.ptr<uint16_t>(r);
        uint16_t* dst = colors.ptr<uint16_t>(r);
        for (int c = 0; c < indices.cols; ++c) {
            dst[c] = lookup[src[c]];
        }
    }
}

void ColorMapper::fillTransparent(cv::Mat& indices) const {
    indices.setTo(cv::Scalar(ThermalPalette::TRANSPARENT_INDEX));
}
