#include "spatial_interpolator.hpp"
#include <stdexcept>

SpatialInterpolator::SpatialInterpolator(InterpolationMode mode) : mode_(mode) {}

cv::Size SpatialInterpolator::outputSize(int rows, int cols) const {
    if (mode_ == InterpolationMode::NONE) {
        return cv::Size(cols, rows);
    }
    return cv::Size(2 * cols - 1, 2 * rows - 1);
}

void SpatialInterpolator::interpolate(const cv::Mat& grid, cv::Mat& out) const {
    if (mode_ == InterpolationMode::NONE) {
        grid.copyTo(out);
        return;
    }

    const int rows = grid.rows;
    const int cols = grid.cols;
    const int out_rows = 2 * rows - 1;
    const int out_cols = 2 * cols - 1;
    out.create(out_rows, out_cols, CV_32F);

    // Known samples on even rows and even columns
    for (int r = 0; r < rows; ++r) {
        const float* src = grid.ptr<float>(r);
        float* dst = out.ptr<float>(2 * r);
        for (int c = 0; c < cols; ++c) {
            dst[2 * c] = src[c];
        }
    }

    // Vertical sweep: odd rows, even columns
    for (int r = 1; r < out_rows; r += 2) {
        const float* above = out.ptr<float>(r - 1);
        // Edge row replicates its single neighbor
        const float* below = (r + 1 < out_rows) ? out.ptr<float>(r + 1) : above;
        float* dst = out.ptr<float>(r);
        for (int c = 0; c < out_cols; c += 2) {
            dst[c] = (above[c] + below[c]) / 2.0f;
        }
    }

    // Horizontal sweep: odd columns of every row
    for (int r = 0; r < out_rows; ++r) {
        float* row = out.ptr<float>(r);
        for (int c = 1; c < out_cols; c += 2) {
            const float right = (c + 1 < out_cols) ? row[c + 1] : row[c - 1];
            row[c] = (row[c - 1] + right) / 2.0f;
        }
    }
}

std::string SpatialInterpolator::modeToString(InterpolationMode mode) {
    return mode == InterpolationMode::NONE ? "none" : "bilinear";
}

InterpolationMode SpatialInterpolator::modeFromString(const std::string& name) {
    if (name == "none") return InterpolationMode::NONE;
    if (name == "bilinear") return InterpolationMode::BILINEAR_ONE_PASS;
    throw std::invalid_argument("Unknown interpolation mode: " + name);
}
