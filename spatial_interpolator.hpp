#ifndef SPATIAL_INTERPOLATOR_HPP
#define SPATIAL_INTERPOLATOR_HPP

#include <string>
#include <opencv2/opencv.hpp>

enum class InterpolationMode {
    NONE,               // Pass-through, grid keeps the sensor resolution
    BILINEAR_ONE_PASS   // One 2x upsampling pass
};

// Upsamples a normalized grid (CV_32F).
//
// BILINEAR_ONE_PASS places the R x C samples at the even positions of a
// (2R-1) x (2C-1) grid, fills odd rows with the average of the rows above
// and below, then fills odd columns from the already filled rows. The two
// 1-D sweeps run in that order on purpose: results must match the sweep
// order bit for bit.
class SpatialInterpolator {
public:
    explicit SpatialInterpolator(InterpolationMode mode = InterpolationMode::BILINEAR_ONE_PASS);

    // Output shape for an input of rows x cols
    cv::Size outputSize(int rows, int cols) const;

    // Writes into a pre-allocated grid of outputSize()
    void interpolate(const cv::Mat& grid, cv::Mat& out) const;

    InterpolationMode mode() const { return mode_; }

    static std::string modeToString(InterpolationMode mode);
    static InterpolationMode modeFromString(const std::string& name);

private:
    InterpolationMode mode_;
};

#endif // SPATIAL_INTERPOLATOR_HPP
