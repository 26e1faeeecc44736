#ifndef FRAME_COMPOSITOR_HPP
#define FRAME_COMPOSITOR_HPP

#include <string>
#include <opencv2/opencv.hpp>
#include "thermal_palette.hpp"

enum class CompositeMode {
    STRIDE_OVERWRITE,   // Thermal color on every Nth pixel of the camera image
    ALPHA_BLEND         // Thermal color mixed into every covered pixel
};

// Maps display cells onto sensor cells to correct for how the sensor is
// mounted relative to the display. Applied in this order: swap, then flips.
struct AxisTransform {
    bool swap_axes = false;
    bool flip_rows = false;
    bool flip_cols = false;

    // Comma separated flags: "swap", "flip-rows", "flip-cols" or "identity"
    static AxisTransform fromString(const std::string& text);
    std::string toString() const;
};

struct OverlayGeometry {
    cv::Size output_size{240, 240};
    // Part of the output covered by the thermal grid; empty = whole output
    cv::Rect region;
    // Top-left of the camera image when it is not output-sized
    cv::Point visible_offset{0, 0};
    int stride = 4;
    float alpha = 0.5f;
    AxisTransform transform;
};

// Merges a color index grid (CV_16U) with a camera image (CV_16U packed
// pixels) into an output framebuffer of geometry.output_size.
class FrameCompositor {
public:
    // grid_size is the index grid shape (cols x rows). Throws
    // std::invalid_argument on an unusable geometry.
    FrameCompositor(CompositeMode mode, const OverlayGeometry& geometry, cv::Size grid_size);

    // Throws std::invalid_argument if indices does not match the grid size
    // or holds an index outside the palette.
    void composite(const cv::Mat& visible, const cv::Mat& indices,
                   const ThermalPalette& palette, cv::Mat& output);

    // Grid cell (row * cols + col) shown at an output pixel, -1 outside the region
    int cellAt(int x, int y) const { return cell_lut_.at<int>(y, x); }

    CompositeMode mode() const { return mode_; }
    const OverlayGeometry& geometry() const { return geometry_; }

    static std::string modeToString(CompositeMode mode);
    static CompositeMode modeFromString(const std::string& name);

private:
    void buildCellLookup();
    void blitVisible(const cv::Mat& visible, cv::Mat& output) const;
    void overwriteAtStride(const cv::Mat& indices, const ThermalPalette& palette, cv::Mat& output) const;
    void alphaBlend(const cv::Mat& indices, const ThermalPalette& palette, cv::Mat& output);

    CompositeMode mode_;
    OverlayGeometry geometry_;
    cv::Size grid_size_;
    cv::Mat cell_lut_;  // CV_32S, output sized
    // Alpha blend scratch, output sized
    cv::Mat overlay_;       // CV_16U packed thermal colors
    cv::Mat mask_;          // CV_8U, nonzero where thermal data applies
    cv::Mat visible_bgr_;
    cv::Mat overlay_bgr_;
    cv::Mat blended_bgr_;
    cv::Mat blended_;       // CV_16U
};

#endif // FRAME_COMPOSITOR_HPP
