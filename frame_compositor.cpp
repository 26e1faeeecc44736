#include "frame_compositor.hpp"
#include "opencv_io.hpp"
#include <sstream>
#include <stdexcept>

AxisTransform AxisTransform::fromString(const std::string& text) {
    AxisTransform transform;
    std::stringstream ss(text);
    std::string flag;
    while (std::getline(ss, flag, ',')) {
        if (flag == "swap") transform.swap_axes = true;
        else if (flag == "flip-rows") transform.flip_rows = true;
        else if (flag == "flip-cols") transform.flip_cols = true;
        else if (flag == "identity" || flag.empty()) continue;
        else throw std::invalid_argument("Unknown axis transform flag: " + flag);
    }
    return transform;
}

std::string AxisTransform::toString() const {
    std::string text;
    if (swap_axes) text += "swap,";
    if (flip_rows) text += "flip-rows,";
    if (flip_cols) text += "flip-cols,";
    if (text.empty()) return "identity";
    text.pop_back();
    return text;
}

FrameCompositor::FrameCompositor(CompositeMode mode, const OverlayGeometry& geometry, cv::Size grid_size)
    : mode_(mode), geometry_(geometry), grid_size_(grid_size) {
    if (geometry_.output_size.width <= 0 || geometry_.output_size.height <= 0) {
        throw std::invalid_argument("Output size must be positive");
    }
    if (grid_size_.width <= 0 || grid_size_.height <= 0) {
        throw std::invalid_argument("Thermal grid size must be positive");
    }
    if (geometry_.stride < 1) {
        throw std::invalid_argument("Stride must be at least 1");
    }
    if (!(geometry_.alpha >= 0.0f && geometry_.alpha <= 1.0f)) {
        throw std::invalid_argument("Alpha must be in [0, 1]");
    }

    const cv::Rect full(cv::Point(0, 0), geometry_.output_size);
    if (geometry_.region.area() == 0) {
        geometry_.region = full;
    }
    geometry_.region &= full;
    if (geometry_.region.area() == 0) {
        throw std::invalid_argument("Overlay region does not intersect the output");
    }

    overlay_.create(geometry_.output_size, CV_16U);
    mask_.create(geometry_.output_size, CV_8U);
    visible_bgr_.create(geometry_.output_size, CV_8UC3);
    overlay_bgr_.create(geometry_.output_size, CV_8UC3);
    blended_bgr_.create(geometry_.output_size, CV_8UC3);
    blended_.create(geometry_.output_size, CV_16U);
    buildCellLookup();
}

void FrameCompositor::buildCellLookup() {
    const cv::Rect& region = geometry_.region;
    const AxisTransform& t = geometry_.transform;
    const int grid_rows = grid_size_.height;
    const int grid_cols = grid_size_.width;

    // Number of grid cells along the display's x and y axes
    const int cells_x = t.swap_axes ? grid_rows : grid_cols;
    const int cells_y = t.swap_axes ? grid_cols : grid_rows;

    cell_lut_.create(geometry_.output_size, CV_32S);
    cell_lut_.setTo(-1);

    for (int y = region.y; y < region.y + region.height; ++y) {
        int* lut = cell_lut_.ptr<int>(y);
        const int v = (y - region.y) * cells_y / region.height;
        for (int x = region.x; x < region.x + region.width; ++x) {
            const int u = (x - region.x) * cells_x / region.width;

            int row = t.swap_axes ? u : v;
            int col = t.swap_axes ? v : u;
            if (t.flip_rows) row = grid_rows - 1 - row;
            if (t.flip_cols) col = grid_cols - 1 - col;

            lut[x] = row * grid_cols + col;
        }
    }
}

void FrameCompositor::composite(const cv::Mat& visible, const cv::Mat& indices,
                                const ThermalPalette& palette, cv::Mat& output) {
    if (indices.size() != grid_size_ || indices.type() != CV_16U) {
        throw std::invalid_argument("Color index grid does not match the compositor grid");
    }
    double max_index = 0;
    cv::minMaxLoc(indices, nullptr, &max_index);
    if (max_index >= static_cast<double>(palette.size())) {
        throw std::invalid_argument("Color index grid holds indices beyond the palette");
    }
    output.create(geometry_.output_size, CV_16U);

    blitVisible(visible, output);

    if (mode_ == CompositeMode::STRIDE_OVERWRITE) {
        overwriteAtStride(indices, palette, output);
    } else {
        alphaBlend(indices, palette, output);
    }
}

void FrameCompositor::blitVisible(const cv::Mat& visible, cv::Mat& output) const {
    if (visible.size() == output.size()) {
        visible.copyTo(output);
        return;
    }

    // Camera image smaller or larger than the display: place it at the
    // offset and clip, the rest stays black.
    output.setTo(0);
    const cv::Rect full(cv::Point(0, 0), output.size());
    const cv::Rect target = cv::Rect(geometry_.visible_offset, visible.size()) & full;
    if (target.area() == 0) {
        return;
    }
    const cv::Rect source(target.tl() - geometry_.visible_offset, target.size());
    visible(source).copyTo(output(target));
}

void FrameCompositor::overwriteAtStride(const cv::Mat& indices, const ThermalPalette& palette,
                                        cv::Mat& output) const {
    const int stride = geometry_.stride;
    const int grid_cols = grid_size_.width;
    const uint16_t* lookup = palette.packedData();

    for (int y = 0; y < output.rows; y += stride) {
        const int* lut = cell_lut_.ptr<int>(y);
        uint16_t* dst = output.ptr<uint16_t>(y);
        for (int x = 0; x < output.cols; x += stride) {
            const int cell = lut[x];
            if (cell < 0) {
                continue;
            }
            dst[x] = lookup[indices.at<uint16_t>(cell / grid_cols, cell % grid_cols)];
        }
    }
}

void FrameCompositor::alphaBlend(const cv::Mat& indices, const ThermalPalette& palette,
                                 cv::Mat& output) {
    const int grid_cols = grid_size_.width;
    const uint16_t* lookup = palette.packedData();

    // Nearest-neighbor expansion of the grid to display resolution. The mask
    // marks pixels with thermal data; the rest keep the camera image.
    for (int y = 0; y < overlay_.rows; ++y) {
        const int* lut = cell_lut_.ptr<int>(y);
        uint16_t* dst = overlay_.ptr<uint16_t>(y);
        uchar* covered = mask_.ptr<uchar>(y);
        for (int x = 0; x < overlay_.cols; ++x) {
            const int cell = lut[x];
            const uint16_t index = cell < 0 ? ThermalPalette::TRANSPARENT_INDEX
                                            : indices.at<uint16_t>(cell / grid_cols, cell % grid_cols);
            covered[x] = index == ThermalPalette::TRANSPARENT_INDEX ? 0 : 255;
            dst[x] = lookup[index];
        }
    }

    const PixelFormat format = palette.format();
    const double alpha = geometry_.alpha;

    packed_to_bgr(output, format, visible_bgr_);
    packed_to_bgr(overlay_, format, overlay_bgr_);
    cv::addWeighted(visible_bgr_, 1.0 - alpha, overlay_bgr_, alpha, 0.0, blended_bgr_);
    bgr_to_packed(blended_bgr_, format, blended_);
    blended_.copyTo(output, mask_);
}

std::string FrameCompositor::modeToString(CompositeMode mode) {
    return mode == CompositeMode::ALPHA_BLEND ? "blend" : "stride";
}

CompositeMode FrameCompositor::modeFromString(const std::string& name) {
    if (name == "stride") return CompositeMode::STRIDE_OVERWRITE;
    if (name == "blend") return CompositeMode::ALPHA_BLEND;
    throw std::invalid_argument("Unknown composite mode: " + name);
}
