#include "opencv_io.hpp"
#include <iostream>

void bgr_to_packed(const cv::Mat &bgr, PixelFormat format, cv::Mat &packed) {
    packed.create(bgr.rows, bgr.cols, CV_16U);
    for (int r = 0; r < bgr.rows; ++r) {
        const cv::Vec3b *src = bgr.ptr<cv::Vec3b>(r);
        uint16_t *dst = packed.ptr<uint16_t>(r);
        for (int c = 0; c < bgr.cols; ++c) {
            dst[c] = pack_pixel(src[c][2], src[c][1], src[c][0], format);
        }
    }
}

void packed_to_bgr(const cv::Mat &packed, PixelFormat format, cv::Mat &bgr) {
    bgr.create(packed.rows, packed.cols, CV_8UC3);
    for (int r = 0; r < packed.rows; ++r) {
        const uint16_t *src = packed.ptr<uint16_t>(r);
        cv::Vec3b *dst = bgr.ptr<cv::Vec3b>(r);
        for (int c = 0; c < packed.cols; ++c) {
            unpack_pixel(src[c], format, dst[c][2], dst[c][1], dst[c][0]);
        }
    }
}

VideoCaptureCameraSource::VideoCaptureCameraSource(cv::Size frame_size, PixelFormat format)
    : m_frame_size(frame_size), m_format(format) {}

bool VideoCaptureCameraSource::open(int device_index) {
    if (!m_capture.open(device_index)) {
        std::cerr << "Failed to open video device: " << device_index << "\n";
        return false;
    }

    // Ask for the display size; the driver may pick something else
    m_capture.set(cv::CAP_PROP_FRAME_WIDTH, m_frame_size.width);
    m_capture.set(cv::CAP_PROP_FRAME_HEIGHT, m_frame_size.height);

    std::cout << "Video device " << device_index << " opened at "
              << m_capture.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << m_capture.get(cv::CAP_PROP_FRAME_HEIGHT) << "\n";
    return true;
}

bool VideoCaptureCameraSource::capture_frame(cv::Mat &frame) {
    if (!m_capture.read(m_bgr) || m_bgr.empty()) {
        std::cerr << "Failed to read camera frame\n";
        return false;
    }

    if (m_bgr.size() != m_frame_size) {
        cv::resize(m_bgr, m_resized, m_frame_size, 0, 0, cv::INTER_AREA);
        bgr_to_packed(m_resized, m_format, frame);
    } else {
        bgr_to_packed(m_bgr, m_format, frame);
    }
    return true;
}

StillImageCameraSource::StillImageCameraSource(cv::Size frame_size, PixelFormat format)
    : m_frame_size(frame_size), m_format(format) {}

bool StillImageCameraSource::load(const std::string &path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "Failed to load background image: " << path << "\n";
        return false;
    }

    cv::Mat resized;
    cv::resize(image, resized, m_frame_size, 0, 0, cv::INTER_AREA);
    bgr_to_packed(resized, m_format, m_packed);

    std::cout << "Loaded background image " << path << " (" << image.cols << "x"
              << image.rows << ")\n";
    return true;
}

bool StillImageCameraSource::capture_frame(cv::Mat &frame) {
    if (m_packed.empty()) {
        std::cerr << "No background image loaded\n";
        return false;
    }
    m_packed.copyTo(frame);
    return true;
}

OpenCvWindowSink::OpenCvWindowSink(const std::string &window_name, PixelFormat format, int scale)
    : m_window_name(window_name), m_format(format), m_scale(scale < 1 ? 1 : scale) {
    cv::namedWindow(m_window_name, cv::WINDOW_AUTOSIZE);
}

OpenCvWindowSink::~OpenCvWindowSink() {
    cv::destroyWindow(m_window_name);
}

bool OpenCvWindowSink::present(const cv::Mat &framebuffer) {
    packed_to_bgr(framebuffer, m_format, m_bgr);

    if (m_scale > 1) {
        // Nearest keeps the stride dots crisp
        cv::resize(m_bgr, m_scaled, cv::Size(), m_scale, m_scale, cv::INTER_NEAREST);
        cv::imshow(m_window_name, m_scaled);
    } else {
        cv::imshow(m_window_name, m_bgr);
    }

    int key = cv::waitKey(1) & 0xFF;
    return !(key == 'q' || key == 27);
}
