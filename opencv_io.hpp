#ifndef OPENCV_IO_HPP
#define OPENCV_IO_HPP

#include <string>
#include <opencv2/opencv.hpp>
#include "overlay_io.hpp"
#include "pixel_format.hpp"

// Conversions between OpenCV BGR images (CV_8UC3) and packed framebuffers (CV_16U)
void bgr_to_packed(const cv::Mat &bgr, PixelFormat format, cv::Mat &packed);
void packed_to_bgr(const cv::Mat &packed, PixelFormat format, cv::Mat &bgr);

// Live camera through cv::VideoCapture, scaled to the framebuffer size.
class VideoCaptureCameraSource : public CameraSource {
public:
    VideoCaptureCameraSource(cv::Size frame_size, PixelFormat format);

    bool open(int device_index);
    bool capture_frame(cv::Mat &frame) override;

private:
    cv::VideoCapture m_capture;
    cv::Size m_frame_size;
    PixelFormat m_format;
    cv::Mat m_bgr;
    cv::Mat m_resized;
};

// A fixed background picture loaded from disk.
class StillImageCameraSource : public CameraSource {
public:
    StillImageCameraSource(cv::Size frame_size, PixelFormat format);

    bool load(const std::string &path);
    bool capture_frame(cv::Mat &frame) override;

private:
    cv::Size m_frame_size;
    PixelFormat m_format;
    cv::Mat m_packed;
};

// Desktop window standing in for the device display. Closing is requested
// with 'q' or ESC.
class OpenCvWindowSink : public DisplaySink {
public:
    OpenCvWindowSink(const std::string &window_name, PixelFormat format, int scale = 2);
    ~OpenCvWindowSink() override;

    bool present(const cv::Mat &framebuffer) override;

private:
    std::string m_window_name;
    PixelFormat m_format;
    int m_scale;
    cv::Mat m_bgr;
    cv::Mat m_scaled;
};

#endif // OPENCV_IO_HPP
