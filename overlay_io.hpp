#ifndef OVERLAY_IO_HPP
#define OVERLAY_IO_HPP

#include <opencv2/opencv.hpp>

// Device boundary of the overlay pipeline. All calls are synchronous and
// may block for as long as the underlying bus needs.

class SensorSource {
public:
    virtual ~SensorSource() = default;

    virtual int rows() const = 0;
    virtual int cols() const = 0;

    // Fills a rows() x cols() CV_32F grid of temperatures in Celsius.
    // Returns false only when the source is gone; a bad read hands back
    // the previous frame.
    virtual bool read_frame(cv::Mat &frame) = 0;
};

class CameraSource {
public:
    virtual ~CameraSource() = default;

    // Fills a CV_16U image of packed pixels. Returns false on failure.
    virtual bool capture_frame(cv::Mat &frame) = 0;
};

class DisplaySink {
public:
    virtual ~DisplaySink() = default;

    // Shows a CV_16U framebuffer. Returns false when the display asks to stop.
    virtual bool present(const cv::Mat &framebuffer) = 0;
};

#endif // OVERLAY_IO_HPP
