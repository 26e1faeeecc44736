#ifndef SERIAL_SENSOR_SOURCE_HPP
#define SERIAL_SENSOR_SOURCE_HPP

#include <string>
#include <cstdint>
#include <libserialport.h>
#include "overlay_io.hpp"

/**
 * Reads an 8x8 AMG88xx grid from a bridge microcontroller on a serial port.
 *
 * The bridge prints one text line per frame holding rows*cols temperatures
 * in Celsius, row-major, separated by commas and/or whitespace and
 * optionally wrapped in brackets:
 *
 *   [22.25, 22.50, 23.00, ... ]\n
 */
class SerialSensorSource : public SensorSource
{
public:
    SerialSensorSource(uint16_t rows = DEFAULT_ROWS, uint16_t cols = DEFAULT_COLS);
    ~SerialSensorSource() override;

    SerialSensorSource(const SerialSensorSource &) = delete;
    SerialSensorSource &operator=(const SerialSensorSource &) = delete;

    bool open_port(const std::string &port_path, int baud_rate = BAUD_RATE);
    void close_port();
    bool is_open() const { return port != nullptr; }

    int rows() const override { return m_rows; }
    int cols() const override { return m_cols; }
    bool read_frame(cv::Mat &frame) override;

    // Parses one frame line into a pre-allocated CV_32F grid. Returns false
    // unless the line holds exactly frame.total() numbers.
    static bool parse_frame_line(const std::string &line, cv::Mat &frame);

    static void list_available_ports();

protected:
    // Adds received bytes to the line buffer and parses every completed
    // line. Returns true once at least one line ended. The buffer never
    // holds more than MAX_BUFFER_SIZE bytes without a line break.
    bool append_bytes(const char *data, size_t length);
    size_t buffered_bytes() const { return m_buffer.size(); }
    const cv::Mat &last_frame() const { return m_last_frame; }

    static constexpr size_t MAX_BUFFER_SIZE = 8192;

private:
    // --- Configuration ---
    static constexpr int BAUD_RATE = 115200;
    static constexpr int TIMEOUT_MILLISECONDS = 2000;
    static constexpr int POLL_DELAY_MS = 2;
    static constexpr int MAX_CONSECUTIVE_ERRORS = 10;
    static constexpr uint16_t DEFAULT_ROWS = 8;
    static constexpr uint16_t DEFAULT_COLS = 8;

    bool consume_lines();

    uint16_t m_rows;
    uint16_t m_cols;
    std::string m_buffer;       // Bytes received, not yet split into lines
    cv::Mat m_parsed;           // Scratch grid for the line being parsed
    cv::Mat m_last_frame;       // Last good frame, returned on a bad read
    int m_consecutive_errors;

    struct sp_port *port;       // Serial port handle
};

#endif // SERIAL_SENSOR_SOURCE_HPP
