#include "serial_sensor_source.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

SerialSensorSource::SerialSensorSource(uint16_t rows, uint16_t cols)
    : m_rows(rows), m_cols(cols),
      m_parsed(rows, cols, CV_32F, cv::Scalar(0)),
      m_last_frame(rows, cols, CV_32F, cv::Scalar(0)),
      m_consecutive_errors(0), port(nullptr) {
  m_buffer.reserve(MAX_BUFFER_SIZE);
}

SerialSensorSource::~SerialSensorSource() { close_port(); }

bool SerialSensorSource::open_port(const std::string &port_path, int baud_rate) {
  std::cout << "Attempting to connect to sensor bridge: " << port_path << " at "
            << baud_rate << " baud...\n";

  enum sp_return result = sp_get_port_by_name(port_path.c_str(), &port);
  if (result != SP_OK) {
    std::cerr << "\n--- ERROR ---\n";
    std::cerr << "Could not find serial port " << port_path << ".\n";
    port = nullptr;
    list_available_ports();
    return false;
  }

  result = sp_open(port, SP_MODE_READ);
  if (result != SP_OK) {
    std::cerr << "\n--- ERROR ---\n";
    std::cerr << "Could not open serial port " << port_path << ".\n";
    std::cerr << "Make sure the device is connected and you have permission.\n";
    std::cerr << "Details: " << sp_last_error_message() << "\n";
    sp_free_port(port);
    port = nullptr;
    list_available_ports();
    return false;
  }

  sp_set_baudrate(port, baud_rate);
  sp_set_bits(port, 8);
  sp_set_parity(port, SP_PARITY_NONE);
  sp_set_stopbits(port, 1);
  sp_set_flowcontrol(port, SP_FLOWCONTROL_NONE);

  // Drop whatever the bridge printed before we were listening
  sp_flush(port, SP_BUF_INPUT);
  m_buffer.clear();
  m_consecutive_errors = 0;

  std::cout << "Successfully opened port.\n";
  return true;
}

void SerialSensorSource::close_port() {
  if (port != nullptr) {
    sp_close(port);
    sp_free_port(port);
    port = nullptr;
    std::cout << "\nSerial port closed.\n";
  }
}

void SerialSensorSource::list_available_ports() {
  std::cout << "\nAvailable ports:\n";
  struct sp_port **port_list;
  int error = sp_list_ports(&port_list);
  if (error == SP_OK) {
    if (*port_list == NULL) {
      std::cout << "  No serial ports found.\n";
      sp_free_port_list(port_list);
      return;
    }
    for (int i = 0; port_list[i] != NULL; i++) {
      const char *description = sp_get_port_description(port_list[i]);
      std::cout << "  " << sp_get_port_name(port_list[i]) << ": "
                << (description ? description : "") << "\n";
    }
    sp_free_port_list(port_list);
  } else {
    std::cerr << "  Error listing ports: " << sp_last_error_message() << "\n";
  }
}

bool SerialSensorSource::parse_frame_line(const std::string &line, cv::Mat &frame) {
  const size_t expected = frame.total();
  float *out = frame.ptr<float>(0);
  size_t count = 0;

  const char *cursor = line.c_str();
  while (*cursor != '\0') {
    // Separators and framing
    if (*cursor == ',' || *cursor == '[' || *cursor == ']' ||
        std::strchr(" \t\r", *cursor) != nullptr) {
      ++cursor;
      continue;
    }

    char *end = nullptr;
    const float value = std::strtof(cursor, &end);
    if (end == cursor) {
      return false;
    }
    if (count >= expected) {
      return false;
    }
    out[count++] = value;
    cursor = end;
  }

  return count == expected;
}

/**
 * @brief Splits the receive buffer into lines and parses each one.
 * @return true if at least one line parsed into a frame.
 */
bool SerialSensorSource::consume_lines() {
  bool got_frame = false;
  size_t newline = m_buffer.find('\n');

  while (newline != std::string::npos) {
    const std::string line = m_buffer.substr(0, newline);
    m_buffer.erase(0, newline + 1);

    if (line.find_first_not_of(" \t\r") != std::string::npos) {
      if (parse_frame_line(line, m_parsed)) {
        m_parsed.copyTo(m_last_frame);
        m_consecutive_errors = 0;
        got_frame = true;
      } else {
        m_consecutive_errors++;
        if (m_consecutive_errors >= MAX_CONSECUTIVE_ERRORS) {
          std::cerr << "WARNING: " << m_consecutive_errors
                    << " consecutive unreadable sensor lines, last: '" << line
                    << "'\n";
          m_consecutive_errors = 0;
        }
      }
    }
    newline = m_buffer.find('\n');
  }
  return got_frame;
}

bool SerialSensorSource::append_bytes(const char *data, size_t length) {
  m_buffer.append(data, length);

  bool complete_line = false;
  if (m_buffer.find('\n') != std::string::npos) {
    consume_lines();
    complete_line = true;
  }

  // A line this long is not coming from the bridge
  if (m_buffer.size() > MAX_BUFFER_SIZE) {
    std::cerr << "WARNING: Discarding " << m_buffer.size()
              << " bytes without a line break\n";
    m_buffer.clear();
  }
  return complete_line;
}

bool SerialSensorSource::read_frame(cv::Mat &frame) {
  if (!is_open()) {
    std::cerr << "\n--- ERROR ---\n";
    std::cerr << "Serial port is not open. Call open_port() first.\n";
    return false;
  }

  char buffer[512];
  const auto start_time = std::chrono::steady_clock::now();
  bool got_data = false;

  while (std::chrono::steady_clock::now() - start_time <
         std::chrono::milliseconds(TIMEOUT_MILLISECONDS)) {
    int bytes_read = sp_nonblocking_read(port, buffer, sizeof(buffer));
    if (bytes_read < 0) {
      std::cerr << "ERROR: Serial read failed: " << sp_last_error_message() << "\n";
      return false;
    }
    if (bytes_read > 0) {
      got_data = true;
      if (append_bytes(buffer, static_cast<size_t>(bytes_read))) {
        // Stale frame on a bad line, fresh one otherwise
        m_last_frame.copyTo(frame);
        return true;
      }
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(POLL_DELAY_MS));
  }

  if (!got_data) {
    std::cout << "\nNo data received from sensor bridge for "
              << TIMEOUT_MILLISECONDS << " ms.\n";
    return false;
  }

  // Bytes arrived but never a full line
  m_last_frame.copyTo(frame);
  return true;
}
