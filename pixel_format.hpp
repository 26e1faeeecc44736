#ifndef PIXEL_FORMAT_HPP
#define PIXEL_FORMAT_HPP

#include <cstdint>
#include <string>

// Packed 16-bit encodings the display bus accepts.
enum class PixelFormat {
    RGB565,         // RRRRRGGG GGGBBBBB, host order
    RGB565_SWAPPED  // Same bits with the two bytes exchanged (big-endian bus)
};

inline uint16_t swap_bytes(uint16_t value) {
    return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline uint16_t pack_rgb565(uint8_t red, uint8_t green, uint8_t blue) {
    return static_cast<uint16_t>(((red >> 3) << 11) | ((green >> 2) << 5) | (blue >> 3));
}

inline uint16_t pack_pixel(uint8_t red, uint8_t green, uint8_t blue, PixelFormat format) {
    uint16_t packed = pack_rgb565(red, green, blue);
    return format == PixelFormat::RGB565_SWAPPED ? swap_bytes(packed) : packed;
}

// Expands a packed pixel back to 8 bits per channel. Low bits are
// replicated so that full white stays 255.
inline void unpack_pixel(uint16_t pixel, PixelFormat format,
                         uint8_t &red, uint8_t &green, uint8_t &blue) {
    if (format == PixelFormat::RGB565_SWAPPED) {
        pixel = swap_bytes(pixel);
    }
    const uint8_t r5 = (pixel >> 11) & 0x1F;
    const uint8_t g6 = (pixel >> 5) & 0x3F;
    const uint8_t b5 = pixel & 0x1F;
    red = static_cast<uint8_t>((r5 << 3) | (r5 >> 2));
    green = static_cast<uint8_t>((g6 << 2) | (g6 >> 4));
    blue = static_cast<uint8_t>((b5 << 3) | (b5 >> 2));
}

inline std::string pixel_format_name(PixelFormat format) {
    return format == PixelFormat::RGB565_SWAPPED ? "RGB565_SWAPPED" : "RGB565";
}

#endif // PIXEL_FORMAT_HPP
