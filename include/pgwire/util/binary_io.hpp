#ifndef PGWIRE_UTIL_BINARY_IO_HPP
#define PGWIRE_UTIL_BINARY_IO_HPP

#include <cstdint>
#include <string_view>
#include <vector>

namespace pgwire::util {
/*
    buffer helpers for the wire protocol.
    all multi byte integers are big-endian (network byte order).
    strings are C strings on the wire: raw bytes then a single 0 terminator, no length prefix.
*/

inline void write_uint16_be(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void write_uint32_be(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));  // most significant byte
    buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(value & 0xFF));  // least significant byte
    /*
        example: value = 0x12345678
        buf: [0x12, 0x34, 0x56, 0x78]
    */
}

inline void write_cstring(std::vector<uint8_t>& buf, std::string_view s) {
    buf.insert(buf.end(), s.begin(), s.end());
    buf.push_back(0);
}

inline uint16_t read_uint16_be(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline uint32_t read_uint32_be(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

inline int32_t read_int32_be(const uint8_t* data) {
    return static_cast<int32_t>(read_uint32_be(data));
}

}  // namespace pgwire::util

#endif
