#include "pgwire/util/utf8.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace pgwire::util {

namespace {

bool is_continuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

// byte count of the sequence a lead byte starts, 0 for a byte that cannot lead
std::size_t sequence_length(uint8_t lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

}  // namespace

bool is_valid_utf8(std::string_view text) noexcept {
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());
    const std::size_t size = text.size();
    std::size_t i = 0;

    while (i < size) {
        uint8_t lead = data[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = sequence_length(lead);
        uint32_t code_point = 0;
        uint32_t min_code_point = 0;

        if (len == 2) {
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if (len == 3) {
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if (len == 4) {
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false;  // stray continuation byte or 0xF8..0xFF
        }

        if (i + len > size) {
            return false;
        }

        for (std::size_t k = 1; k < len; ++k) {
            if (!is_continuation(data[i + k])) {
                return false;
            }
            code_point = (code_point << 6) | (data[i + k] & 0x3F);
        }

        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += len;
    }
    return true;
}

char32_t first_code_point(std::string_view text, std::size_t& length) noexcept {
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());
    length = std::min(std::max<std::size_t>(sequence_length(data[0]), 1), text.size());

    static constexpr uint8_t kLeadMask[] = {0x00, 0x7F, 0x1F, 0x0F, 0x07};
    char32_t code_point = data[0] & kLeadMask[length];
    for (std::size_t k = 1; k < length; ++k) {
        code_point = (code_point << 6) | (data[k] & 0x3F);
    }
    return code_point;
}

}  // namespace pgwire::util
